#include "audio/portaudio_source.h"
#include "config.h"
#include "logger.h"
#include <portaudio.h>
#include <atomic>
#include <mutex>
#include <sstream>

namespace job_diary {
namespace audio {

class PortAudioSource::Impl {
public:
    explicit Impl(const AudioConfig& config)
        : device_(config.input_device),
          sample_rate_(config.sample_rate),
          frame_samples_(static_cast<unsigned long>(config.sample_rate * config.frame_ms / 1000)) {}

    ~Impl() {
        close();
    }

    Result<void> open(AudioFrameCallback on_frame) {
        if (stream_) {
            return make_error(ErrorType::InvalidState, "microphone already open");
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_error(ErrorType::PermissionDenied,
                              std::string("PortAudio init error: ") + Pa_GetErrorText(err));
        }

        int device_idx = find_input_device(device_);
        if (device_idx < 0) {
            Pa_Terminate();
            return make_error(ErrorType::PermissionDenied, "input device not found: " + device_);
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device_idx);

        std::ostringstream oss;
        oss << "Using input device: [" << device_idx << "] " << info->name
            << " @ " << sample_rate_ << " Hz";
        LOG_AUDIO(oss.str());

        PaStreamParameters input_params;
        input_params.device = device_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            on_frame_ = std::move(on_frame);
        }

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate_,
                            frame_samples_, paClipOff, input_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            Pa_Terminate();
            return make_error(ErrorType::PermissionDenied,
                              std::string("failed to open input stream: ") + Pa_GetErrorText(err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::string detail = Pa_GetErrorText(err);
            if (err == paUnanticipatedHostError) {
                detail += " (check the system microphone privacy settings)";
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            return make_error(ErrorType::PermissionDenied, "failed to start input stream: " + detail);
        }

        open_ = true;
        return Result<void>();
    }

    void close() {
        if (!stream_) return;
        open_ = false;
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            on_frame_ = nullptr;
        }
        Pa_Terminate();
        LOG_AUDIO("Input stream closed");
    }

    bool is_open() const { return open_; }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        int default_idx = Pa_GetDefaultInputDevice();
        Logger::info("Available input devices:");
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || info->maxInputChannels <= 0) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name << " (IN:" << info->maxInputChannels << ")";
            if (i == default_idx) oss << " *default";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    /// "default", a numeric index, or an exact device name
    static int find_input_device(const std::string& name) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = Pa_GetDefaultInputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        try {
            size_t consumed = 0;
            int device_idx = std::stoi(name, &consumed);
            if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
                const PaDeviceInfo* info = Pa_GetDeviceInfo(device_idx);
                if (info && info->maxInputChannels > 0) return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number; fall through to name matching
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->maxInputChannels > 0 && name == info->name) return i;
        }
        return -1;
    }

    static int input_callback(const void* input, void* /*output*/,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* /*time_info*/,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) return paContinue;
        if (status_flags & paInputOverflow) {
            LOG_AUDIO("Input overflow");
        }

        const Sample* in = static_cast<const Sample*>(input);
        AudioFrame frame(in, in + frame_count);

        std::lock_guard<std::mutex> lock(self->callback_mutex_);
        if (self->on_frame_) self->on_frame_(frame);
        return paContinue;
    }

    std::string device_;
    int sample_rate_;
    unsigned long frame_samples_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> open_{false};
    std::mutex callback_mutex_;
    AudioFrameCallback on_frame_;
};

PortAudioSource::PortAudioSource(const AudioConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

PortAudioSource::~PortAudioSource() = default;

Result<void> PortAudioSource::open(AudioFrameCallback on_frame) {
    return pimpl_->open(std::move(on_frame));
}

void PortAudioSource::close() {
    pimpl_->close();
}

bool PortAudioSource::is_open() const {
    return pimpl_->is_open();
}

void PortAudioSource::list_devices() {
    Impl::list_devices();
}

} // namespace audio
} // namespace job_diary
