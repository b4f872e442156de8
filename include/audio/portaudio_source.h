#pragma once

#include "audio/audio_source.h"
#include <memory>
#include <string>

namespace job_diary {

struct AudioConfig;

namespace audio {

/**
 * @brief Microphone capture using PortAudio
 *
 * Opens a mono int16 input stream and hands fixed-size frames to the
 * callback from PortAudio's thread. The callback must not block.
 */
class PortAudioSource : public AudioSource {
public:
    explicit PortAudioSource(const AudioConfig& config);
    ~PortAudioSource() override;

    // Non-copyable
    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    /**
     * @brief Open the configured input device and start streaming
     * @return PermissionDenied when the device is missing or refuses to start
     */
    Result<void> open(AudioFrameCallback on_frame) override;
    void close() override;
    bool is_open() const override;

    /**
     * @brief List input-capable devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace audio
} // namespace job_diary
