#pragma once

#include "common.h"
#include "errors.h"

namespace job_diary {

/**
 * @brief Microphone capture
 *
 * Frames are delivered on the capture thread. Open failures (no device,
 * permission denied) are reported as PermissionDenied.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual Result<void> open(AudioFrameCallback on_frame) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

} // namespace job_diary
