#pragma once

#include "errors.h"
#include <functional>
#include <string>

namespace job_diary {

/**
 * @brief Trusted collaborator that mints short-lived session credentials
 *
 * Holds the long-lived key; this process never sees it. The response body is
 * handed back raw because its shape has changed across service versions.
 */
class TokenService {
public:
    /// Invoked on the event loop thread, exactly once per issue()
    using Callback = std::function<void(Result<std::string> body)>;

    virtual ~TokenService() = default;

    virtual void issue(const std::string& hint, Callback on_done) = 0;
};

} // namespace job_diary
