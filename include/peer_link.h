#pragma once

#include "common.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <string>

namespace job_diary {

/**
 * @brief Callbacks a PeerLink reports through
 *
 * May be invoked from any thread. The transport marshals each one onto the
 * event loop and stamps it with the generation that created the link.
 */
struct PeerLinkCallbacks {
    /// Remote answer to the offer, or the reason negotiation failed
    std::function<void(Result<std::string> answer)> on_answer;
    /// One message from the ordered event channel
    std::function<void(const std::string& message)> on_message;
    /// Channel broke after the answer
    std::function<void(const Error& error)> on_failure;
    /// Channel closed by the peer
    std::function<void()> on_closed;
};

/**
 * @brief Offer/answer handshake plus an ordered, reliable event channel
 */
class PeerLink {
public:
    virtual ~PeerLink() = default;

    /**
     * @brief Start the handshake
     * @param credential Single-use secret authorizing this link
     * @param offer Local session description
     */
    virtual void negotiate(const SessionCredential& credential, const std::string& offer,
                           PeerLinkCallbacks callbacks) = 0;

    /// Queue a message on the event channel; false when the channel is not open
    virtual bool send(const std::string& message) = 0;

    /// Close the event channel (no further callbacks expected)
    virtual void close_channel() = 0;

    /// Release the negotiation handle and any network resources
    virtual void release() = 0;
};

using PeerLinkFactory = std::function<std::unique_ptr<PeerLink>()>;

} // namespace job_diary
