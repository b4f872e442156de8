#pragma once

/**
 * @file realtime_link.h
 * @brief PeerLink over the realtime WebSocket endpoint (libcurl)
 */

#include "config.h"
#include "peer_link.h"
#include <memory>

namespace job_diary {
namespace net {

/**
 * @brief Offer/answer and event channel on one WebSocket connection
 *
 * negotiate() connects on a worker thread, authenticates with the session
 * credential and sends the offer (a session.update event). The peer's
 * session.updated reply is the answer; every later frame is a channel
 * message. Outbound messages are queued and written by the same thread.
 *
 * After release() no callback is invoked. The worker finishes on its own.
 */
class RealtimeLink : public PeerLink {
public:
    explicit RealtimeLink(const PeerConfig& config);
    ~RealtimeLink() override;

    RealtimeLink(const RealtimeLink&) = delete;
    RealtimeLink& operator=(const RealtimeLink&) = delete;

    void negotiate(const SessionCredential& credential, const std::string& offer,
                   PeerLinkCallbacks callbacks) override;
    bool send(const std::string& message) override;
    void close_channel() override;
    void release() override;

    struct State;

private:
    PeerConfig config_;
    std::shared_ptr<State> state_;
};

PeerLinkFactory make_realtime_link_factory(const PeerConfig& config);

} // namespace net
} // namespace job_diary
