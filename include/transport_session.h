#pragma once

/**
 * @file transport_session.h
 * @brief Audio capture + peer event channel with generation-stamped lifecycle
 */

#include "audio/audio_source.h"
#include "common.h"
#include "config.h"
#include "errors.h"
#include "peer_link.h"
#include <functional>
#include <memory>
#include <string>

namespace job_diary {

class EventLoop;

/**
 * Idle -> Negotiating -> Active -> Closing -> Closed.
 * Failed is entered from Negotiating or Active and always continues to Closed.
 * A closed session can negotiate again under a new generation.
 */
enum class TransportState {
    Idle,
    Negotiating,
    Active,
    Closing,
    Closed,
    Failed
};

const char* transport_state_name(TransportState state);

enum class TransportEventType {
    Connected,       ///< Remote answer applied; audio flowing
    UtteranceFinal,  ///< Finalized transcript (user or assistant)
    UtteranceDelta,  ///< Streamed assistant partial
    PeerError,       ///< Peer sent an error; the session closes after it
    IdleTimeout,     ///< No user speech since the peer's last response
    Failed,          ///< Negotiation or channel failure; the session closes after it
    Closed
};

const char* transport_event_name(TransportEventType type);

struct TransportEvent {
    TransportEventType type = TransportEventType::Closed;
    std::string text;
    Role role = Role::User;
    SessionGeneration generation = 0;
    Error error;
};

using TransportEventHandler = std::function<void(const TransportEvent&)>;

/**
 * @brief Owns the microphone stream, the peer link and the generation counter
 *
 * Every callback from the link, the audio thread and the timers is posted to
 * the event loop tagged with the generation current when it was created, and
 * dropped unless that generation is still current. close() advances the
 * generation before releasing anything, so a late callback from a torn-down
 * session can never act on its successor.
 *
 * All methods must be called on the event loop thread.
 */
class TransportSession {
public:
    TransportSession(EventLoop& loop,
                     std::unique_ptr<AudioSource> audio,
                     PeerLinkFactory link_factory,
                     const PeerConfig& peer,
                     const SessionConfig& session);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    /// Single receiver of transport events
    void set_event_handler(TransportEventHandler handler);

    /**
     * @brief Begin a new session: new generation, open audio, send offer
     *
     * Allowed from Idle or Closed; otherwise returns InvalidState and changes
     * nothing. Negotiation failures (expired credential, microphone denied,
     * peer rejection, timeout) arrive later as a Failed event.
     *
     * @return The generation of the new session
     */
    Result<SessionGeneration> negotiate(const SessionCredential& credential);

    /**
     * @brief Tear down: invalidate generation, then close channel, audio, link
     *
     * Idempotent. Callable in any state, including mid-negotiation.
     */
    void close();

    /// Send a client event on the channel (Active only)
    bool send_event(const std::string& message);

    TransportState state() const;
    SessionGeneration generation() const;

    /// Callbacks discarded because their generation was superseded
    size_t stale_events_dropped() const;

    /// The session.update description sent as the local offer
    std::string build_offer() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace job_diary
