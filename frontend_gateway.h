#ifndef FRONTEND_GATEWAY_H
#define FRONTEND_GATEWAY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "envelope.h"
#include "message_router.h"
#include "relay_config.h"

/*
 * One accepted browser socket.  Implemented over Boost.Beast by
 * FrontendSocket; tests substitute an in-memory fake.
 */
class FrontendTransport {
public:
    typedef std::function<void(const std::string &payload, bool binary)> FrameHandler;
    typedef std::function<void(const std::string &reason)>               CloseHandler;

    virtual ~FrontendTransport() = default;

    virtual bool isOpen() const = 0;

    /* Queue one frame; throws ConnectionClosed when the socket is not open. */
    virtual void sendText(const std::string &text) = 0;
    virtual void sendBinary(const std::vector<uint8_t> &data) = 0;

    /*
     * Begin delivering inbound frames.  onClose fires exactly once, when
     * the peer goes away or the socket fails.
     */
    virtual void startReading(FrameHandler onFrame, CloseHandler onClose) = 0;

    /*
     * Flush queued frames and perform the close handshake.  Waits at most
     * `grace`, then force-closes.  Returns true if the handshake completed.
     */
    virtual bool close(uint16_t code, const std::string &reason,
                       std::chrono::milliseconds grace) = 0;

    virtual std::string remoteAddress() const = 0;
};

/* Outcome of parsing one inbound text frame. */
struct ParseResult {
    bool        ok = false;
    Envelope    envelope;
    std::string error;      /* why the frame was dropped */
};

class FrontendGateway {
public:
    FrontendGateway(std::shared_ptr<FrontendTransport> transport,
                    MessageRouter &router,
                    const std::string &sessionId,
                    const LogConfig &log);

    /*
     * Serialise and send one envelope: audio as a binary frame, anything
     * else as a JSON text frame.  function_call envelopes are internal and
     * never leave the relay.  Throws ConnectionClosed.
     */
    void send(const Envelope &env);

    /* Parse one inbound frame and dispatch it; false when dropped. */
    bool onFrame(const std::string &payload, bool binary);

    static ParseResult parseText(const std::string &text);

    void startReading(FrontendTransport::CloseHandler onClose);
    bool isOpen() const;
    bool close(std::chrono::milliseconds grace);

    std::string remoteAddress() const { return m_transport->remoteAddress(); }

private:
    std::shared_ptr<FrontendTransport>  m_transport;
    MessageRouter                      &m_router;
    std::string                         m_sessionId;
    const LogConfig                    &m_log;
};

#endif /* FRONTEND_GATEWAY_H */
