#ifndef RELAY_ERRORS_H
#define RELAY_ERRORS_H

#include <stdexcept>
#include <string>

/*
 * Error taxonomy shared by both legs of a session.  Only the fatal kinds
 * reach the session state machine; the rest are absorbed where detected.
 */
enum RelayErrorKind {
    HANDSHAKE_ERROR,        /* frontend or provider connect failure     */
    PROTOCOL_ERROR,         /* malformed inbound frame                  */
    UPSTREAM_DISCONNECT,    /* provider socket closed unexpectedly      */
    DOWNSTREAM_DISCONNECT,  /* frontend socket closed                   */
    AUDIO_FORMAT_ERROR,     /* unexpected frame size / encoding         */
    CONFIG_ERROR            /* startup configuration rejected           */
};

inline const char *relayErrorKindName(RelayErrorKind kind) {
    switch (kind) {
        case HANDSHAKE_ERROR:       return "HandshakeError";
        case PROTOCOL_ERROR:        return "ProtocolError";
        case UPSTREAM_DISCONNECT:   return "UpstreamDisconnect";
        case DOWNSTREAM_DISCONNECT: return "DownstreamDisconnect";
        case AUDIO_FORMAT_ERROR:    return "AudioFormatError";
        case CONFIG_ERROR:          return "ConfigError";
    }
    return "Unknown";
}

inline bool isSessionFatal(RelayErrorKind kind) {
    return kind == HANDSHAKE_ERROR ||
           kind == UPSTREAM_DISCONNECT ||
           kind == DOWNSTREAM_DISCONNECT;
}

class RelayError : public std::runtime_error {
public:
    RelayError(RelayErrorKind kind, const std::string &what)
        : std::runtime_error(what), m_kind(kind) {}

    RelayErrorKind kind() const { return m_kind; }

private:
    RelayErrorKind m_kind;
};

/* Thrown by a frontend send when the socket is no longer open. */
class ConnectionClosed : public std::runtime_error {
public:
    explicit ConnectionClosed(const std::string &what)
        : std::runtime_error(what) {}
};

#endif /* RELAY_ERRORS_H */
