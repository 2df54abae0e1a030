#ifndef WEBSOCKET_SERVER_H
#define WEBSOCKET_SERVER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "frontend_gateway.h"
#include "relay_config.h"

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

/*
 * Browser-facing WebSocket.  All socket work runs on the connection's
 * strand; sends from other threads are posted onto it and queued so
 * frames never interleave.
 *
 * close() blocks the caller for up to the grace period and must not be
 * called from the strand itself.
 */
class FrontendSocket : public FrontendTransport,
                       public std::enable_shared_from_this<FrontendSocket> {
public:
    typedef std::function<void(std::shared_ptr<FrontendSocket>)> AcceptHandler;

    explicit FrontendSocket(tcp::socket &&socket);

    /* Complete the upgrade for an already-read HTTP request. */
    void accept(http::request<http::string_body> req, AcceptHandler onAccepted);

    /* Close without waiting; safe on the strand. */
    void reject(uint16_t code, const std::string &reason);

    bool isOpen() const override;
    void sendText(const std::string &text) override;
    void sendBinary(const std::vector<uint8_t> &data) override;
    void startReading(FrameHandler onFrame, CloseHandler onClose) override;
    bool close(uint16_t code, const std::string &reason,
               std::chrono::milliseconds grace) override;
    std::string remoteAddress() const override { return m_remote; }

private:
    struct Outgoing {
        std::shared_ptr<const std::string> data;
        bool binary;
    };

    void enqueue(Outgoing msg);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doClose();
    void finishClose(bool clean);
    void fireClose(const std::string &reason);

    websocket::stream<beast::tcp_stream>  m_ws;
    http::request<http::string_body>      m_upgradeReq;
    beast::flat_buffer                    m_readBuf;
    std::string                           m_remote;

    /* strand-only state */
    std::deque<Outgoing>                  m_queue;
    bool                                  m_closeRequested = false;
    websocket::close_reason               m_closeReason;

    std::atomic<bool>                     m_open{false};
    std::atomic<bool>                     m_closing{false};

    std::mutex                            m_cbMutex;    /* held while a handler runs */
    FrameHandler                          m_onFrame;
    CloseHandler                          m_onClose;

    std::mutex                            m_closeMutex;
    std::function<void(bool)>             m_closeDone;
};

/*
 * Called on an io thread once a WebSocket upgrade completes.  Returning
 * false refuses the socket, which is then closed with 1013.
 */
typedef std::function<bool(std::shared_ptr<FrontendSocket>)> SocketHandler;

/* One plain HTTP connection: health check, or upgrade on the relay path. */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket &&socket, const RelayConfig &cfg, SocketHandler onSocket);
    void run();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void upgrade();
    void respond(http::status status, const std::string &body);
    void onWrite(bool keepAlive, beast::error_code ec, std::size_t bytes);

    beast::tcp_stream                    m_stream;
    beast::flat_buffer                   m_buffer;
    http::request<http::string_body>     m_req;
    std::shared_ptr<http::response<http::string_body>> m_res;
    const RelayConfig                   &m_cfg;
    SocketHandler                        m_onSocket;
};

class WebSocketServer {
public:
    WebSocketServer(net::io_context &ioc, const RelayConfig &cfg, SocketHandler onSocket);

    /* Bind and start accepting; throws boost::system::system_error. */
    void start();
    void stop();

    unsigned short port() const;

private:
    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    net::io_context     &m_ioc;
    const RelayConfig   &m_cfg;
    SocketHandler        m_onSocket;
    tcp::acceptor        m_acceptor;
};

#endif /* WEBSOCKET_SERVER_H */
