/*
 * websocket_server.cpp
 *
 * Beast listener for the browser side of the relay.
 *
 * Key capabilities
 * ─────────────────
 * • Plain HTTP on the same port: GET / answers a JSON health check, any
 *   other request gets a JSON 404.
 * • Upgrades are accepted only on the configured relay path.
 * • Outgoing frames are queued on the socket's strand, so sends from any
 *   thread arrive whole and in order.
 * • close() flushes the queue, sends the close frame and waits out a grace
 *   period before closing the TCP socket by force.
 * • The close handler fires once, whoever closed first.
 */

#include <future>
#include <utility>

#include <spdlog/spdlog.h>

#include "realtime_relay.h"
#include "relay_errors.h"
#include "websocket_server.h"

/* ═══════════════════════════════════════════════════════════════════════════
 * FrontendSocket
 * ═══════════════════════════════════════════════════════════════════════════ */

FrontendSocket::FrontendSocket(tcp::socket &&socket)
    : m_ws(std::move(socket))
{
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(m_ws).socket().remote_endpoint(ec);
    m_remote = ec ? std::string("unknown")
                  : ep.address().to_string() + ":" + std::to_string(ep.port());
}

void FrontendSocket::accept(http::request<http::string_body> req, AcceptHandler onAccepted) {
    m_upgradeReq = std::move(req);

    beast::get_lowest_layer(m_ws).expires_never();
    m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type &res) {
        res.set(http::field::server, RELAY_SERVER_NAME);
    }));
    m_ws.read_message_max(MAX_FRONTEND_MESSAGE);

    auto self = shared_from_this();
    m_ws.async_accept(m_upgradeReq, [self, onAccepted](beast::error_code ec) {
        if (ec) {
            spdlog::warn("HandshakeError: websocket accept from {} failed: {}",
                self->m_remote, ec.message());
            return;
        }
        self->m_open.store(true);
        onAccepted(self);
    });
}

bool FrontendSocket::isOpen() const {
    return m_open.load() && !m_closing.load();
}

void FrontendSocket::sendText(const std::string &text) {
    if (!isOpen()) throw ConnectionClosed("frontend socket " + m_remote + " is closed");
    enqueue(Outgoing{std::make_shared<std::string>(text), false});
}

void FrontendSocket::sendBinary(const std::vector<uint8_t> &data) {
    if (!isOpen()) throw ConnectionClosed("frontend socket " + m_remote + " is closed");
    enqueue(Outgoing{std::make_shared<std::string>(data.begin(), data.end()), true});
}

void FrontendSocket::enqueue(Outgoing msg) {
    auto self = shared_from_this();
    net::post(m_ws.get_executor(), [self, msg]() {
        if (!self->m_open.load()) return;
        self->m_queue.push_back(msg);
        if (self->m_queue.size() == 1) self->doWrite();
    });
}

void FrontendSocket::doWrite() {
    const Outgoing &front = m_queue.front();
    m_ws.binary(front.binary);
    m_ws.async_write(net::buffer(*front.data),
        beast::bind_front_handler(&FrontendSocket::onWrite, shared_from_this()));
}

void FrontendSocket::onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
        spdlog::debug("frontend {} write failed: {}", m_remote, ec.message());
        m_open.store(false);
        m_queue.clear();
        fireClose(ec.message());
        if (m_closeRequested) finishClose(false);
        return;
    }

    m_queue.pop_front();
    if (!m_queue.empty()) {
        doWrite();
    } else if (m_closeRequested) {
        doClose();
    }
}

void FrontendSocket::startReading(FrameHandler onFrame, CloseHandler onClose) {
    {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        m_onFrame = std::move(onFrame);
        m_onClose = std::move(onClose);
    }
    net::post(m_ws.get_executor(),
        beast::bind_front_handler(&FrontendSocket::doRead, shared_from_this()));
}

void FrontendSocket::doRead() {
    m_ws.async_read(m_readBuf,
        beast::bind_front_handler(&FrontendSocket::onRead, shared_from_this()));
}

void FrontendSocket::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        m_open.store(false);
        if (ec == websocket::error::closed) {
            fireClose("closed by peer");
        } else {
            if (ec != net::error::operation_aborted)
                spdlog::debug("frontend {} read failed: {}", m_remote, ec.message());
            fireClose(ec.message());
        }
        return;
    }

    std::string payload = beast::buffers_to_string(m_readBuf.data());
    m_readBuf.consume(m_readBuf.size());
    const bool binary = m_ws.got_binary();

    {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        if (m_onFrame) m_onFrame(payload, binary);
    }
    doRead();
}

void FrontendSocket::fireClose(const std::string &reason) {
    std::lock_guard<std::mutex> lk(m_cbMutex);
    if (!m_onClose) return;
    CloseHandler handler = std::move(m_onClose);
    m_onClose = nullptr;
    m_onFrame = nullptr;
    handler(reason);
}

void FrontendSocket::doClose() {
    auto self = shared_from_this();
    m_ws.async_close(m_closeReason, [self](beast::error_code ec) {
        if (ec) spdlog::debug("frontend {} close failed: {}", self->m_remote, ec.message());
        self->finishClose(!ec);
    });
}

void FrontendSocket::finishClose(bool clean) {
    m_open.store(false);
    std::function<void(bool)> done;
    {
        std::lock_guard<std::mutex> lk(m_closeMutex);
        done = std::move(m_closeDone);
        m_closeDone = nullptr;
    }
    if (done) done(clean);
}

void FrontendSocket::reject(uint16_t code, const std::string &reason) {
    if (m_closing.exchange(true)) return;

    auto self = shared_from_this();
    net::post(m_ws.get_executor(), [self, code, reason]() {
        self->m_closeReason = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
        self->m_closeRequested = true;
        if (self->m_ws.is_open() && self->m_queue.empty()) self->doClose();
    });
}

bool FrontendSocket::close(uint16_t code, const std::string &reason,
                           std::chrono::milliseconds grace)
{
    if (m_closing.exchange(true)) return !m_open.load();

    /* no handler runs after this block */
    {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        m_onFrame = nullptr;
        m_onClose = nullptr;
    }

    auto done = std::make_shared<std::promise<bool>>();
    std::future<bool> result = done->get_future();
    {
        std::lock_guard<std::mutex> lk(m_closeMutex);
        m_closeDone = [done](bool clean) { done->set_value(clean); };
    }

    auto self = shared_from_this();
    net::post(m_ws.get_executor(), [self, code, reason]() {
        self->m_closeReason = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
        self->m_closeRequested = true;
        if (!self->m_ws.is_open()) {
            self->finishClose(true);
        } else if (self->m_queue.empty()) {
            self->doClose();
        }
    });

    if (result.wait_for(grace) == std::future_status::ready)
        return result.get();

    spdlog::debug("frontend {} close grace of {} ms expired, forcing", m_remote, grace.count());
    net::post(m_ws.get_executor(), [self]() {
        beast::error_code ec;
        beast::get_lowest_layer(self->m_ws).socket().close(ec);
        self->finishClose(false);
    });
    return false;
}

/* ═══════════════════════════════════════════════════════════════════════════
 * HttpConnection
 * ═══════════════════════════════════════════════════════════════════════════ */

HttpConnection::HttpConnection(tcp::socket &&socket, const RelayConfig &cfg,
                               SocketHandler onSocket)
    : m_stream(std::move(socket)),
      m_cfg(cfg),
      m_onSocket(std::move(onSocket))
{
}

void HttpConnection::run() {
    net::dispatch(m_stream.get_executor(),
        beast::bind_front_handler(&HttpConnection::doRead, shared_from_this()));
}

void HttpConnection::doRead() {
    m_req = {};
    m_stream.expires_after(std::chrono::seconds(30));
    http::async_read(m_stream, m_buffer, m_req,
        beast::bind_front_handler(&HttpConnection::onRead, shared_from_this()));
}

void HttpConnection::onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) {
        spdlog::debug("http read failed: {}", ec.message());
        return;
    }

    std::string path(m_req.target().data(), m_req.target().size());
    auto q = path.find('?');
    if (q != std::string::npos) path.erase(q);

    if (websocket::is_upgrade(m_req)) {
        if (path == m_cfg.path) {
            upgrade();
            return;
        }
        spdlog::warn("websocket upgrade on unknown path {}", path);
        respond(http::status::not_found, "{\"detail\":\"Not Found\"}");
        return;
    }

    if (m_req.method() == http::verb::get && path == "/") {
        respond(http::status::ok, "{\"message\":\"Server is running\"}");
    } else {
        respond(http::status::not_found, "{\"detail\":\"Not Found\"}");
    }
}

void HttpConnection::upgrade() {
    auto socket = std::make_shared<FrontendSocket>(m_stream.release_socket());
    SocketHandler onSocket = m_onSocket;

    socket->accept(std::move(m_req), [onSocket](std::shared_ptr<FrontendSocket> s) {
        if (!onSocket(s)) s->reject(1013, "session unavailable");
    });
}

void HttpConnection::respond(http::status status, const std::string &body) {
    m_res = std::make_shared<http::response<http::string_body>>(status, m_req.version());
    m_res->set(http::field::server, RELAY_SERVER_NAME);
    m_res->set(http::field::content_type, "application/json");
    m_res->keep_alive(m_req.keep_alive());
    m_res->body() = body;
    m_res->prepare_payload();

    http::async_write(m_stream, *m_res,
        beast::bind_front_handler(&HttpConnection::onWrite, shared_from_this(),
                                  m_res->keep_alive()));
}

void HttpConnection::onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
    if (ec) {
        spdlog::debug("http write failed: {}", ec.message());
        return;
    }
    if (!keepAlive) {
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    doRead();
}

/* ═══════════════════════════════════════════════════════════════════════════
 * WebSocketServer
 * ═══════════════════════════════════════════════════════════════════════════ */

WebSocketServer::WebSocketServer(net::io_context &ioc, const RelayConfig &cfg,
                                 SocketHandler onSocket)
    : m_ioc(ioc),
      m_cfg(cfg),
      m_onSocket(std::move(onSocket)),
      m_acceptor(net::make_strand(ioc))
{
}

void WebSocketServer::start() {
    tcp::endpoint endpoint(net::ip::make_address(m_cfg.bindAddress),
                           static_cast<unsigned short>(m_cfg.port));

    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(net::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(net::socket_base::max_listen_connections);

    spdlog::info("{} listening on {}:{}{}", RELAY_SERVER_NAME,
        m_cfg.bindAddress, port(), m_cfg.path);
    doAccept();
}

void WebSocketServer::stop() {
    net::post(m_acceptor.get_executor(), [this]() {
        beast::error_code ec;
        m_acceptor.close(ec);
    });
}

unsigned short WebSocketServer::port() const {
    beast::error_code ec;
    auto ep = m_acceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void WebSocketServer::doAccept() {
    m_acceptor.async_accept(net::make_strand(m_ioc),
        beast::bind_front_handler(&WebSocketServer::onAccept, this));
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) return;
        spdlog::warn("accept failed: {}", ec.message());
    } else {
        std::make_shared<HttpConnection>(std::move(socket), m_cfg, m_onSocket)->run();
    }
    if (m_acceptor.is_open()) doAccept();
}
