/*
 * https_client.cpp
 *
 * Small blocking HTTPS GET used by tools that call public web APIs.
 * Verifies the peer certificate and host name, sends SNI, and bounds every
 * step (resolve, connect, TLS, request, response) with the same timeout.
 */

#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include "https_client.h"
#include "realtime_relay.h"

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

    /* One request, one connection.  Each step re-arms the stream deadline. */
    class HttpsRequest : public std::enable_shared_from_this<HttpsRequest> {
    public:
        HttpsRequest(net::io_context &ioc, ssl::context &ctx,
                     const std::string &host, const std::string &target,
                     std::chrono::milliseconds timeout)
            : m_resolver(ioc),
              m_stream(ioc, ctx),
              m_host(host),
              m_timeout(timeout)
        {
            m_req.version(11);
            m_req.method(http::verb::get);
            m_req.target(target);
            m_req.set(http::field::host, host);
            m_req.set(http::field::user_agent, RELAY_SERVER_NAME);
            m_req.set(http::field::accept, "application/json");
        }

        void run() {
            if (!SSL_set_tlsext_host_name(m_stream.native_handle(), m_host.c_str())) {
                m_error = "cannot set SNI host name for " + m_host;
                return;
            }
            m_stream.set_verify_callback(ssl::host_name_verification(m_host));

            m_resolver.async_resolve(m_host, "443",
                beast::bind_front_handler(&HttpsRequest::onResolve, shared_from_this()));
        }

        const std::string &error() const { return m_error; }
        const http::response<http::string_body> &response() const { return m_res; }

    private:
        bool failed(beast::error_code ec, const char *step) {
            if (!ec) return false;
            m_error = std::string(step) + " " + m_host + ": " + ec.message();
            return true;
        }

        void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
            if (failed(ec, "resolve")) return;
            beast::get_lowest_layer(m_stream).expires_after(m_timeout);
            beast::get_lowest_layer(m_stream).async_connect(results,
                beast::bind_front_handler(&HttpsRequest::onConnect, shared_from_this()));
        }

        void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
            if (failed(ec, "connect")) return;
            beast::get_lowest_layer(m_stream).expires_after(m_timeout);
            m_stream.async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&HttpsRequest::onHandshake, shared_from_this()));
        }

        void onHandshake(beast::error_code ec) {
            if (failed(ec, "TLS handshake with")) return;
            beast::get_lowest_layer(m_stream).expires_after(m_timeout);
            http::async_write(m_stream, m_req,
                beast::bind_front_handler(&HttpsRequest::onWrite, shared_from_this()));
        }

        void onWrite(beast::error_code ec, std::size_t) {
            if (failed(ec, "request to")) return;
            beast::get_lowest_layer(m_stream).expires_after(m_timeout);
            http::async_read(m_stream, m_buffer, m_res,
                beast::bind_front_handler(&HttpsRequest::onRead, shared_from_this()));
        }

        void onRead(beast::error_code ec, std::size_t) {
            if (failed(ec, "response from")) return;
            beast::get_lowest_layer(m_stream).expires_after(m_timeout);
            m_stream.async_shutdown(
                beast::bind_front_handler(&HttpsRequest::onShutdown, shared_from_this()));
        }

        void onShutdown(beast::error_code ec) {
            /* servers routinely drop the connection instead of a close_notify */
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated)
                spdlog::debug("TLS shutdown with {}: {}", m_host, ec.message());
        }

        tcp::resolver                          m_resolver;
        beast::ssl_stream<beast::tcp_stream>   m_stream;
        beast::flat_buffer                     m_buffer;
        http::request<http::empty_body>        m_req;
        http::response<http::string_body>      m_res;
        std::string                            m_host;
        std::chrono::milliseconds              m_timeout;
        std::string                            m_error;
    };

} /* anonymous namespace */

std::string httpsGet(const std::string &host, const std::string &target,
                     const HttpsOptions &opts)
{
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_verify_mode(ssl::verify_peer);
    if (opts.caFile.empty()) {
        ctx.set_default_verify_paths();
    } else {
        ctx.load_verify_file(opts.caFile);
    }

    net::io_context ioc;
    auto request = std::make_shared<HttpsRequest>(ioc, ctx, host, target, opts.timeout);
    request->run();
    ioc.run();

    if (!request->error().empty())
        throw std::runtime_error(request->error());

    const auto &res = request->response();
    if (res.result() != http::status::ok) {
        throw std::runtime_error(host + " returned HTTP " +
            std::to_string(res.result_int()));
    }

    spdlog::debug("GET https://{}{} -> {} bytes", host, target, res.body().size());
    return res.body();
}

ToolRegistry::HttpGetter httpsGetter(const HttpsOptions &opts) {
    return [opts](const std::string &host, const std::string &target) {
        return httpsGet(host, target, opts);
    };
}
