#pragma once

#include "util/branch.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <chrono>
#include <expected>
#include <openssl/err.h>
#include <string>
#include <string_view>

// namespace wsops — blocking building blocks for a single wss:// exchange.
// Every stage is started asynchronously and then driven to completion on the
// caller's thread by running the stream's private io_context, so the
// beast::tcp_stream deadline (set per call) bounds it. Results are
// std::expected with the raw error_code; Describe() turns a failed stage into
// the text the retry logic classifies.
namespace lgtv::wsops {

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
using Status = std::expected<void, beast::error_code>;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

// Runs queued handlers until the io_context is out of work.
inline void RunIo(net::io_context &ioc) {
  ioc.restart();
  ioc.run();
}

// The TV presents a self-signed certificate that cannot be validated against
// any trust store; peer verification is off on purpose.
inline void ConfigureUnverifiedTls(ssl::context &ctx) {
  ctx.set_verify_mode(ssl::verify_none);
}

inline std::expected<tcp::resolver::results_type, beast::error_code>
Resolve(tcp::resolver &resolver, const std::string &host,
        const std::string &port) {
  beast::error_code ec;
  auto r = resolver.resolve(host, port, ec);
  if (ec)
    return std::unexpected(ec);
  return r;
}

inline Status Connect(net::io_context &ioc, beast::tcp_stream &stream,
                      const tcp::resolver::results_type &endpoints,
                      std::chrono::milliseconds timeout) {
  beast::error_code result = net::error::would_block;
  stream.expires_after(timeout);
  stream.async_connect(endpoints,
                       [&result](const beast::error_code &ec,
                                 const tcp::endpoint &) { result = ec; });
  RunIo(ioc);
  return MakeStatus(result);
}

template <typename SslLayer>
inline Status SetSni(SslLayer &ssl, const std::string &host) {
  if (!SSL_set_tlsext_host_name(ssl.native_handle(), host.c_str())) {
    beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category());
    return std::unexpected(ssl_ec);
  }
  return {};
}

inline void SetTcpNoDelay(beast::tcp_stream &stream) {
  beast::error_code ec;
  stream.socket().set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

inline Status TlsHandshake(net::io_context &ioc, WsStream &ws,
                           std::chrono::milliseconds timeout) {
  beast::error_code result = net::error::would_block;
  beast::get_lowest_layer(ws).expires_after(timeout);
  ws.next_layer().async_handshake(
      ssl::stream_base::client,
      [&result](const beast::error_code &ec) { result = ec; });
  RunIo(ioc);
  return MakeStatus(result);
}

// Beast sends no Origin header by default; webOS rejects foreign origins, so
// only the user agent is decorated.
inline void ConfigureWebSocket(WsStream &ws, const std::string &userAgent) {
  websocket::permessage_deflate pmd;
  pmd.client_enable = false;
  pmd.server_enable = false;
  ws.set_option(pmd);
  ws.set_option(websocket::stream_base::decorator(
      [userAgent](websocket::request_type &req) {
        req.set(beast::http::field::user_agent, userAgent);
      }));
}

inline Status WsHandshake(net::io_context &ioc, WsStream &ws,
                          const std::string &host, const std::string &target,
                          std::chrono::milliseconds timeout) {
  beast::error_code result = net::error::would_block;
  beast::get_lowest_layer(ws).expires_after(timeout);
  ws.async_handshake(host, target,
                     [&result](const beast::error_code &ec) { result = ec; });
  RunIo(ioc);
  return MakeStatus(result);
}

inline Status WriteText(WsStream &ws, std::string_view text) {
  beast::error_code ec;
  ws.text(true);
  ws.write(net::buffer(text.data(), text.size()), ec);
  return MakeStatus(ec);
}

// Reads one complete message into `buffer`. Expiry surfaces as
// beast::error::timeout and leaves the socket closed.
inline Status ReadMessage(net::io_context &ioc, WsStream &ws,
                          beast::flat_buffer &buffer,
                          std::chrono::milliseconds timeout) {
  beast::error_code result = net::error::would_block;
  beast::get_lowest_layer(ws).expires_after(timeout);
  ws.async_read(buffer, [&result](const beast::error_code &ec, std::size_t) {
    result = ec;
  });
  RunIo(ioc);
  return MakeStatus(result);
}

// Best-effort close handshake bounded by `timeout`; errors are ignored since
// the socket is discarded right after.
inline void CloseQuietly(net::io_context &ioc, WsStream &ws,
                         std::chrono::milliseconds timeout) {
  if (ws.is_open()) {
    beast::get_lowest_layer(ws).expires_after(timeout);
    ws.async_close(websocket::close_code::normal,
                   [](const beast::error_code &) {});
    RunIo(ioc);
  }
  beast::error_code ec;
  beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both,
                                                ec);
  beast::get_lowest_layer(ws).close();
}

inline bool IsTimeout(const beast::error_code &ec) {
  return ec == beast::error::timeout || ec == net::error::timed_out;
}

inline bool IsTlsFault(const beast::error_code &ec) {
  return ec.category() == net::error::get_ssl_category() ||
         ec.category() == ssl::error::get_stream_category();
}

inline bool IsEndOfStream(const beast::error_code &ec) {
  return ec == net::error::eof || ec == beast::http::error::end_of_stream;
}

// Human-readable description of a failed stage. The wording carries the
// markers the retry classifier looks for: TLS faults start with "SSL: ",
// stream truncation mentions "EOF", deadline expiry reads "<stage> timed out",
// and OS errors keep their own text ("Connection refused", ...).
inline std::string Describe(std::string_view stage,
                            const beast::error_code &ec) {
  std::string out;
  if (LGTV_UNLIKELY(IsTimeout(ec))) {
    out.append(stage).append(" timed out");
  } else if (IsTlsFault(ec)) {
    out.append("SSL: ").append(ec.message());
    out.append(" (").append(stage).append(")");
  } else if (IsEndOfStream(ec)) {
    out.append("EOF occurred in violation of protocol (")
        .append(stage)
        .append(")");
  } else if (ec == websocket::error::closed) {
    out.append("Connection closed by TV (").append(stage).append(")");
  } else {
    out.append(ec.message()).append(" (").append(stage).append(")");
  }
  return out;
}

} // namespace lgtv::wsops
