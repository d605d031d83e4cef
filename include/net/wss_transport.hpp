#pragma once

#include "logging/log.hpp"
#include "net/transport.hpp"
#include "net/ws_ops.hpp"
#include "util/branch.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace lgtv {

// WssTransport — one TLS websocket connection to the TV.
// Threading model:
// - Owns a private io_context that is only ever run from the caller's thread
//   inside Connect/Pump/Close, so every call is blocking and no thread is
//   spawned
// - Each stage (connect, TLS, websocket handshake, read) gets its own
//   deadline on the underlying beast::tcp_stream
// - The stream is created by Connect() and destroyed by Close(); a transport
//   is never reconnected
class WssTransport : public ITransport {
public:
  explicit WssTransport(std::string userAgent = "lgtv-remote/1.0")
      : ssl_ctx_(wsops::ssl::context::tls_client),
        user_agent_(std::move(userAgent)) {
    wsops::ConfigureUnverifiedTls(ssl_ctx_);
  }

  ~WssTransport() override { Close(); }

  WssTransport(const WssTransport &) = delete;
  WssTransport &operator=(const WssTransport &) = delete;

  TransportStatus Connect(const Endpoint &endpoint,
                          std::chrono::milliseconds timeout) override {
    if (ws_) {
      return std::unexpected(TransportError{"transport already connected"});
    }
    ws_.emplace(ioc_, ssl_ctx_);
    wsops::tcp::resolver resolver(ioc_);

    auto st_resolve = wsops::Resolve(resolver, endpoint.host, endpoint.port);
    if (LGTV_UNLIKELY(!st_resolve)) {
      return Fail("resolve", st_resolve.error());
    }

    auto &lowest = wsops::beast::get_lowest_layer(*ws_);
    if (auto st = wsops::Connect(ioc_, lowest, *st_resolve, timeout);
        LGTV_UNLIKELY(!st)) {
      return Fail("connect", st.error());
    }

    if (auto st = wsops::SetSni(ws_->next_layer(), endpoint.host);
        LGTV_UNLIKELY(!st)) {
      return Fail("sni", st.error());
    }

    wsops::SetTcpNoDelay(lowest);

    if (auto st = wsops::TlsHandshake(ioc_, *ws_, timeout);
        LGTV_UNLIKELY(!st)) {
      return Fail("handshake", st.error());
    }

    wsops::ConfigureWebSocket(*ws_, user_agent_);

    if (auto st = wsops::WsHandshake(ioc_, *ws_, endpoint.host,
                                     endpoint.target, timeout);
        LGTV_UNLIKELY(!st)) {
      return Fail("ws handshake", st.error());
    }
    log::Debug("transport", "connected to ", endpoint.Url());
    return {};
  }

  TransportStatus Send(std::string_view text) override {
    if (!ws_) {
      return std::unexpected(TransportError{"send on closed transport"});
    }
    if (auto st = wsops::WriteText(*ws_, text); LGTV_UNLIKELY(!st)) {
      return Fail("write", st.error());
    }
    return {};
  }

  TransportStatus Pump(std::chrono::milliseconds timeout) override {
    if (!ws_) {
      return std::unexpected(TransportError{"read on closed transport"});
    }
    wsops::beast::flat_buffer buffer;
    auto st = wsops::ReadMessage(ioc_, *ws_, buffer, timeout);
    if (LGTV_UNLIKELY(!st)) {
      if (wsops::IsTimeout(st.error())) {
        return std::unexpected(TransportError{"read timed out", true});
      }
      return Fail("read", st.error());
    }
    if (handler_) {
      const std::string text = wsops::beast::buffers_to_string(buffer.data());
      handler_(text);
    }
    return {};
  }

  void SetMessageHandler(MessageHandler handler) override {
    handler_ = std::move(handler);
  }

  void Close() noexcept override {
    if (!ws_) {
      return;
    }
    try {
      wsops::CloseQuietly(ioc_, *ws_, kCloseTimeout);
    } catch (const std::exception &e) {
      log::Debug("transport", "close: ", e.what());
    }
    ws_.reset();
  }

private:
  static constexpr std::chrono::milliseconds kCloseTimeout{500};

  TransportStatus Fail(std::string_view stage,
                       const wsops::beast::error_code &ec) {
    log::Debug("transport", stage, " error: ", ec.message());
    return std::unexpected(TransportError{wsops::Describe(stage, ec)});
  }

  wsops::net::io_context ioc_;
  wsops::ssl::context ssl_ctx_;
  std::string user_agent_;
  std::optional<wsops::WsStream> ws_;
  MessageHandler handler_;
};

} // namespace lgtv
