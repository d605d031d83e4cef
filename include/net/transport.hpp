#pragma once

#include "net/endpoint.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace lgtv {

// Transport failures reach the session as descriptions; wait expiry is
// flagged separately so the session can tell its own bounded wait apart from
// a fault on the wire.
struct TransportError {
  std::string description;
  bool timedOut = false;
};

using TransportStatus = std::expected<void, TransportError>;

// ITransport — message-framed channel to the device, used for exactly one
// connect/close cycle. Inbound text frames are delivered to the registered
// handler from inside Pump() on the calling thread; there is no background
// reader.
class ITransport {
public:
  using MessageHandler = std::function<void(std::string_view)>;

  virtual ~ITransport() = default;

  // Resolve, connect, TLS and websocket handshakes. Each network stage is
  // bounded by `timeout`.
  virtual TransportStatus Connect(const Endpoint &endpoint,
                                  std::chrono::milliseconds timeout) = 0;

  virtual TransportStatus Send(std::string_view text) = 0;

  // Blocks until one frame was delivered to the handler, the wait expired
  // (TransportError::timedOut) or the channel failed.
  virtual TransportStatus Pump(std::chrono::milliseconds timeout) = 0;

  virtual void SetMessageHandler(MessageHandler handler) = 0;

  // Idempotent; never throws.
  virtual void Close() noexcept = 0;
};

} // namespace lgtv
