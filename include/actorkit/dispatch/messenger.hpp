#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>

#include "actorkit/common/bytes.hpp"
#include "actorkit/dispatch/errors.hpp"
#include "actorkit/dispatch/method_number.hpp"
#include "actorkit/dispatch/method_resolver.hpp"

namespace actorkit::dispatch {

using ActorId = uint64_t;

struct OutgoingCall {
  ActorId to;
  MethodNumber method;
  Bytes params;
};

// Error number reported by the host's send primitive.
struct SendFailed {
  int32_t error_number;

  auto operator==(const SendFailed&) const -> bool = default;
};

using MessengerError =
    std::variant<EmptyMethodName, IllegalMethodName, SendFailed>;

auto ToString(const MessengerError& error) -> std::string;

// The host runtime's message send primitive.
class MessageSender {
 public:
  MessageSender() = default;
  virtual ~MessageSender() = default;

  MessageSender(const MessageSender&) = delete;
  auto operator=(const MessageSender&) -> MessageSender& = delete;
  MessageSender(MessageSender&&) = delete;
  auto operator=(MessageSender&&) -> MessageSender& = delete;

  virtual auto Send(const OutgoingCall& call)
      -> std::expected<Bytes, SendFailed> = 0;
};

// Calls methods on other actors by name. The selector is computed with the
// same resolver the callee used to build its table.
class MethodMessenger {
 public:
  explicit MethodMessenger(MessageSender& sender, MethodResolver resolver = {});

  // Name errors are reported before anything is sent.
  auto CallMethod(ActorId to, std::string_view method, ByteView params)
      -> std::expected<Bytes, MessengerError>;

 private:
  MessageSender& sender_;
  MethodResolver resolver_;
};

}  // namespace actorkit::dispatch
