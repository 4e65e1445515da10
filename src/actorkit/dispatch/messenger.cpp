#include "actorkit/dispatch/messenger.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "actorkit/common/internal_error.hpp"
#include "actorkit/common/overloaded.hpp"

namespace actorkit::dispatch {

namespace {

auto ToMessengerError(BuildError error) -> MessengerError {
  return std::visit(
      Overloaded{
          [](EmptyMethodName e) -> MessengerError { return e; },
          [](IllegalMethodName e) -> MessengerError { return std::move(e); },
          [](const auto& other) -> MessengerError {
            common::ThrowInternalError(
                "MethodMessenger", fmt::format(
                                       "unexpected resolver error: {}",
                                       ToString(BuildError{other})));
          },
      },
      std::move(error));
}

}  // namespace

auto ToString(const MessengerError& error) -> std::string {
  return std::visit(
      Overloaded{
          [](const EmptyMethodName& e) { return ToString(BuildError{e}); },
          [](const IllegalMethodName& e) { return ToString(BuildError{e}); },
          [](const SendFailed& e) {
            return fmt::format("send failed with error {}", e.error_number);
          },
      },
      error);
}

MethodMessenger::MethodMessenger(MessageSender& sender, MethodResolver resolver)
    : sender_(sender), resolver_(std::move(resolver)) {
}

auto MethodMessenger::CallMethod(
    ActorId to, std::string_view method, ByteView params)
    -> std::expected<Bytes, MessengerError> {
  auto number = resolver_.Resolve(method);
  if (!number) {
    return std::unexpected(ToMessengerError(std::move(number.error())));
  }

  spdlog::debug("send {} ({}) to actor {}", method, *number, to);
  auto reply = sender_.Send(
      OutgoingCall{
          .to = to,
          .method = *number,
          .params = Bytes(params.begin(), params.end())});
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return std::move(*reply);
}

}  // namespace actorkit::dispatch
