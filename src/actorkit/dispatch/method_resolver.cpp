#include "actorkit/dispatch/method_resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "actorkit/common/internal_error.hpp"

namespace actorkit::dispatch {

namespace {

auto IsAsciiUpper(char c) -> bool {
  return c >= 'A' && c <= 'Z';
}

auto IsAsciiLower(char c) -> bool {
  return c >= 'a' && c <= 'z';
}

auto IsAsciiDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

}  // namespace

auto CandidateFromDigest(ByteView digest) -> uint64_t {
  if (digest.size() < kCandidatePrefixBytes) {
    common::ThrowInternalError(
        "CandidateFromDigest",
        fmt::format(
            "digest has {} bytes, need at least {}", digest.size(),
            kCandidatePrefixBytes));
  }
  uint64_t candidate = 0;
  for (size_t i = 0; i < kCandidatePrefixBytes; ++i) {
    candidate = (candidate << 8) | digest[i];
  }
  return candidate;
}

auto CheckStrictName(std::string_view name) -> std::string {
  if (name.empty()) {
    return "name is empty";
  }
  if (!IsAsciiUpper(name.front())) {
    return "must start with an uppercase ASCII letter";
  }
  for (char c : name) {
    if (!IsAsciiUpper(c) && !IsAsciiLower(c) && !IsAsciiDigit(c) && c != '_') {
      return fmt::format("character '{}' is not allowed", c);
    }
  }
  return {};
}

namespace {

// Word boundaries: '_', '-', ' ', lower->upper, letter<->digit, and the last
// capital of an acronym followed by a lowercase letter.
auto SplitIdentifierWords(std::string_view identifier)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> words;
  size_t word_begin = 0;
  auto close_word = [&](size_t end) {
    if (end > word_begin) {
      words.push_back(identifier.substr(word_begin, end - word_begin));
    }
    word_begin = end;
  };

  for (size_t i = 0; i < identifier.size(); ++i) {
    char c = identifier[i];
    if (c == '_' || c == '-' || c == ' ') {
      close_word(i);
      word_begin = i + 1;
      continue;
    }
    if (i == word_begin) {
      continue;
    }
    char prev = identifier[i - 1];
    bool letter = IsAsciiUpper(c) || IsAsciiLower(c);
    bool prev_letter = IsAsciiUpper(prev) || IsAsciiLower(prev);
    // "getURL" -> get|URL, "v2beta" -> v|2|beta
    if ((IsAsciiLower(prev) && IsAsciiUpper(c)) ||
        (prev_letter && IsAsciiDigit(c)) ||
        (IsAsciiDigit(prev) && letter)) {
      close_word(i);
      continue;
    }
    // "URLParser" -> URL|Parser
    if (IsAsciiUpper(prev) && IsAsciiUpper(c) && i + 1 < identifier.size() &&
        IsAsciiLower(identifier[i + 1])) {
      close_word(i);
    }
  }
  close_word(identifier.size());
  return words;
}

}  // namespace

auto ToPascalCase(std::string_view identifier) -> std::string {
  std::string result;
  result.reserve(identifier.size());
  for (std::string_view word : SplitIdentifierWords(identifier)) {
    for (size_t i = 0; i < word.size(); ++i) {
      char c = word[i];
      if (i == 0 && IsAsciiLower(c)) {
        c = static_cast<char>(c - 'a' + 'A');
      } else if (i > 0 && IsAsciiUpper(c)) {
        c = static_cast<char>(c - 'A' + 'a');
      }
      result.push_back(c);
    }
  }
  return result;
}

MethodResolver::MethodResolver()
    : MethodResolver(std::make_shared<Blake2bHasher>()) {
}

MethodResolver::MethodResolver(
    std::shared_ptr<const Hasher> hasher, ResolverOptions options)
    : hasher_(std::move(hasher)), options_(options) {
  if (hasher_ == nullptr) {
    common::ThrowInternalError("MethodResolver", "hasher must not be null");
  }
}

auto MethodResolver::Resolve(std::string_view name) const
    -> std::expected<MethodNumber, BuildError> {
  if (name.empty()) {
    return std::unexpected(EmptyMethodName{});
  }
  if (options_.strict_names) {
    if (auto reason = CheckStrictName(name); !reason.empty()) {
      return std::unexpected(
          IllegalMethodName{.name = std::string(name), .reason = reason});
    }
  }
  Bytes digest = hasher_->Digest(name);
  return Normalize(CandidateFromDigest(digest));
}

}  // namespace actorkit::dispatch
