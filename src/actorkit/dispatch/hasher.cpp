#include "actorkit/dispatch/hasher.hpp"

#include <memory>
#include <string_view>

#include <fmt/core.h>
#include <openssl/evp.h>

#include "actorkit/common/bytes.hpp"
#include "actorkit/common/internal_error.hpp"

namespace actorkit::dispatch {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // namespace

auto Blake2bHasher::Digest(std::string_view name) const -> Bytes {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (ctx == nullptr) {
    common::ThrowInternalError("Blake2bHasher", "EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_blake2b512(), nullptr) != 1) {
    common::ThrowInternalError("Blake2bHasher", "EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1) {
    common::ThrowInternalError("Blake2bHasher", "EVP_DigestUpdate failed");
  }

  Bytes digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    common::ThrowInternalError("Blake2bHasher", "EVP_DigestFinal_ex failed");
  }
  if (length != kDigestSize) {
    common::ThrowInternalError(
        "Blake2bHasher",
        fmt::format("expected {} byte digest, got {}", kDigestSize, length));
  }
  digest.resize(length);
  return digest;
}

}  // namespace actorkit::dispatch
