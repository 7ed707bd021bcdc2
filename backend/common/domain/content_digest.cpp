#include "content_digest.h"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace domain {

std::string Sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("digest_context_failed");
  }
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw std::runtime_error("digest_failed");
  }
  static const char *kHex = "0123456789abcdef";
  std::string output;
  output.reserve(static_cast<std::size_t>(length) * 2);
  for (unsigned int i = 0; i < length; ++i) {
    output.push_back(kHex[digest[i] >> 4]);
    output.push_back(kHex[digest[i] & 0x0F]);
  }
  return output;
}

std::string ChangeOrderDigest(std::string_view summary, const ChangeSet &changes) {
  std::string material(summary);
  material.push_back('\n');
  material.append(changes.Canonical());
  return Sha256Hex(material);
}

}  // namespace domain
