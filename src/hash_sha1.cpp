#include "revhub/hash.hpp"
#include "revhub/consts.hpp"

#include <cstdint>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace revhub {

digest sha1(std::span<const std::uint8_t> data) {
  digest out{}; // 20 bytes

  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(),
                                                                    &EVP_MD_CTX_free};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

std::string to_hex(const digest &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kDigestHexLen);
  for (std::size_t i = 0; i < consts::kDigestRawLen; ++i) {
    const unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

auto commit_payload(const std::optional<std::string> &parent, std::string_view author,
                    std::time_t timestamp, std::string_view message,
                    const std::vector<std::string> &paths) -> std::string {
  std::string txt;

  txt += std::string(consts::kParentPrefix);
  if (parent) {
    txt += *parent;
  }
  txt += consts::kLF;

  // Free-text fields are length-prefixed.
  txt += std::string(consts::kAuthorPrefix);
  txt += std::to_string(author.size());
  txt += consts::kSpace;
  txt += std::string(author);
  txt += consts::kLF;

  txt += std::string(consts::kTimePrefix);
  txt += std::to_string(static_cast<long long>(timestamp));
  txt += consts::kLF;

  for (const auto &p : paths) {
    txt += std::string(consts::kFilePrefix);
    txt += std::to_string(p.size());
    txt += consts::kSpace;
    txt += p;
    txt += consts::kLF;
  }

  txt += consts::kLF;
  txt += std::string(message);
  return txt;
}

auto commit_id(const std::optional<std::string> &parent, std::string_view author,
               std::time_t timestamp, std::string_view message,
               const std::vector<std::string> &paths) -> std::string {
  const std::string payload = commit_payload(parent, author, timestamp, message, paths);
  return to_hex(sha1(payload)).substr(0, consts::kCommitIdLen);
}

} // namespace revhub
