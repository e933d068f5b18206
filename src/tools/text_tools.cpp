#include "tools/text_tools.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "tools/arguments.hpp"

namespace toolbox::tools {

namespace {

std::string to_hex(const unsigned char* data, const unsigned int size) {
  constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(size) * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4U]);
    out.push_back(kDigits[data[i] & 0x0FU]);
  }
  return out;
}

}  // namespace

nlohmann::json base64_encode(const nlohmann::json& arguments) {
  const auto text = require_string(arguments, "text");

  // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL.
  std::vector<unsigned char> encoded(4 * ((text.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(encoded.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (written < 0) {
    throw std::runtime_error("base64 encoding failed");
  }

  return nlohmann::json{{"encoded", std::string(encoded.begin(), encoded.begin() + written)}};
}

nlohmann::json sha256_hash(const nlohmann::json& arguments) {
  const auto text = require_string(arguments, "text");

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_size = 0;
  if (EVP_Digest(text.data(), text.size(), digest.data(), &digest_size, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }

  return nlohmann::json{{"hash", to_hex(digest.data(), digest_size)}};
}

}  // namespace toolbox::tools
