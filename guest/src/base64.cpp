#include <openssl/evp.h>

#include "exception.hpp"
#include "guest_agent.hpp"

namespace vmpilot {
namespace qga {

std::string base64_encode(std::string_view data) {
  if (data.empty())
    return {};
  std::string rv(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(rv.data()),
                          reinterpret_cast<const unsigned char *>(data.data()),
                          static_cast<int>(data.size()));
  if (n < 0)
    throw exception<value_error>("base64", "encode failed");
  rv.resize(static_cast<size_t>(n));
  return rv;
}

std::string base64_decode(std::string_view data) {
  if (data.empty())
    return {};
  if (data.size() % 4 != 0)
    throw exception<value_error>("base64", "length is not a multiple of 4");

  std::string rv(3 * (data.size() / 4), '\0');
  int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(rv.data()),
                          reinterpret_cast<const unsigned char *>(data.data()),
                          static_cast<int>(data.size()));
  if (n < 0)
    throw exception<value_error>("base64", "invalid character");

  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (data.back() == '=')
    padding++;
  if (data.size() >= 2 && data[data.size() - 2] == '=')
    padding++;
  rv.resize(static_cast<size_t>(n) - padding);
  return rv;
}

} // namespace qga
} // namespace vmpilot
