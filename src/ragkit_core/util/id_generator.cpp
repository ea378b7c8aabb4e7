#include "ragkit_core/util/id_generator.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace ragkit_core {

namespace {

std::vector<unsigned char> random_bytes(size_t num_bytes) {
  std::vector<unsigned char> bytes(num_bytes);
  if (num_bytes == 0) {
    return bytes;
  }
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw IdGeneratorError("Failed to generate random bytes using RAND_bytes.");
  }
  return bytes;
}

std::string to_hex(const std::vector<unsigned char> &bytes, size_t begin, size_t end) {
  std::stringstream ss;
  for (size_t i = begin; i < end; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

}  // namespace

std::string IdGenerator::generate_uuid() {
  std::vector<unsigned char> bytes = random_bytes(16);
  // version 4, variant 10xx
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  return to_hex(bytes, 0, 4) + "-" + to_hex(bytes, 4, 6) + "-" + to_hex(bytes, 6, 8) + "-" +
         to_hex(bytes, 8, 10) + "-" + to_hex(bytes, 10, 16);
}

std::string IdGenerator::generate_hex(size_t num_bytes) {
  std::vector<unsigned char> bytes = random_bytes(num_bytes);
  return to_hex(bytes, 0, bytes.size());
}

}  // namespace ragkit_core
