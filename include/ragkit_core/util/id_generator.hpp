#pragma once

#include <stdexcept>
#include <string>

namespace ragkit_core {

class IdGeneratorError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class IdGenerator {
 public:
  /**
   * @brief Generates a random RFC 4122 version 4 identifier.
   * @return Lowercase hex in the 8-4-4-4-12 layout.
   * @throws IdGeneratorError if the OpenSSL random source fails.
   */
  static std::string generate_uuid();

  /**
   * @brief Generates `num_bytes` random bytes rendered as lowercase hex.
   */
  static std::string generate_hex(size_t num_bytes);
};

}  // namespace ragkit_core
