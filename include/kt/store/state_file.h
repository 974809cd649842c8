#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include "kt/crypto/provider.h"

namespace kt::store {

// Fixed-layout record followed by an HMAC-SHA256 tag bound to a purpose
// string. A short, oversized or mis-tagged file reads back as kTampered so
// callers can fail closed.
enum class SealedReadStatus { kMissing, kValid, kTampered };

struct SealedRead {
  SealedReadStatus status{SealedReadStatus::kMissing};
  std::vector<uint8_t> body;
};

using StateMac = std::array<uint8_t, kt::crypto::kHmacTagSize>;

StateMac ComputeStateMac(std::span<const uint8_t> body, std::string_view purpose);

SealedRead ReadSealedFile(const std::filesystem::path& path, std::string_view purpose,
                          size_t expected_body_size);

void WriteSealedFile(const std::filesystem::path& path, std::string_view purpose,
                     std::span<const uint8_t> body);

}  // namespace kt::store
