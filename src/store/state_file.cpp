#include "kt/store/state_file.h"

#include <algorithm>
#include <vector>

#include "kt/common.h"
#include "kt/crypto/ct.h"
#include "kt/store/io_util.h"

namespace kt::store {
namespace {

constexpr std::array<uint8_t, 16> kStateMacSalt = {'K', 'T', 'S', 'T', 'A', 'T', 'E', '_',
                                                   'H', 'M', 'A', 'C', '_', 'S', 'L', 'T'};

StateMac DeriveMacKey(std::string_view purpose) {
  return kt::crypto::ComputeHmacSha256(
      std::span<const uint8_t>(kStateMacSalt.data(), kStateMacSalt.size()), kt::AsBytes(purpose));
}

}  // namespace

StateMac ComputeStateMac(std::span<const uint8_t> body, std::string_view purpose) {
  auto key = DeriveMacKey(purpose);
  return kt::crypto::ComputeHmacSha256(std::span<const uint8_t>(key.data(), key.size()), body);
}

SealedRead ReadSealedFile(const std::filesystem::path& path, std::string_view purpose,
                          size_t expected_body_size) {
  SealedRead result{};
  auto bytes = ReadFileBytes(path);
  if (!bytes) {
    return result;
  }
  if (bytes->size() != expected_body_size + kt::crypto::kHmacTagSize) {
    result.status = SealedReadStatus::kTampered;
    return result;
  }
  auto body = std::span<const uint8_t>(bytes->data(), expected_body_size);
  auto stored_mac = std::span<const uint8_t>(bytes->data() + expected_body_size,
                                             kt::crypto::kHmacTagSize);
  auto expected_mac = ComputeStateMac(body, purpose);
  if (!kt::crypto::ct::CompareEqual(stored_mac,
                                    std::span<const uint8_t>(expected_mac.data(), expected_mac.size()))) {
    result.status = SealedReadStatus::kTampered;
    return result;
  }
  result.status = SealedReadStatus::kValid;
  result.body.assign(body.begin(), body.end());
  return result;
}

void WriteSealedFile(const std::filesystem::path& path, std::string_view purpose,
                     std::span<const uint8_t> body) {
  auto mac = ComputeStateMac(body, purpose);
  std::vector<uint8_t> payload;
  payload.reserve(body.size() + mac.size());
  payload.insert(payload.end(), body.begin(), body.end());
  payload.insert(payload.end(), mac.begin(), mac.end());
  AtomicReplace(path, std::span<const uint8_t>(payload.data(), payload.size()));
}

}  // namespace kt::store
