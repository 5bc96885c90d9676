#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kasstamp::util {

struct Argon2idParams {
  std::uint32_t t_cost;        // iterations
  std::uint32_t m_cost_kib;    // memory in KiB
  std::uint32_t parallelism;   // lanes
};

// 3 iterations, 64 MiB, single lane.
Argon2idParams DefaultArgon2idParams();

// Upper bounds applied to parameters read back from a stored blob so a
// tampered blob cannot request unbounded work.
constexpr std::uint32_t kMaxArgon2idT = 10;
constexpr std::uint32_t kMaxArgon2idMemoryKiB = 1024u * 1024u;  // 1 GiB
constexpr std::uint32_t kMaxArgon2idParallelism = 8;

bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error = nullptr);

// Derive a 32-byte key using Argon2id. Returns true on success.
bool DeriveKeyArgon2id(const std::string& password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out,
                       std::string* error = nullptr);

}  // namespace kasstamp::util
