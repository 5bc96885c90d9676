#include "util/argon2_kdf.hpp"

#include <argon2.h>

namespace kasstamp::util {

Argon2idParams DefaultArgon2idParams() {
  Argon2idParams params;
  params.t_cost = 3;
  params.m_cost_kib = 64 * 1024;
  params.parallelism = 1;
  return params;
}

bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error) {
  if (params.t_cost == 0 || params.parallelism == 0 ||
      params.m_cost_kib < 8 * params.parallelism) {
    if (error) {
      *error = "argon2id parameters below minimum";
    }
    return false;
  }
  if (params.t_cost > kMaxArgon2idT || params.m_cost_kib > kMaxArgon2idMemoryKiB ||
      params.parallelism > kMaxArgon2idParallelism) {
    if (error) {
      *error = "argon2id parameters exceed maximums (t_cost=" + std::to_string(params.t_cost) +
               ", m_cost_kib=" + std::to_string(params.m_cost_kib) +
               ", parallelism=" + std::to_string(params.parallelism) + ")";
    }
    return false;
  }
  return true;
}

bool DeriveKeyArgon2id(const std::string& password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out,
                       std::string* error) {
  if (!key_out) return false;
  if (!ValidateArgon2idParams(params, error)) {
    return false;
  }
  key_out->assign(32, 0);

  const int rc = argon2id_hash_raw(
      params.t_cost,
      params.m_cost_kib,
      params.parallelism,
      password.data(), password.size(),
      salt.data(), salt.size(),
      key_out->data(), key_out->size());
  if (rc != ARGON2_OK) {
    if (error) {
      *error = std::string("argon2id failed: ") + argon2_error_message(rc);
    }
    key_out->clear();
    return false;
  }
  return true;
}

}  // namespace kasstamp::util
