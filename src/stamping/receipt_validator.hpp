#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace kasstamp::stamping {

struct ValidationResult {
  bool valid{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Structural and content checks on an untrusted receipt before it is used
// for reconstruction. Errors make the receipt unusable; warnings flag
// content that deserves the user's attention (executable file names,
// markup, implausible sizes).
ValidationResult ValidateReceipt(const nlohmann::json& receipt);

}  // namespace kasstamp::stamping
