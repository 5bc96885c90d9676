#include "primitives/amount.hpp"

namespace kasstamp::primitives {

std::string FormatKas(Amount sompi) {
  std::string fraction = std::to_string(sompi % kSompiPerKas);
  fraction.insert(0, 8 - fraction.size(), '0');
  return std::to_string(sompi / kSompiPerKas) + "." + fraction;
}

}  // namespace kasstamp::primitives
