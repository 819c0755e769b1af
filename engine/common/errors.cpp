#include "errors.hpp"

namespace docgate {

std::string DescribeException(const std::exception& e) {
  std::string description = e.what();
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    description += ": " + DescribeException(nested);
  } catch (...) {
    description += ": unknown cause";
  }
  return description;
}

}  // namespace docgate
