#include "errors.hpp"

#include <sstream>

namespace stockcount::util {

namespace {

std::string DescribeUnresolved(const std::vector<std::string>& names) {
  std::ostringstream out;
  out << "cannot complete session: " << names.size() << (names.size() == 1 ? " item was" : " items were")
      << " neither counted nor skipped: ";
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out << ", ";
    out << names[i];
  }
  return out.str();
}

} // namespace

IncompleteDecisions::IncompleteDecisions(std::vector<std::string> item_ids, std::vector<std::string> item_names)
    : std::runtime_error(DescribeUnresolved(item_names)), item_ids_(std::move(item_ids)), item_names_(std::move(item_names)) {
}

} // namespace stockcount::util
