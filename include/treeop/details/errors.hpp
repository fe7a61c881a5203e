#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace treeop {

//
// exception classes

/// thrown when a statement cannot be applied to the data it addresses
/// \details
///    e.g., a partial update of a non-record without a default, or a
///    replacement wrapper holding more than one element.
struct usage_error : std::logic_error {
  using base = std::logic_error;
  using base::base;
};

/// thrown when a statement cannot be converted from or to json
/// \details
///    path() names the offending field, with segments separated by '.'
///    (e.g., a.b.*.c). The empty path denotes the statement root.
struct serialization_error : std::runtime_error {
  using base = std::runtime_error;

  serialization_error(const std::string& msg, std::string fieldpath)
  : base(msg + " at '" + (fieldpath.empty() ? std::string("<root>") : fieldpath) + "'"),
    where(std::move(fieldpath))
  {}

  const std::string& path() const noexcept { return where; }

 private:
  std::string where;
};

} // namespace treeop
