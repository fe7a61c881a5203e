#pragma once

#include <cstddef>
#include <functional>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

#include <boost/container/map.hpp>
#include <boost/container/vector.hpp>
#include <boost/json/fwd.hpp>

namespace treeop {

struct value;

/// ordered sequence of values
using sequence = boost::container::vector<value>;

/// mapping from field name to value
/// \note boost::container supports the recursive (incomplete) element type.
using record = boost::container::map<std::string, value, std::less<>>;

/// inheritable key/value mapping passed through update statements
using context = record;

/// a type representing the data that statements query and mutate
/// \details
///    (1) the variant contains options for all json types.
///    (2) std::monostate represents the absence of a value (undefined),
///        which some rules treat differently from null.
using value_base = std::variant< std::monostate,
                                 std::nullptr_t,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 sequence,
                                 record
                               >;

struct value : value_base {
  using base = value_base;
  using base::base;

  value()
  : base(std::monostate{})
  {}

  value(int v) : base(std::int64_t(v)) {}
  value(unsigned v) : base(std::int64_t(v)) {}
  value(long long v) : base(std::int64_t(v)) {}
  value(std::size_t v) : base(std::int64_t(v)) {}
  value(const char* s) : base(std::string(s)) {}
  value(std::string_view s) : base(std::string(s)) {}

  bool is_undefined() const { return index() == 0; }
  bool is_null() const { return index() == 1; }

  /// true for null and undefined
  bool is_nullish() const { return index() <= 1; }

  bool is_bool() const { return std::holds_alternative<bool>(*this); }
  bool is_number() const;
  bool is_string() const { return std::holds_alternative<std::string>(*this); }
  bool is_sequence() const { return std::holds_alternative<sequence>(*this); }
  bool is_record() const { return std::holds_alternative<record>(*this); }

  /// true for sequences and records
  bool is_container() const { return is_sequence() || is_record(); }

  /// returns the numeric value
  /// \pre is_number()
  double as_number() const;

  const std::string& as_string() const { return std::get<std::string>(*this); }

  sequence&       as_sequence()       { return std::get<sequence>(*this); }
  const sequence& as_sequence() const { return std::get<sequence>(*this); }

  record&       as_record()       { return std::get<record>(*this); }
  const record& as_record() const { return std::get<record>(*this); }

  /// returns a pointer to the element addressed by \p key or nullptr
  /// \details
  ///    for records, \p key is the field name; for sequences \p key must
  ///    be a canonical non-negative decimal index.
  /// \{
  const value* find(std::string_view key) const;
  value*       find(std::string_view key);
  /// \}
};

/// the kind of a value, with integer and floating point numbers folded
/// into a single number kind.
enum class value_kind { undefined, null, boolean, number, string, sequence, record };

value_kind kind_of(const value& v);

/// returns a printable name for \p k
std::string_view type_name(value_kind k);

/// structural equality
/// \details
///    numbers compare by numeric value regardless of representation.
bool operator==(const value& lhs, const value& rhs);
bool operator!=(const value& lhs, const value& rhs);

/// coercing equality
/// \details
///    * null and undefined are equal to each other and to nothing else
///    * a number compared with a string or a boolean compares numerically
///    * everything else uses structural equality
bool loose_equal(const value& lhs, const value& rhs);

/// converts \p v to a number
/// \details
///    booleans convert to 0 and 1, null to 0, strings are parsed (surrounding
///    whitespace is ignored, the empty string is 0). Everything else,
///    including strings that do not hold a complete number, is NaN.
double to_number(const value& v);

/// parses \p key as a canonical non-negative decimal sequence index
/// \return the index, or -1 if \p key is not a canonical index
std::int64_t parse_index(std::string_view key);

/// writes the json representation of \p v to \p os
/// \details a top-level undefined value is written as undefined.
std::ostream& operator<<(std::ostream& os, const value& v);

/// Boost.JSON conversion customization
/// \details
///    undefined record members are omitted, undefined sequence elements
///    and a top-level undefined become null.
/// \{
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const value& v);
value tag_invoke(const boost::json::value_to_tag<value>&, const boost::json::value& jv);
/// \}

/// convenience wrappers around the Boost.JSON conversions
/// \{
boost::json::value to_json(const value& v);
value from_json(const boost::json::value& jv);
value parse(std::string_view json_text);
/// \}

} // namespace treeop
