#pragma once

#include <optional>
#include <string_view>

namespace treeop {

/// reserved operator tokens
/// \details
///    the same token may carry different meanings in update, select
///    and predicate statements. Statements hold tokens in dedicated
///    members, so a token never collides with a field name.
enum class token
{
  all,           ///< apply to every key (update, select, predicate quantifier)
  deep_all,      ///< recursive unbounded-depth selection (select)
  where,         ///< guard predicate (update, select)
  default_value, ///< value assigned before a partial update of a non-container
  context,       ///< inheritable context override (update)
  meta,          ///< original values in a change record
  lt,
  gt,
  lte,
  gte,
  eq,            ///< loose equality
  neq,           ///< loose inequality
  not_,          ///< negation
  match,         ///< regular expression test
  some           ///< existential quantifier
};

/// returns the string marker used for \p t in the json representation
std::string_view marker(token t);

/// returns the token whose marker is \p str, or std::nullopt
std::optional<token> find_token(std::string_view str);

/// tests if \p t may appear as an operator key in a predicate
bool is_predicate_token(token t);

/// tests if \p t may appear as a reserved key in an update statement
bool is_update_token(token t);

/// tests if \p t may appear as a reserved key in a select statement
bool is_select_token(token t);

} // namespace treeop
