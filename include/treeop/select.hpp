#pragma once

#include <concepts>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include <boost/container/map.hpp>

#include "treeop/predicate.hpp"
#include "treeop/value.hpp"

namespace treeop {

/// a statement describing which parts of a value to extract
/// \details
///    a select statement is one of
///    * include: the whole value
///    * exclude: nothing
///    * fields:  explicit field selections, optionally combined with
///               a selection applied to every element (all), a
///               recursive selection (deep_all) and a guard (where).
///               A fields statement without any selection includes
///               the whole value.
struct select_statement
{
  enum class kind { include, exclude, fields };

  using field_map = boost::container::map<std::string, select_statement, std::less<>>;

  /// creates an empty fields statement
  select_statement();

  /// creates an include (true) or exclude (false) statement
  template <std::same_as<bool> B>
  select_statement(B incl)
  : select_statement()
  {
    knd = incl ? kind::include : kind::exclude;
  }

  /// creates a statement from the shape of \p v
  /// \details
  ///    booleans become include or exclude, records become fields
  ///    statements of their converted members.
  /// \throws usage_error for any other value
  explicit
  select_statement(const value& v);

  /// adds a field selection
  select_statement& field(std::string name, select_statement sub);

  /// sets the selection applied to every element
  select_statement& with_all(select_statement sub);

  /// sets the recursive selection pattern
  select_statement& with_deep_all(select_statement pattern);

  /// sets the guard
  select_statement& with_where(predicate guard);

  kind type() const { return knd; }

  const field_map&        fields()   const { return flds; }
  const select_statement* all()      const { return allsel.get(); }
  const select_statement* deep_all() const { return deepsel.get(); }
  const predicate*        where()    const { return guard ? &*guard : nullptr; }

  /// true if the statement selects anything beyond the guard
  bool has_selections() const;

 private:
  void make_fields();

  kind                                    knd;
  field_map                               flds;
  std::shared_ptr<const select_statement> allsel;
  std::shared_ptr<const select_statement> deepsel;
  std::optional<predicate>                guard;
};

/// extracts the parts of \p data described by \p stmt
/// \return the selection, or std::nullopt if nothing was selected
/// \details
///    a requested record field that does not exist in \p data is returned
///    as undefined. Sequence indices past the end are ignored.
/// \{
std::optional<value> select(const value& data, const select_statement& stmt);
std::optional<value> select(const value& data, const select_statement& stmt, std::ostream& logger);
/// \}

} // namespace treeop
