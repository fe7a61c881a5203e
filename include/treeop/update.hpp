#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/container/map.hpp>

#include "treeop/predicate.hpp"
#include "treeop/value.hpp"

namespace treeop {

struct update_statement;

/// callback computing the update for a single key
/// \param current the value currently stored at \p key (undefined if absent)
/// \param parent  the container holding \p key
/// \param key     the resolved key; a decimal index for sequences
/// \param ctx     the context in effect at this level
using transform_fn = std::function<update_statement( const value& current,
                                                     const value& parent,
                                                     const std::string& key,
                                                     const context& ctx
                                                   )>;

/// a statement describing how to modify a value in place
/// \details
///    an update statement is one of
///    * literal:   assign a scalar
///    * transform: compute the statement from the current value
///    * fields:    partial update of a container, key by key, with an
///                 optional statement for all other keys (all), a guard
///                 (where), a value assigned to a non-container before
///                 the partial update (default_value) and an override of
///                 the inherited context (local_context).
///    * replace:   assign a value as a whole
///    * remove:    delete the key
struct update_statement
{
  enum class kind { literal, transform, fields, replace, remove };

  using field_map = boost::container::map<std::string, update_statement, std::less<>>;

  /// creates an empty fields statement
  update_statement();

  /// converts a value by shape
  /// \details
  ///    an empty sequence removes, a sequence with one element replaces
  ///    with the element, a record becomes a fields statement of its
  ///    converted members, and anything else is a literal.
  /// \throws usage_error if \p v is a sequence with more than one element
  update_statement(value v);

  update_statement(transform_fn fn);

  update_statement(const char* s)     : update_statement(value(s)) {}
  update_statement(int n)             : update_statement(value(n)) {}
  update_statement(std::int64_t n)    : update_statement(value(n)) {}
  update_statement(double n)          : update_statement(value(n)) {}
  update_statement(std::nullptr_t)    : update_statement(value(nullptr)) {}

  template <std::same_as<bool> B>
  update_statement(B b)               : update_statement(value(b)) {}

  /// creates a statement assigning \p v as a whole
  static update_statement replace(value v);

  /// creates a statement deleting the addressed key
  static update_statement remove();

  /// adds a field directive
  update_statement& field(std::string name, update_statement sub);

  /// sets the directive for all keys without an explicit directive
  update_statement& with_all(update_statement sub);

  update_statement& with_where(predicate guard);
  update_statement& with_default(value dflt);
  update_statement& with_context(context ctx);

  kind type() const { return knd; }

  /// the assigned value of literal and replace statements
  const value&            operand()       const { return val; }
  const transform_fn&     transform()     const { return fun; }
  const field_map&        fields()        const { return flds; }
  const update_statement* all()           const { return allupd.get(); }
  const predicate*        where()         const { return guard ? &*guard : nullptr; }
  const value*            default_value() const { return dflt ? &*dflt : nullptr; }
  const context*          local_context() const { return ctxovr ? &*ctxovr : nullptr; }

 private:
  void make_fields();

  kind                                    knd;
  value                                   val;
  transform_fn                            fun;
  field_map                               flds;
  std::shared_ptr<const update_statement> allupd;
  std::optional<predicate>                guard;
  std::optional<value>                    dflt;
  std::optional<context>                  ctxovr;
};


//
// change records

/// the new value of a changed key, and its value before the first change
struct value_change
{
  value current;
  value original;
};

/// a partial mirror of the updated data
/// \details
///    values holds keys whose value was assigned, replaced or removed,
///    nested holds the changes of keys that were partially updated.
///    A key is never in both maps.
struct change_record
{
  using value_map  = boost::container::map<std::string, value_change, std::less<>>;
  using nested_map = boost::container::map<std::string, change_record, std::less<>>;

  value_map  values;
  nested_map nested;

  bool empty() const { return values.empty() && nested.empty(); }
};

bool operator==(const value_change& lhs, const value_change& rhs);
bool operator==(const change_record& lhs, const change_record& rhs);


//
// update API

/// applies \p stmt to \p data
/// \param data     the updated container; modified in place
/// \param stmt     a fields statement
/// \param existing changes of earlier updates of \p data, which are
///                 extended by this update
/// \param ctx      the inherited context
/// \return the accumulated changes, or std::nullopt if there are none
/// \details
///    assigning a literal equal to the current value is not a change;
///    a replacement is recorded even if the values are equal.
/// \throws usage_error if \p stmt is not a fields statement, if \p data is
///         not a container, or if a partial update addresses a
///         non-container and no default value is given. Keys assigned
///         before the error are restored, so \p data is unchanged.
/// \{
std::optional<change_record>
update( value& data,
        const update_statement& stmt,
        std::optional<change_record> existing = std::nullopt,
        const context& ctx = {}
      );

std::optional<change_record>
update( value& data,
        const update_statement& stmt,
        std::optional<change_record> existing,
        const context& ctx,
        std::ostream& logger
      );
/// \}

/// restores the values recorded in \p changes
/// \{
void undo(value& data, const change_record& changes);
void undo(value& data, const std::optional<change_record>& changes);
/// \}


/// accumulates the changes of successive updates of the same data
class transaction
{
 public:
  explicit
  transaction(value& data);

  transaction(value& data, std::ostream& logger);

  /// updates the data and accumulates the changes
  transaction& apply(const update_statement& stmt);

  /// returns the accumulated changes and starts a new accumulation
  std::optional<change_record> commit();

  /// undoes the accumulated changes and starts a new accumulation
  void revert();

  const std::optional<change_record>& changes() const { return pending; }

 private:
  value&                       data;
  std::ostream&                logger;
  std::optional<change_record> pending;
};


//
// change detection

/// callback testing a single key of a change record
using change_detector_fn = std::function<bool(const std::string& key, const change_record& changes)>;

/// a detector mirroring the shape of the data
/// \details
///    a detector is either a function, or a set of field detectors
///    with an optional detector applied to every other changed key.
struct change_detector
{
  using field_map = boost::container::map<std::string, change_detector, std::less<>>;

  /// creates an empty detector
  change_detector();

  /// creates a function detector from any callable, including the
  /// built-in detectors any_change and type_change
  template <class Fn>
  requires (  !std::same_as<std::remove_cvref_t<Fn>, change_detector>
           && std::is_invocable_r_v<bool, Fn&, const std::string&, const change_record&>
           )
  change_detector(Fn fn)
  : fun(std::move(fn)), flds(), alldet()
  {}

  change_detector& field(std::string name, change_detector sub);
  change_detector& with_all(change_detector sub);

  bool is_function() const { return static_cast<bool>(fun); }

  const change_detector_fn& function() const { return fun; }
  const field_map&          fields()   const { return flds; }
  const change_detector*    all()      const { return alldet.get(); }

 private:
  change_detector_fn                     fun;
  field_map                              flds;
  std::shared_ptr<const change_detector> alldet;
};

/// tests if \p changes contain a change accepted by \p detector
/// \details
///    a function detector at the root is applied to every changed key.
///    A field detector on a key that was assigned as a whole is applied
///    to the keys of the new value, which count as changed and carry no
///    original.
/// \{
bool has_changes(const change_record& changes, const change_detector& detector);
bool has_changes(const std::optional<change_record>& changes, const change_detector& detector);
/// \}

/// accepts if \p key was changed
bool any_change(const std::string& key, const change_record& changes);

/// accepts if the kind of value at \p key differs from its original kind
/// \details
///    null and undefined are distinct kinds; integers and floating point
///    numbers are both numbers, sequences and records are both objects.
bool type_change(const std::string& key, const change_record& changes);

} // namespace treeop
