#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include <boost/container/map.hpp>

#include "treeop/operators.hpp"
#include "treeop/value.hpp"

namespace treeop {

/// boolean callback used in place of a predicate
using predicate_fn = std::function<bool(const value&, const context&)>;

/// a boolean expression evaluated against a value
/// \details
///    a predicate is one of
///    * literal:  strict equality with a value
///    * any_of:   logical or over alternatives; false when empty
///    * all_of:   logical and over field terms and operator terms; true when empty
///    * function: a user supplied callback
struct predicate
{
  enum class kind { literal, any_of, all_of, function };

  using field_map    = boost::container::map<std::string, predicate, std::less<>>;
  using operator_map = boost::container::map<token, predicate>;

  /// creates the empty all_of predicate, which accepts everything
  predicate();

  /// creates a predicate from the shape of \p v
  /// \details
  ///    a sequence becomes any_of over its elements, a record becomes
  ///    all_of over its fields, anything else is a literal.
  predicate(value v);

  predicate(predicate_fn fn);

  predicate(const char* s) : predicate(value(s)) {}

  /// \note constrained, so that lambdas do not convert through a function pointer
  template <std::same_as<bool> B>
  predicate(B b)           : predicate(value(b)) {}

  predicate(int n)         : predicate(value(n)) {}
  predicate(std::int64_t n): predicate(value(n)) {}
  predicate(std::nullptr_t): predicate(value(nullptr)) {}
  predicate(double n)      : predicate(value(n)) {}

  /// creates a literal predicate regardless of the shape of \p v
  static predicate literal_of(value v);

  /// creates an any_of predicate
  static predicate any_of(std::vector<predicate> alternatives);

  /// adds a field term
  /// \details turns the predicate into an all_of predicate.
  predicate& field(std::string name, predicate p);

  /// adds an operator term
  /// \details turns the predicate into an all_of predicate.
  /// \throws usage_error if \p t is not a predicate operator, or if a
  ///         comparison operator receives a non-literal operand.
  predicate& with(token t, predicate p);

  kind type() const { return knd; }

  /// accessors
  /// \pre the predicate is of the corresponding kind
  /// \{
  const value&                  literal()      const { return lit; }
  const std::vector<predicate>& alternatives() const { return alts; }
  const field_map&              fields()       const { return flds; }
  const operator_map&           operators()    const { return opers; }
  const predicate_fn&           function()     const { return fun; }
  /// \}

 private:
  void make_all_of();

  kind                   knd;
  value                  lit;
  std::vector<predicate> alts;
  field_map              flds;
  operator_map           opers;
  predicate_fn           fun;
};

/// tests if \p t is an ordering, equality or match operator
bool is_comparison_token(token t);

/// named constructors for operator predicates
/// \{
predicate lt(value operand);
predicate gt(value operand);
predicate lte(value operand);
predicate gte(value operand);
predicate eq(value operand);
predicate neq(value operand);
predicate match(std::string pattern);
predicate not_(predicate operand);
predicate all(predicate elem);
predicate some(predicate elem);
predicate any_of(std::vector<predicate> alternatives);
/// \}

/// evaluates the predicate \p pred against \p v
/// \param v    the tested value
/// \param pred the predicate
/// \param ctx  the context passed to function predicates
/// \param logger diagnostics stream (e.g., invalid regular expressions)
/// \{
bool evaluate(const value& v, const predicate& pred, const context& ctx = {});
bool evaluate(const value& v, const predicate& pred, const context& ctx, std::ostream& logger);
/// \}

} // namespace treeop
