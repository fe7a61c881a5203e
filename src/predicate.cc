/// implements the predicate evaluator

#include "treeop/predicate.hpp"

// standard headers
#include <algorithm>
#include <iostream>
#include <regex>

#include "treeop/details/cxx-compat.hpp"
#include "treeop/details/errors.hpp"

namespace treeop {

//
// predicate construction

predicate::predicate()
: knd(kind::all_of), lit(), alts(), flds(), opers(), fun()
{}

predicate::predicate(value v)
: predicate()
{
  if (v.is_sequence())
  {
    knd = kind::any_of;

    for (value& elem : v.as_sequence())
      alts.emplace_back(std::move(elem));
  }
  else if (v.is_record())
  {
    for (auto& [key, elem] : v.as_record())
      flds.emplace(key, predicate(std::move(elem)));
  }
  else
  {
    knd = kind::literal;
    lit = std::move(v);
  }
}

predicate::predicate(predicate_fn fn)
: predicate()
{
  knd = kind::function;
  fun = std::move(fn);
}

predicate predicate::literal_of(value v)
{
  predicate res;

  res.knd = kind::literal;
  res.lit = std::move(v);
  return res;
}

predicate predicate::any_of(std::vector<predicate> alternatives)
{
  predicate res;

  res.knd  = kind::any_of;
  res.alts = std::move(alternatives);
  return res;
}

void predicate::make_all_of()
{
  if (knd == kind::all_of) return;

  // a literal or alternatives cannot be combined with terms
  *this = predicate();
}

predicate& predicate::field(std::string name, predicate p)
{
  make_all_of();
  flds.insert_or_assign(std::move(name), std::move(p));
  return *this;
}

predicate& predicate::with(token t, predicate p)
{
  if (!is_predicate_token(t))
  {
    CXX_UNLIKELY;
    throw usage_error{"not a predicate operator: " + std::string(marker(t))};
  }

  if (is_comparison_token(t) && (p.type() != kind::literal))
  {
    CXX_UNLIKELY;
    throw usage_error{"operand of " + std::string(marker(t)) + " must be a literal"};
  }

  make_all_of();
  opers.insert_or_assign(t, std::move(p));
  return *this;
}

bool is_comparison_token(token t)
{
  switch (t)
  {
    case token::lt:
    case token::gt:
    case token::lte:
    case token::gte:
    case token::eq:
    case token::neq:
    case token::match:
      return true;

    default:
      ;
  }

  return false;
}

namespace {

predicate make_operator(token t, predicate operand)
{
  predicate res;

  res.with(t, std::move(operand));
  return res;
}

}  // namespace

predicate lt(value operand)  { return make_operator(token::lt,  predicate::literal_of(std::move(operand))); }
predicate gt(value operand)  { return make_operator(token::gt,  predicate::literal_of(std::move(operand))); }
predicate lte(value operand) { return make_operator(token::lte, predicate::literal_of(std::move(operand))); }
predicate gte(value operand) { return make_operator(token::gte, predicate::literal_of(std::move(operand))); }
predicate eq(value operand)  { return make_operator(token::eq,  predicate::literal_of(std::move(operand))); }
predicate neq(value operand) { return make_operator(token::neq, predicate::literal_of(std::move(operand))); }

predicate match(std::string pattern)
{
  return make_operator(token::match, predicate::literal_of(value(std::move(pattern))));
}

predicate not_(predicate operand) { return make_operator(token::not_, std::move(operand)); }
predicate all(predicate elem)     { return make_operator(token::all,  std::move(elem)); }
predicate some(predicate elem)    { return make_operator(token::some, std::move(elem)); }

predicate any_of(std::vector<predicate> alternatives)
{
  return predicate::any_of(std::move(alternatives));
}


//
// evaluation

namespace {

/// the three-way outcome of an ordering comparison
enum class ordering { less, equal, greater, unordered };

/// compares numbers and strings
/// \details
///    two strings compare lexicographically; a string compared with a
///    number is converted to a number. Any other pairing is unordered.
ordering compare(const value& lhs, const value& rhs)
{
  const bool lhsOrderable = lhs.is_number() || lhs.is_string();
  const bool rhsOrderable = rhs.is_number() || rhs.is_string();

  if (!lhsOrderable || !rhsOrderable)
    return ordering::unordered;

  if (lhs.is_string() && rhs.is_string())
  {
    const int cmp = lhs.as_string().compare(rhs.as_string());

    if (cmp < 0) return ordering::less;
    if (cmp > 0) return ordering::greater;
    return ordering::equal;
  }

  const double lnum = to_number(lhs);
  const double rnum = to_number(rhs);

  if (lnum < rnum)  return ordering::less;
  if (lnum > rnum)  return ordering::greater;
  if (lnum == rnum) return ordering::equal;

  // at least one NaN
  return ordering::unordered;
}

/// splits an operand in /pattern/flags notation
/// \details
///    a pattern without enclosing slashes is used as is.
std::regex make_regex(const std::string& operand)
{
  std::regex::flag_type flags = std::regex::ECMAScript;
  std::string_view      pattern = operand;
  const std::size_t     lastSlash = operand.rfind('/');

  if ((operand.size() >= 2) && (operand.front() == '/') && (lastSlash > 0))
  {
    pattern = std::string_view(operand).substr(1, lastSlash - 1);

    for (char fl : std::string_view(operand).substr(lastSlash + 1))
    {
      if (fl == 'i')
        flags |= std::regex::icase;
      else if (fl == 'm')
        flags |= std::regex::multiline;
      // remaining flags (g, s, u, y) have no equivalent and are ignored
    }
  }

  return std::regex(pattern.begin(), pattern.end(), flags);
}

struct evaluator
{
  evaluator(const context& c, std::ostream& out)
  : ctx(c), logger(out)
  {}

  bool eval(const value& v, const predicate& pred);

 private:
  bool eval_all_of(const value& v, const predicate& pred);
  bool eval_operator(const value& v, token t, const predicate& operand);
  bool eval_match(const value& v, const value& operand);

  template <class Fn>
  bool quantify(const value& v, Fn fn);

  const context& ctx;
  std::ostream&  logger;

  evaluator(const evaluator&)            = delete;
  evaluator(evaluator&&)                 = delete;
  evaluator& operator=(const evaluator&) = delete;
  evaluator& operator=(evaluator&&)      = delete;
};

bool evaluator::eval(const value& v, const predicate& pred)
{
  switch (pred.type())
  {
    case predicate::kind::literal:
      return v == pred.literal();

    case predicate::kind::any_of:
      {
        const std::vector<predicate>& alts = pred.alternatives();

        return std::any_of( alts.begin(), alts.end(),
                            [this, &v](const predicate& alt) -> bool
                            {
                              return eval(v, alt);
                            }
                          );
      }

    case predicate::kind::function:
      return pred.function()(v, ctx);

    default:
      ;
  }

  return eval_all_of(v, pred);
}

bool evaluator::eval_all_of(const value& v, const predicate& pred)
{
  for (const auto& [tok, operand] : pred.operators())
  {
    if (!eval_operator(v, tok, operand))
      return false;
  }

  const predicate::field_map& fields = pred.fields();

  if (fields.empty())
    return true;

  // field terms cannot address into scalars
  if (!v.is_container())
    return false;

  static const value undefined;

  for (const auto& [key, sub] : fields)
  {
    const value* elem = v.find(key);

    if (!eval(elem ? *elem : undefined, sub))
      return false;
  }

  return true;
}

template <class Fn>
bool evaluator::quantify(const value& v, Fn fn)
{
  if (v.is_sequence())
    return fn(v.as_sequence().begin(), v.as_sequence().end(), [](const value& elem) -> const value& { return elem; });

  const record& rec = v.as_record();

  return fn(rec.begin(), rec.end(), [](const record::value_type& kv) -> const value& { return kv.second; });
}

bool evaluator::eval_operator(const value& v, token t, const predicate& operand)
{
  switch (t)
  {
    case token::lt:
      return compare(v, operand.literal()) == ordering::less;

    case token::gt:
      return compare(v, operand.literal()) == ordering::greater;

    case token::lte:
      {
        const ordering ord = compare(v, operand.literal());

        return (ord == ordering::less) || (ord == ordering::equal);
      }

    case token::gte:
      {
        const ordering ord = compare(v, operand.literal());

        return (ord == ordering::greater) || (ord == ordering::equal);
      }

    case token::eq:
      return loose_equal(v, operand.literal());

    case token::neq:
      return !loose_equal(v, operand.literal());

    case token::not_:
      return !eval(v, operand);

    case token::match:
      return eval_match(v, operand.literal());

    case token::all:
      {
        if (!v.is_container()) return false;

        return quantify( v,
                         [this, &operand](auto aa, auto zz, auto get) -> bool
                         {
                           return std::all_of( aa, zz,
                                               [this, &operand, get](const auto& elem) -> bool
                                               {
                                                 return eval(get(elem), operand);
                                               }
                                             );
                         }
                       );
      }

    case token::some:
      {
        if (!v.is_container()) return false;

        return quantify( v,
                         [this, &operand](auto aa, auto zz, auto get) -> bool
                         {
                           return std::any_of( aa, zz,
                                               [this, &operand, get](const auto& elem) -> bool
                                               {
                                                 return eval(get(elem), operand);
                                               }
                                             );
                         }
                       );
      }

    default:
      ;
  }

  CXX_UNLIKELY;
  throw usage_error{"not a predicate operator: " + std::string(marker(t))};
}

bool evaluator::eval_match(const value& v, const value& operand)
{
  if (!v.is_string() || !operand.is_string())
    return false;

  try
  {
    const std::regex rgx = make_regex(operand.as_string());
    const std::string& str = v.as_string();

    return std::regex_search(str.begin(), str.end(), rgx);
  }
  catch (const std::regex_error& err)
  {
    logger << "invalid regular expression " << operand.as_string()
           << ": " << err.what() << std::endl;
  }

  return false;
}

}  // namespace


bool evaluate(const value& v, const predicate& pred, const context& ctx, std::ostream& logger)
{
  evaluator ev{ctx, logger};

  return ev.eval(v, pred);
}

bool evaluate(const value& v, const predicate& pred, const context& ctx)
{
  return evaluate(v, pred, ctx, std::cerr);
}

} // namespace treeop
