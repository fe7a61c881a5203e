/// implements the select engine

#include "treeop/select.hpp"

// standard headers
#include <algorithm>
#include <iostream>

#include "treeop/details/cxx-compat.hpp"
#include "treeop/details/errors.hpp"

namespace treeop {

//
// statement construction

select_statement::select_statement()
: knd(kind::fields), flds(), allsel(), deepsel(), guard()
{}

select_statement::select_statement(const value& v)
: select_statement()
{
  if (v.is_bool())
  {
    knd = std::get<bool>(v) ? kind::include : kind::exclude;
    return;
  }

  if (!v.is_record())
  {
    CXX_UNLIKELY;
    throw usage_error{"a select statement is a boolean or a record, got " + std::string(type_name(kind_of(v)))};
  }

  for (const auto& [key, sub] : v.as_record())
    flds.emplace(key, select_statement(sub));
}

void select_statement::make_fields()
{
  if (knd != kind::fields)
    *this = select_statement();
}

select_statement& select_statement::field(std::string name, select_statement sub)
{
  make_fields();
  flds.insert_or_assign(std::move(name), std::move(sub));
  return *this;
}

select_statement& select_statement::with_all(select_statement sub)
{
  make_fields();
  allsel = std::make_shared<const select_statement>(std::move(sub));
  return *this;
}

select_statement& select_statement::with_deep_all(select_statement pattern)
{
  make_fields();
  deepsel = std::make_shared<const select_statement>(std::move(pattern));
  return *this;
}

select_statement& select_statement::with_where(predicate pred)
{
  make_fields();
  guard = std::move(pred);
  return *this;
}

bool select_statement::has_selections() const
{
  return !flds.empty() || allsel || deepsel;
}


//
// selection

namespace {

/// merges \p src into \p dst
/// \details
///    records merge by key and sequences by position; on any other
///    conflict the value from \p src wins. An undefined \p src leaves
///    \p dst unchanged.
void deep_merge(value& dst, value src)
{
  if (src.is_undefined())
    return;

  if (dst.is_record() && src.is_record())
  {
    record& dstrec = dst.as_record();

    for (auto& [key, elem] : src.as_record())
    {
      auto pos = dstrec.find(key);

      if (pos == dstrec.end())
        dstrec.emplace(key, std::move(elem));
      else
        deep_merge(pos->second, std::move(elem));
    }

    return;
  }

  if (dst.is_sequence() && src.is_sequence())
  {
    sequence&         dstseq = dst.as_sequence();
    sequence&         srcseq = src.as_sequence();
    const std::size_t common = std::min(dstseq.size(), srcseq.size());

    for (std::size_t i = 0; i < common; ++i)
      deep_merge(dstseq[i], std::move(srcseq[i]));

    for (std::size_t i = common; i < srcseq.size(); ++i)
      dstseq.push_back(std::move(srcseq[i]));

    return;
  }

  dst = std::move(src);
}

/// collects results keyed by their key in the source container
/// \details
///    records keep their field names. Sequence results are kept by
///    source index and are either compacted (dense) or padded with
///    undefined holes (sparse) when the result is built.
struct partial_result
{
  explicit
  partial_result(const value& source)
  : fromSequence(source.is_sequence()), indexed(), named()
  {}

  void put(std::string_view key, value v)
  {
    if (fromSequence)
    {
      const std::int64_t idx = parse_index(key);

      // non-index keys cannot address sequence elements
      if (idx < 0) return;

      put(idx, std::move(v));
      return;
    }

    auto pos = named.find(key);

    if (pos == named.end())
      named.emplace(std::string(key), std::move(v));
    else
      deep_merge(pos->second, std::move(v));
  }

  void put(std::int64_t idx, value v)
  {
    auto pos = indexed.find(idx);

    if (pos == indexed.end())
      indexed.emplace(idx, std::move(v));
    else
      deep_merge(pos->second, std::move(v));
  }

  bool empty() const { return indexed.empty() && named.empty(); }

  std::optional<value> build(bool dense) &&
  {
    if (empty())
      return std::nullopt;

    if (!fromSequence)
      return value(std::move(named));

    sequence res;

    if (dense)
    {
      res.reserve(indexed.size());

      for (auto& [idx, elem] : indexed)
        res.push_back(std::move(elem));
    }
    else
    {
      res.resize(std::size_t(indexed.rbegin()->first) + 1);

      for (auto& [idx, elem] : indexed)
        res[idx] = std::move(elem);
    }

    return value(std::move(res));
  }

  const bool                                  fromSequence;
  boost::container::map<std::int64_t, value>  indexed;
  record                                      named;
};

/// calls \p fn with the key and value of each child of \p node
template <class Fn>
void for_each_child(const value& node, Fn fn)
{
  if (node.is_record())
  {
    for (const auto& [key, elem] : node.as_record())
      fn(std::string_view(key), elem);

    return;
  }

  const sequence& seq = node.as_sequence();

  for (std::size_t i = 0; i < seq.size(); ++i)
    fn(std::to_string(i), seq[i]);
}

struct selector
{
  explicit
  selector(std::ostream& out)
  : logger(out)
  {}

  std::optional<value> sel(const value& data, const select_statement& stmt);

 private:
  bool passes(const value& data, const select_statement& stmt);

  /// selects the explicit fields of \p stmt that exist in \p node
  void project_fields(const value& node, const select_statement& stmt, partial_result& res);

  /// applies the deep pattern to the children of \p node
  void deep_children(const value& node, const select_statement& pattern, partial_result& res);

  /// applies the deep pattern to a single child
  std::optional<value> deep_visit(const value& child, const select_statement& pattern);

  std::ostream& logger;

  selector(const selector&)            = delete;
  selector(selector&&)                 = delete;
  selector& operator=(const selector&) = delete;
  selector& operator=(selector&&)      = delete;
};

bool selector::passes(const value& data, const select_statement& stmt)
{
  const predicate* guard = stmt.where();

  return (guard == nullptr) || evaluate(data, *guard, context{}, logger);
}

std::optional<value>
selector::sel(const value& data, const select_statement& stmt)
{
  switch (stmt.type())
  {
    case select_statement::kind::include:
      return data;

    case select_statement::kind::exclude:
      return std::nullopt;

    default:
      ;
  }

  if (!passes(data, stmt))
    return std::nullopt;

  if (!stmt.has_selections())
    return data;

  // field selection into a scalar
  if (!data.is_container())
    return std::nullopt;

  static const value undefined;

  partial_result res{data};

  if (const select_statement* allstmt = stmt.all())
  {
    for_each_child( data,
                    [this, allstmt, &res](std::string_view key, const value& elem) -> void
                    {
                      if (std::optional<value> sub = sel(elem, *allstmt))
                        res.put(key, std::move(*sub));
                    }
                  );
  }

  for (const auto& [key, substmt] : stmt.fields())
  {
    // sequences are only addressed by canonical indices within range
    if (data.is_sequence())
    {
      const std::int64_t idx = parse_index(key);

      if ((idx < 0) || (idx >= std::int64_t(data.as_sequence().size())))
        continue;
    }

    const value* elem = data.find(key);

    if (std::optional<value> sub = sel(elem ? *elem : undefined, substmt))
      res.put(key, std::move(*sub));
  }

  if (const select_statement* pattern = stmt.deep_all())
    deep_children(data, *pattern, res);

  const bool dense = (stmt.all() != nullptr) || (stmt.deep_all() != nullptr);

  return std::move(res).build(dense);
}

void
selector::project_fields(const value& node, const select_statement& stmt, partial_result& res)
{
  for (const auto& [key, substmt] : stmt.fields())
  {
    const value* elem = node.find(key);

    if (elem == nullptr)
      continue;

    if (std::optional<value> sub = sel(*elem, substmt))
      res.put(key, std::move(*sub));
  }
}

void
selector::deep_children(const value& node, const select_statement& pattern, partial_result& res)
{
  for_each_child( node,
                  [this, &pattern, &res](std::string_view key, const value& child) -> void
                  {
                    if (std::optional<value> sub = deep_visit(child, pattern))
                      res.put(key, std::move(*sub));
                  }
                );
}

std::optional<value>
selector::deep_visit(const value& child, const select_statement& pattern)
{
  const predicate* guard = pattern.where();

  if (guard && evaluate(child, *guard, context{}, logger))
    return child;

  if (!child.is_container())
    return std::nullopt;

  partial_result res{child};

  deep_children(child, pattern, res);

  // with a guard, a node only contributes if one of its descendants matched
  if (guard && res.empty())
    return std::nullopt;

  project_fields(child, pattern, res);
  return std::move(res).build(true /* dense */);
}

}  // namespace


std::optional<value>
select(const value& data, const select_statement& stmt, std::ostream& logger)
{
  selector s{logger};

  return s.sel(data, stmt);
}

std::optional<value>
select(const value& data, const select_statement& stmt)
{
  return select(data, stmt, std::cerr);
}

} // namespace treeop
