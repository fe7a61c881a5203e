/// implements the update engine, undo, transactions and change detection

#include "treeop/update.hpp"

// standard headers
#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

#include "treeop/details/cxx-compat.hpp"
#include "treeop/details/errors.hpp"

#ifndef TREEOP_TRACE
#define TREEOP_TRACE 0
#endif /* TREEOP_TRACE */

namespace {
constexpr bool TRACE_OUTPUT = TREEOP_TRACE;
}  // namespace

namespace treeop {

//
// statement construction

update_statement::update_statement()
: knd(kind::fields), val(), fun(), flds(), allupd(), guard(), dflt(), ctxovr()
{}

update_statement::update_statement(value v)
: update_statement()
{
  if (v.is_sequence())
  {
    sequence& seq = v.as_sequence();

    if (seq.size() > 1)
    {
      CXX_UNLIKELY;
      throw usage_error{"a replacement holds exactly one value, got " + std::to_string(seq.size())};
    }

    if (seq.empty())
    {
      knd = kind::remove;
      return;
    }

    knd = kind::replace;
    val = std::move(seq.front());
    return;
  }

  if (v.is_record())
  {
    for (auto& [key, elem] : v.as_record())
      flds.emplace(key, update_statement(std::move(elem)));

    return;
  }

  knd = kind::literal;
  val = std::move(v);
}

update_statement::update_statement(transform_fn fn)
: update_statement()
{
  knd = kind::transform;
  fun = std::move(fn);
}

update_statement update_statement::replace(value v)
{
  update_statement res;

  res.knd = kind::replace;
  res.val = std::move(v);
  return res;
}

update_statement update_statement::remove()
{
  update_statement res;

  res.knd = kind::remove;
  return res;
}

void update_statement::make_fields()
{
  if (knd != kind::fields)
    *this = update_statement();
}

update_statement& update_statement::field(std::string name, update_statement sub)
{
  make_fields();
  flds.insert_or_assign(std::move(name), std::move(sub));
  return *this;
}

update_statement& update_statement::with_all(update_statement sub)
{
  make_fields();
  allupd = std::make_shared<const update_statement>(std::move(sub));
  return *this;
}

update_statement& update_statement::with_where(predicate pred)
{
  make_fields();
  guard = std::move(pred);
  return *this;
}

update_statement& update_statement::with_default(value v)
{
  make_fields();
  dflt = std::move(v);
  return *this;
}

update_statement& update_statement::with_context(context c)
{
  make_fields();
  ctxovr = std::move(c);
  return *this;
}


//
// change records

bool operator==(const value_change& lhs, const value_change& rhs)
{
  return (lhs.current == rhs.current) && (lhs.original == rhs.original);
}

bool operator==(const change_record& lhs, const change_record& rhs)
{
  return (  std::equal(lhs.values.begin(), lhs.values.end(), rhs.values.begin(), rhs.values.end())
         && std::equal(lhs.nested.begin(), lhs.nested.end(), rhs.nested.begin(), rhs.nested.end())
         );
}


//
// undo

namespace {

void undo_record(record& rec, const change_record& changes)
{
  for (const auto& [key, sub] : changes.nested)
  {
    auto pos = rec.find(key);

    if (pos != rec.end())
      undo(pos->second, sub);
  }

  for (const auto& [key, change] : changes.values)
  {
    if (change.original.is_undefined())
      rec.erase(key);
    else
      rec.insert_or_assign(key, change.original);
  }
}

void undo_sequence(sequence& seq, const change_record& changes)
{
  for (const auto& [key, sub] : changes.nested)
  {
    const std::int64_t idx = parse_index(key);

    if ((idx >= 0) && (idx < std::int64_t(seq.size())))
      undo(seq[idx], sub);
  }

  using indexed_change = std::pair<std::int64_t, const value_change*>;

  std::vector<indexed_change> restored;

  for (const auto& [key, change] : changes.values)
  {
    const std::int64_t idx = parse_index(key);

    if (idx >= 0) restored.emplace_back(idx, &change);
  }

  // descending, so that appended elements are removed from the back
  std::sort( restored.begin(), restored.end(),
             [](const indexed_change& lhs, const indexed_change& rhs) -> bool
             {
               return lhs.first > rhs.first;
             }
           );

  for (const auto& [idx, change] : restored)
  {
    const std::size_t pos = std::size_t(idx);

    if (change->original.is_undefined())
    {
      if (pos + 1 == seq.size())
        seq.pop_back();
      else if (pos < seq.size())
        seq[pos] = value();

      continue;
    }

    if (pos >= seq.size())
      seq.resize(pos + 1);

    seq[pos] = change->original;
  }
}

}  // namespace

void undo(value& data, const change_record& changes)
{
  if (data.is_record())
    undo_record(data.as_record(), changes);
  else if (data.is_sequence())
    undo_sequence(data.as_sequence(), changes);
}

void undo(value& data, const std::optional<change_record>& changes)
{
  if (changes) undo(data, *changes);
}


//
// update

namespace {

/// merges the override of \p stmt into a copy of \p inherited
context merge_context(const context& inherited, const update_statement& stmt)
{
  context res = inherited;

  if (const context* ovr = stmt.local_context())
  {
    for (const auto& [key, elem] : *ovr)
      res.insert_or_assign(key, elem);
  }

  return res;
}

/// resolves a field name to a key of \p data
/// \return the key, or std::nullopt if the field does not address \p data
/// \details
///    for sequences, a decimal index up to the length (appending) and a
///    negative index -N (counting from the end) are valid.
std::optional<std::string> resolve_key(const value& data, const std::string& name)
{
  if (data.is_record())
    return name;

  const std::int64_t len = std::int64_t(data.as_sequence().size());

  if (!name.empty() && (name.front() == '-'))
  {
    const std::int64_t fromEnd = parse_index(std::string_view(name).substr(1));

    if ((fromEnd <= 0) || (fromEnd > len))
      return std::nullopt;

    return std::to_string(len - fromEnd);
  }

  const std::int64_t idx = parse_index(name);

  if ((idx < 0) || (idx > len))
    return std::nullopt;

  return name;
}

/// returns the existing keys of a container
/// \details undefined holes in sequences are not keys.
std::vector<std::string> keys_of(const value& data)
{
  std::vector<std::string> res;

  if (data.is_record())
  {
    for (const auto& [key, elem] : data.as_record())
      res.push_back(key);
  }
  else
  {
    const sequence&   seq = data.as_sequence();
    const std::size_t len = seq.size();

    for (std::size_t i = 0; i < len; ++i)
      if (!seq[i].is_undefined()) res.push_back(std::to_string(i));
  }

  return res;
}

/// the value a key held before an assignment
/// \details
///    path locates the container from the root of the update,
///    an empty previous denotes a key that did not exist.
struct journal_entry
{
  std::vector<std::string> path;
  std::string              key;
  std::optional<value>     previous;
};

struct updater
{
  explicit
  updater(std::ostream& out)
  : logger(out), location(), journal(), journaling(true)
  {}

  /// applies a fields statement to a container
  std::optional<change_record>
  upd(value& data, const update_statement& stmt, std::optional<change_record> existing, const context& inherited);

  /// restores every key assigned under \p root, latest first
  void rollback(value& root);

 private:
  /// applies a fields statement after its guard passed
  void apply_fields(value& data, const update_statement& stmt, change_record& changes, const context& ctx);

  /// applies \p stmt to the element \p key of \p data
  void apply_key(value& data, const std::string& key, const update_statement& stmt, change_record& changes, const context& ctx);

  /// applies a fields statement to the element \p key of \p data
  void apply_nested(value& data, const std::string& key, const update_statement& stmt, change_record& changes, const context& ctx);

  /// stores \p v at \p key; undefined removes a record field
  void assign(value& data, const std::string& key, value v);

  /// records that \p key changed from \p old to \p now
  /// \param replaced a replacement is kept even when it restores the original
  void record_change(change_record& changes, const std::string& key, value old, const value& now, bool replaced = false);

  bool passes(const value& data, const update_statement& stmt, const context& ctx);

  /// applies a fields statement to the container at \p key of \p data
  std::optional<change_record>
  descend(value& data, const std::string& key, const update_statement& stmt, std::optional<change_record> existing, const context& ctx);

  std::ostream&              logger;
  std::vector<std::string>   location;   ///< keys from the root to the updated container
  std::vector<journal_entry> journal;
  bool                       journaling; ///< false while a default value is prepared

  updater(const updater&)            = delete;
  updater(updater&&)                 = delete;
  updater& operator=(const updater&) = delete;
  updater& operator=(updater&&)      = delete;
};

bool updater::passes(const value& data, const update_statement& stmt, const context& ctx)
{
  const predicate* guard = stmt.where();

  return (guard == nullptr) || evaluate(data, *guard, ctx, logger);
}

std::optional<change_record>
updater::upd( value& data,
              const update_statement& stmt,
              std::optional<change_record> existing,
              const context& inherited
            )
{
  if (stmt.type() != update_statement::kind::fields)
  {
    CXX_UNLIKELY;
    throw usage_error{"the root of an update must be a fields statement"};
  }

  if (!data.is_container())
  {
    CXX_UNLIKELY;
    throw usage_error{"cannot update fields of a " + std::string(type_name(kind_of(data)))};
  }

  const context ctx     = merge_context(inherited, stmt);
  change_record changes = existing ? std::move(*existing) : change_record{};

  if (passes(data, stmt, ctx))
    apply_fields(data, stmt, changes, ctx);

  if (changes.empty())
    return std::nullopt;

  return changes;
}

void
updater::apply_fields(value& data, const update_statement& stmt, change_record& changes, const context& ctx)
{
  using directive = std::pair<std::string, const update_statement*>;

  std::vector<directive> directives;

  for (const auto& [name, sub] : stmt.fields())
  {
    if (std::optional<std::string> key = resolve_key(data, name))
      directives.emplace_back(std::move(*key), &sub);
  }

  if (const update_statement* allstmt = stmt.all())
  {
    auto isExplicit = [&directives](const std::string& key) -> bool
                      {
                        return std::any_of( directives.begin(), directives.end(),
                                            [&key](const directive& d) -> bool
                                            {
                                              return d.first == key;
                                            }
                                          );
                      };

    std::vector<directive> implied;

    for (std::string& key : keys_of(data))
    {
      if (!isExplicit(key))
        implied.emplace_back(std::move(key), allstmt);
    }

    directives.insert( directives.end(),
                       std::make_move_iterator(implied.begin()),
                       std::make_move_iterator(implied.end())
                     );
  }

  for (const directive& d : directives)
    apply_key(data, d.first, *d.second, changes, ctx);
}

void
updater::apply_key( value& data,
                    const std::string& key,
                    const update_statement& stmt,
                    change_record& changes,
                    const context& ctx
                  )
{
  static const value undefined;

  update_statement computed;
  const update_statement* eff = &stmt;

  while (eff->type() == update_statement::kind::transform)
  {
    const value* current = data.find(key);

    computed = eff->transform()(current ? *current : undefined, data, key, ctx);
    eff = &computed;
  }

  switch (eff->type())
  {
    case update_statement::kind::fields:
      apply_nested(data, key, *eff, changes, ctx);
      break;

    case update_statement::kind::remove:
      {
        const value* current = data.find(key);

        if ((current == nullptr) || current->is_undefined())
          break;

        value old = *current;

        assign(data, key, value());
        record_change(changes, key, std::move(old), undefined);
        break;
      }

    default:
      {
        // literal and replace; only a literal equal to the current value is a no-op
        const value* current  = data.find(key);
        const value& now      = eff->operand();
        const bool   replaced = (eff->type() == update_statement::kind::replace);

        if (!replaced && (now == (current ? *current : undefined)))
          break;

        value old = current ? *current : value();

        assign(data, key, now);
        record_change(changes, key, std::move(old), now, replaced);
      }
  }
}

void
updater::apply_nested( value& data,
                       const std::string& key,
                       const update_statement& stmt,
                       change_record& changes,
                       const context& ctx
                     )
{
  value* current = data.find(key);

  if (current && current->is_container())
  {
    auto tracked = changes.values.find(key);

    if (tracked != changes.values.end())
    {
      // the key is already tracked as a whole; refresh its current value
      descend(data, key, stmt, std::nullopt, ctx);

      tracked->second.current = *current;

      if (tracked->second.current == tracked->second.original)
        changes.values.erase(tracked);

      return;
    }

    std::optional<change_record> nested;
    auto pos = changes.nested.find(key);

    if (pos != changes.nested.end())
    {
      nested = std::move(pos->second);
      changes.nested.erase(pos);
    }

    if (std::optional<change_record> res = descend(data, key, stmt, std::move(nested), ctx))
      changes.nested.emplace(key, std::move(*res));

    return;
  }

  const context nestedCtx = merge_context(ctx, stmt);
  value         old       = current ? *current : value();

  if (!passes(old, stmt, nestedCtx))
    return;

  const value* dflt = stmt.default_value();

  if (dflt == nullptr)
  {
    CXX_UNLIKELY;
    throw usage_error{ "partial update of the " + std::string(type_name(kind_of(old)))
                     + " at '" + key + "' requires a default value"
                     };
  }

  value fresh = *dflt;

  if (!fresh.is_container())
  {
    CXX_UNLIKELY;
    throw usage_error{"the default value at '" + key + "' is not a container"};
  }

  // fresh is not part of the data yet; its own changes are not tracked
  change_record discarded;
  const bool    outer = journaling;

  journaling = false;
  apply_fields(fresh, stmt, discarded, nestedCtx);
  journaling = outer;

  assign(data, key, fresh);
  record_change(changes, key, std::move(old), fresh);
}

void updater::assign(value& data, const std::string& key, value v)
{
  if (journaling)
  {
    const value* prev = data.find(key);

    journal.push_back({location, key, prev ? std::optional<value>(*prev) : std::nullopt});
  }

  if (data.is_record())
  {
    record& rec = data.as_record();

    if (v.is_undefined())
      rec.erase(key);
    else
      rec.insert_or_assign(key, std::move(v));

    return;
  }

  sequence&         seq = data.as_sequence();
  const std::size_t idx = std::size_t(parse_index(key));

  if (idx < seq.size())
    seq[idx] = std::move(v);
  else if (idx == seq.size() && !v.is_undefined())
    seq.push_back(std::move(v));
}

std::optional<change_record>
updater::descend( value& data,
                  const std::string& key,
                  const update_statement& stmt,
                  std::optional<change_record> existing,
                  const context& ctx
                )
{
  location.push_back(key);

  std::optional<change_record> res = upd(*data.find(key), stmt, std::move(existing), ctx);

  location.pop_back();
  return res;
}

void updater::rollback(value& root)
{
  for (auto pos = journal.rbegin(); pos != journal.rend(); ++pos)
  {
    value* node = &root;

    for (const std::string& seg : pos->path)
      node = node ? node->find(seg) : nullptr;

    if ((node == nullptr) || !node->is_container())
    {
      CXX_UNLIKELY;
      logger << "rollback: lost container of " << pos->key << std::endl;
      continue;
    }

    if (node->is_record())
    {
      record& rec = node->as_record();

      if (pos->previous)
        rec.insert_or_assign(pos->key, *pos->previous);
      else
        rec.erase(pos->key);

      continue;
    }

    sequence&         seq = node->as_sequence();
    const std::size_t idx = std::size_t(parse_index(pos->key));

    if (pos->previous && (idx < seq.size()))
      seq[idx] = *pos->previous;
    else if (!pos->previous && (idx + 1 == seq.size()))
      seq.pop_back();
  }

  journal.clear();
}

void
updater::record_change(change_record& changes, const std::string& key, value old, const value& now, bool replaced)
{
  if (TRACE_OUTPUT)
    logger << "update " << key << ": " << old << " -> " << now << std::endl;

  // restore the pre-update value of a partially updated container
  auto nested = changes.nested.find(key);

  if (nested != changes.nested.end())
  {
    undo(old, nested->second);
    changes.nested.erase(nested);
  }

  auto pos = changes.values.find(key);

  if (pos == changes.values.end())
    pos = changes.values.emplace(key, value_change{now, std::move(old)}).first;
  else
    pos->second.current = now;

  if (!replaced && (pos->second.current == pos->second.original))
    changes.values.erase(pos);
}

}  // namespace


std::optional<change_record>
update( value& data,
        const update_statement& stmt,
        std::optional<change_record> existing,
        const context& ctx,
        std::ostream& logger
      )
{
  updater u{logger};

  try
  {
    return u.upd(data, stmt, std::move(existing), ctx);
  }
  catch (...)
  {
    // no partial update survives a failing statement
    u.rollback(data);
    throw;
  }
}

std::optional<change_record>
update( value& data,
        const update_statement& stmt,
        std::optional<change_record> existing,
        const context& ctx
      )
{
  return update(data, stmt, std::move(existing), ctx, std::cerr);
}


//
// transaction

transaction::transaction(value& d, std::ostream& out)
: data(d), logger(out), pending()
{}

transaction::transaction(value& d)
: transaction(d, std::cerr)
{}

transaction& transaction::apply(const update_statement& stmt)
{
  // pending stays intact if the update throws
  pending = update(data, stmt, pending, context{}, logger);
  return *this;
}

std::optional<change_record> transaction::commit()
{
  std::optional<change_record> res = std::move(pending);

  pending.reset();
  return res;
}

void transaction::revert()
{
  undo(data, pending);
  pending.reset();
}


//
// change detection

change_detector::change_detector()
: fun(), flds(), alldet()
{}

change_detector& change_detector::field(std::string name, change_detector sub)
{
  fun = nullptr;
  flds.insert_or_assign(std::move(name), std::move(sub));
  return *this;
}

change_detector& change_detector::with_all(change_detector sub)
{
  fun = nullptr;
  alldet = std::make_shared<const change_detector>(std::move(sub));
  return *this;
}

namespace {

/// describes a value assigned as a whole as a change record
/// \details
///    every key of \p v is a nested entry, so that any_change accepts it
///    and type_change, which needs an original, does not.
change_record assigned_changes(const value& v)
{
  change_record res;

  if (v.is_record())
  {
    for (const auto& [key, elem] : v.as_record())
      res.nested.emplace(key, assigned_changes(elem));
  }
  else if (v.is_sequence())
  {
    const sequence& seq = v.as_sequence();

    for (std::size_t i = 0; i < seq.size(); ++i)
      if (!seq[i].is_undefined()) res.nested.emplace(std::to_string(i), assigned_changes(seq[i]));
  }

  return res;
}

bool detect(const change_record& changes, const std::string& key, const change_detector& detector)
{
  if (detector.is_function())
    return detector.function()(key, changes);

  // a nested detector on a key assigned as a whole inspects the new value
  auto assigned = changes.values.find(key);

  if (assigned != changes.values.end())
    return has_changes(assigned_changes(assigned->second.current), detector);

  auto pos = changes.nested.find(key);

  return (pos != changes.nested.end()) && has_changes(pos->second, detector);
}

/// the kind compared by type_change; sequences and records are both objects
value_kind type_kind(const value& v)
{
  const value_kind res = kind_of(v);

  return (res == value_kind::sequence) ? value_kind::record : res;
}

}  // namespace

bool has_changes(const change_record& changes, const change_detector& detector)
{
  if (detector.is_function())
  {
    for (const auto& [key, change] : changes.values)
      if (detector.function()(key, changes)) return true;

    for (const auto& [key, sub] : changes.nested)
      if (detector.function()(key, changes)) return true;

    return false;
  }

  for (const auto& [key, sub] : detector.fields())
    if (detect(changes, key, sub)) return true;

  const change_detector* alldet = detector.all();

  if (alldet == nullptr)
    return false;

  auto isExplicit = [&detector](const std::string& key) -> bool
                    {
                      return detector.fields().find(key) != detector.fields().end();
                    };

  for (const auto& [key, change] : changes.values)
    if (!isExplicit(key) && detect(changes, key, *alldet)) return true;

  for (const auto& [key, sub] : changes.nested)
    if (!isExplicit(key) && detect(changes, key, *alldet)) return true;

  return false;
}

bool has_changes(const std::optional<change_record>& changes, const change_detector& detector)
{
  return changes && has_changes(*changes, detector);
}

bool any_change(const std::string& key, const change_record& changes)
{
  return (  (changes.values.find(key) != changes.values.end())
         || (changes.nested.find(key) != changes.nested.end())
         );
}

bool type_change(const std::string& key, const change_record& changes)
{
  auto pos = changes.values.find(key);

  if (pos == changes.values.end())
    return false;

  return type_kind(pos->second.current) != type_kind(pos->second.original);
}

} // namespace treeop
