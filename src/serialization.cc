/// implements the json representation of statements and change records

#include "treeop/serialization.hpp"

// standard headers
#include <string>
#include <string_view>

// 3rd party headers
#include <boost/json.hpp>

#include "treeop/details/cxx-compat.hpp"
#include "treeop/details/errors.hpp"

namespace treeop {

namespace json = boost::json;

namespace {

/// the json object key holding the original values of a change record
constexpr std::string_view ORIGINAL_KEY = "original";

std::string subpath(const std::string& path, std::string_view segment)
{
  if (path.empty()) return std::string(segment);

  std::string res = path;

  res += '.';
  res += segment;
  return res;
}

CXX_NORETURN
void throw_function_error(const std::string& path)
{
  throw serialization_error{"functions cannot be serialized", path};
}

/// fails if a field name would be read back as a marker
void check_field_name(const std::string& path, const std::string& name)
{
  if (find_token(name))
  {
    CXX_UNLIKELY;
    throw serialization_error{"field name is a reserved marker", subpath(path, name)};
  }
}

std::string_view key_of(const json::key_value_pair& kv)
{
  return std::string_view(kv.key().data(), kv.key().size());
}

const json::object& expect_object(const json::value& jv, const std::string& path, const char* what)
{
  if (!jv.is_object())
  {
    CXX_UNLIKELY;
    throw serialization_error{std::string(what) + " must be a json object", path};
  }

  return jv.get_object();
}


//
// predicates

json::value write_predicate(const predicate& pred, const std::string& path)
{
  switch (pred.type())
  {
    case predicate::kind::literal:
      if (pred.literal().is_container())
      {
        CXX_UNLIKELY;
        throw serialization_error{"a literal container is read back as a predicate", path};
      }

      return to_json(pred.literal());

    case predicate::kind::any_of:
      {
        json::array res;
        std::size_t idx = 0;

        for (const predicate& alt : pred.alternatives())
          res.push_back(write_predicate(alt, subpath(path, std::to_string(idx++))));

        return res;
      }

    case predicate::kind::function:
      throw_function_error(path);

    default:
      ;
  }

  json::object res;

  for (const auto& [name, sub] : pred.fields())
  {
    check_field_name(path, name);
    res.emplace(name, write_predicate(sub, subpath(path, name)));
  }

  for (const auto& [tok, operand] : pred.operators())
  {
    const std::string_view mark = marker(tok);

    if (is_comparison_token(tok))
      res.emplace(mark, to_json(operand.literal()));
    else
      res.emplace(mark, write_predicate(operand, subpath(path, mark)));
  }

  return res;
}

predicate read_predicate(const json::value& jv, const std::string& path)
{
  if (jv.is_array())
  {
    std::vector<predicate> alts;
    std::size_t            idx = 0;

    for (const json::value& elem : jv.get_array())
      alts.push_back(read_predicate(elem, subpath(path, std::to_string(idx++))));

    return predicate::any_of(std::move(alts));
  }

  if (!jv.is_object())
    return predicate::literal_of(from_json(jv));

  predicate res;

  for (const json::key_value_pair& kv : jv.get_object())
  {
    const std::string_view     key = key_of(kv);
    const std::optional<token> tok = find_token(key);

    if (!tok)
    {
      res.field(std::string(key), read_predicate(kv.value(), subpath(path, key)));
      continue;
    }

    if (!is_predicate_token(*tok))
    {
      CXX_UNLIKELY;
      throw serialization_error{"marker " + std::string(key) + " is not valid in a predicate", subpath(path, key)};
    }

    if (is_comparison_token(*tok))
      res.with(*tok, predicate::literal_of(from_json(kv.value())));
    else
      res.with(*tok, read_predicate(kv.value(), subpath(path, key)));
  }

  return res;
}

void check_predicate(const predicate& pred, const std::string& path)
{
  switch (pred.type())
  {
    case predicate::kind::function:
      throw_function_error(path);

    case predicate::kind::any_of:
      {
        std::size_t idx = 0;

        for (const predicate& alt : pred.alternatives())
          check_predicate(alt, subpath(path, std::to_string(idx++)));

        return;
      }

    case predicate::kind::all_of:
      for (const auto& [name, sub] : pred.fields())
        check_predicate(sub, subpath(path, name));

      for (const auto& [tok, operand] : pred.operators())
        check_predicate(operand, subpath(path, marker(tok)));

      return;

    default:
      ;
  }
}


//
// select statements

json::value write_select(const select_statement& stmt, const std::string& path)
{
  switch (stmt.type())
  {
    case select_statement::kind::include:
      return true;

    case select_statement::kind::exclude:
      return false;

    default:
      ;
  }

  json::object res;

  for (const auto& [name, sub] : stmt.fields())
  {
    check_field_name(path, name);
    res.emplace(name, write_select(sub, subpath(path, name)));
  }

  if (const select_statement* sub = stmt.all())
    res.emplace(marker(token::all), write_select(*sub, subpath(path, marker(token::all))));

  if (const select_statement* sub = stmt.deep_all())
    res.emplace(marker(token::deep_all), write_select(*sub, subpath(path, marker(token::deep_all))));

  if (const predicate* guard = stmt.where())
    res.emplace(marker(token::where), write_predicate(*guard, subpath(path, marker(token::where))));

  return res;
}

select_statement read_select(const json::value& jv, const std::string& path)
{
  if (jv.is_bool())
    return select_statement(jv.get_bool());

  const json::object& obj = expect_object(jv, path, "a select statement other than true or false");
  select_statement    res;

  for (const json::key_value_pair& kv : obj)
  {
    const std::string_view     key = key_of(kv);
    const std::optional<token> tok = find_token(key);
    const std::string          sub = subpath(path, key);

    if (!tok)
    {
      res.field(std::string(key), read_select(kv.value(), sub));
      continue;
    }

    switch (*tok)
    {
      case token::all:
        res.with_all(read_select(kv.value(), sub));
        break;

      case token::deep_all:
        res.with_deep_all(read_select(kv.value(), sub));
        break;

      case token::where:
        res.with_where(read_predicate(kv.value(), sub));
        break;

      default:
        CXX_UNLIKELY;
        throw serialization_error{"marker " + std::string(key) + " is not valid in a select statement", sub};
    }
  }

  return res;
}

void check_select(const select_statement& stmt, const std::string& path)
{
  for (const auto& [name, sub] : stmt.fields())
    check_select(sub, subpath(path, name));

  if (const select_statement* sub = stmt.all())
    check_select(*sub, subpath(path, marker(token::all)));

  if (const select_statement* sub = stmt.deep_all())
    check_select(*sub, subpath(path, marker(token::deep_all)));

  if (const predicate* guard = stmt.where())
    check_predicate(*guard, subpath(path, marker(token::where)));
}


//
// update statements

json::value write_update(const update_statement& stmt, const std::string& path)
{
  switch (stmt.type())
  {
    case update_statement::kind::literal:
      return to_json(stmt.operand());

    case update_statement::kind::replace:
      {
        json::array res;

        res.push_back(to_json(stmt.operand()));
        return res;
      }

    case update_statement::kind::remove:
      return json::array();

    case update_statement::kind::transform:
      throw_function_error(path);

    default:
      ;
  }

  json::object res;

  for (const auto& [name, sub] : stmt.fields())
  {
    check_field_name(path, name);
    res.emplace(name, write_update(sub, subpath(path, name)));
  }

  if (const update_statement* sub = stmt.all())
    res.emplace(marker(token::all), write_update(*sub, subpath(path, marker(token::all))));

  if (const predicate* guard = stmt.where())
    res.emplace(marker(token::where), write_predicate(*guard, subpath(path, marker(token::where))));

  if (const value* dflt = stmt.default_value())
    res.emplace(marker(token::default_value), to_json(*dflt));

  if (const context* ctx = stmt.local_context())
    res.emplace(marker(token::context), to_json(value(*ctx)));

  return res;
}

update_statement read_update(const json::value& jv, const std::string& path)
{
  if (jv.is_array())
  {
    const json::array& arr = jv.get_array();

    if (arr.empty())
      return update_statement::remove();

    if (arr.size() > 1)
    {
      CXX_UNLIKELY;
      throw serialization_error{"a replacement holds exactly one value", path};
    }

    return update_statement::replace(from_json(arr.front()));
  }

  if (!jv.is_object())
    return update_statement(from_json(jv));

  update_statement res;

  for (const json::key_value_pair& kv : jv.get_object())
  {
    const std::string_view     key = key_of(kv);
    const std::optional<token> tok = find_token(key);
    const std::string          sub = subpath(path, key);

    if (!tok)
    {
      res.field(std::string(key), read_update(kv.value(), sub));
      continue;
    }

    switch (*tok)
    {
      case token::all:
        res.with_all(read_update(kv.value(), sub));
        break;

      case token::where:
        res.with_where(read_predicate(kv.value(), sub));
        break;

      case token::default_value:
        res.with_default(from_json(kv.value()));
        break;

      case token::context:
        {
          value ctx = from_json(expect_object(kv.value(), sub, "a context"));

          res.with_context(std::move(ctx.as_record()));
          break;
        }

      default:
        CXX_UNLIKELY;
        throw serialization_error{"marker " + std::string(key) + " is not valid in an update statement", sub};
    }
  }

  return res;
}

void check_update(const update_statement& stmt, const std::string& path)
{
  if (stmt.type() == update_statement::kind::transform)
    throw_function_error(path);

  for (const auto& [name, sub] : stmt.fields())
    check_update(sub, subpath(path, name));

  if (const update_statement* sub = stmt.all())
    check_update(*sub, subpath(path, marker(token::all)));

  if (const predicate* guard = stmt.where())
    check_predicate(*guard, subpath(path, marker(token::where)));
}


//
// change records

json::value write_changes(const change_record& changes, const std::string& path)
{
  json::object res;
  json::object originals;

  for (const auto& [key, change] : changes.values)
  {
    check_field_name(path, key);

    if (!change.current.is_undefined())
      res.emplace(key, to_json(change.current));

    json::object orig;

    if (!change.original.is_undefined())
      orig.emplace(ORIGINAL_KEY, to_json(change.original));

    originals.emplace(key, std::move(orig));
  }

  for (const auto& [key, sub] : changes.nested)
  {
    check_field_name(path, key);
    res.emplace(key, write_changes(sub, subpath(path, key)));
  }

  if (!originals.empty())
    res.emplace(marker(token::meta), std::move(originals));

  return res;
}

change_record read_changes(const json::value& jv, const std::string& path)
{
  const json::object& obj  = expect_object(jv, path, "a change record");
  const json::value*  meta = obj.if_contains(marker(token::meta));
  change_record       res;

  if (meta)
  {
    const std::string metapath = subpath(path, marker(token::meta));

    for (const json::key_value_pair& kv : expect_object(*meta, metapath, "the original values"))
    {
      const std::string_view key  = key_of(kv);
      const json::object&    orig = expect_object(kv.value(), subpath(metapath, key), "an original value");
      const json::value*     prev = orig.if_contains(ORIGINAL_KEY);
      const json::value*     now  = obj.if_contains(key);

      res.values.emplace( std::string(key),
                          value_change{ now  ? from_json(*now)  : value(),
                                        prev ? from_json(*prev) : value()
                                      }
                        );
    }
  }

  for (const json::key_value_pair& kv : obj)
  {
    const std::string_view key = key_of(kv);

    if (find_token(key))
    {
      if (find_token(key) == token::meta) continue;

      CXX_UNLIKELY;
      throw serialization_error{"marker " + std::string(key) + " is not valid in a change record", subpath(path, key)};
    }

    if (res.values.find(key) != res.values.end())
      continue;

    res.nested.emplace(std::string(key), read_changes(kv.value(), subpath(path, key)));
  }

  return res;
}

}  // namespace


json::value to_json(const update_statement& stmt) { return write_update(stmt, std::string{}); }
json::value to_json(const select_statement& stmt) { return write_select(stmt, std::string{}); }
json::value to_json(const predicate& pred)        { return write_predicate(pred, std::string{}); }
json::value to_json(const change_record& changes) { return write_changes(changes, std::string{}); }

update_statement update_from_json(const json::value& jv)       { return read_update(jv, std::string{}); }
select_statement select_from_json(const json::value& jv)       { return read_select(jv, std::string{}); }
predicate        predicate_from_json(const json::value& jv)    { return read_predicate(jv, std::string{}); }
change_record    change_record_from_json(const json::value& jv) { return read_changes(jv, std::string{}); }

bool validate_no_functions(const update_statement& stmt)
{
  check_update(stmt, std::string{});
  return true;
}

bool validate_no_functions(const select_statement& stmt)
{
  check_select(stmt, std::string{});
  return true;
}

bool validate_no_functions(const predicate& pred)
{
  check_predicate(pred, std::string{});
  return true;
}

} // namespace treeop
