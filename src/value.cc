/// implements the value model and its json conversions

#include "treeop/value.hpp"

// standard headers
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <ostream>

// 3rd party headers
#include <boost/json.hpp>

#include "treeop/details/cxx-compat.hpp"

namespace treeop {

namespace json = boost::json;

enum { undf_variant = 0,
       null_variant = 1,
       bool_variant = 2,
       int_variant  = 3,
       real_variant = 4,
       strg_variant = 5,
       sequ_variant = 6,
       recd_variant = 7
     };

static_assert(std::variant_size_v<value_base> == 8);
static_assert(std::is_same_v<std::monostate,
                             std::variant_alternative_t<undf_variant, value_base> >);
static_assert(std::is_same_v<std::int64_t,
                             std::variant_alternative_t<int_variant, value_base> >);
static_assert(std::is_same_v<double,
                             std::variant_alternative_t<real_variant, value_base> >);
static_assert(std::is_same_v<record,
                             std::variant_alternative_t<recd_variant, value_base> >);

namespace {

/// converts a string to a number following the usual scripting rules
/// \details
///    surrounding whitespace is ignored, an empty string is 0,
///    anything that is not a complete number is NaN.
double string_to_number(std::string_view str)
{
  auto isws = [](char c) -> bool { return std::isspace(static_cast<unsigned char>(c)); };

  while (!str.empty() && isws(str.front())) str.remove_prefix(1);
  while (!str.empty() && isws(str.back()))  str.remove_suffix(1);

  if (str.empty()) return 0;

  double     res = 0;
  const auto lim = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), lim, res);

  if ((ec != std::errc{}) || (ptr != lim))
    return std::numeric_limits<double>::quiet_NaN();

  return res;
}

bool equal_numbers(const value& lhs, const value& rhs)
{
  if ((lhs.index() == int_variant) && (rhs.index() == int_variant))
    return std::get<std::int64_t>(lhs) == std::get<std::int64_t>(rhs);

  return lhs.as_number() == rhs.as_number();
}

}  // namespace


bool value::is_number() const
{
  return (index() == int_variant) || (index() == real_variant);
}

double value::as_number() const
{
  if (index() == int_variant)
    return static_cast<double>(std::get<std::int64_t>(*this));

  return std::get<double>(*this);
}

const value* value::find(std::string_view key) const
{
  if (const record* rec = std::get_if<record>(this))
  {
    CXX_LIKELY;
    auto pos = rec->find(key);

    return pos != rec->end() ? &pos->second : nullptr;
  }

  if (const sequence* seq = std::get_if<sequence>(this))
  {
    const std::int64_t idx = parse_index(key);

    if ((idx < 0) || (idx >= std::int64_t(seq->size())))
      return nullptr;

    return &(*seq)[idx];
  }

  return nullptr;
}

value* value::find(std::string_view key)
{
  const value& self = *this;

  return const_cast<value*>(self.find(key));
}


value_kind kind_of(const value& v)
{
  switch (v.index())
  {
    case undf_variant: return value_kind::undefined;
    case null_variant: return value_kind::null;
    case bool_variant: return value_kind::boolean;
    case int_variant:
    case real_variant: return value_kind::number;
    case strg_variant: return value_kind::string;
    case sequ_variant: return value_kind::sequence;
    default:
      ;
  }

  return value_kind::record;
}

std::string_view type_name(value_kind k)
{
  switch (k)
  {
    case value_kind::undefined: return "undefined";
    case value_kind::null:      return "null";
    case value_kind::boolean:   return "boolean";
    case value_kind::number:    return "number";
    case value_kind::string:    return "string";
    case value_kind::sequence:  return "sequence";
    case value_kind::record:    return "record";
  }

  return "unknown";
}


bool operator==(const value& lhs, const value& rhs)
{
  if (lhs.is_number() && rhs.is_number())
    return equal_numbers(lhs, rhs);

  if (lhs.index() != rhs.index())
    return false;

  switch (lhs.index())
  {
    case undf_variant:
    case null_variant:
      return true;

    case bool_variant:
      return std::get<bool>(lhs) == std::get<bool>(rhs);

    case strg_variant:
      return lhs.as_string() == rhs.as_string();

    case sequ_variant:
      {
        const sequence& lseq = lhs.as_sequence();
        const sequence& rseq = rhs.as_sequence();

        return std::equal(lseq.begin(), lseq.end(), rseq.begin(), rseq.end());
      }

    default:
      ;
  }

  const record& lrec = lhs.as_record();
  const record& rrec = rhs.as_record();

  if (lrec.size() != rrec.size())
    return false;

  auto rpos = rrec.begin();

  for (const auto& [key, val] : lrec)
  {
    if ((key != rpos->first) || (val != rpos->second))
      return false;

    ++rpos;
  }

  return true;
}

bool operator!=(const value& lhs, const value& rhs)
{
  return !(lhs == rhs);
}

bool loose_equal(const value& lhs, const value& rhs)
{
  if (lhs.is_nullish() || rhs.is_nullish())
    return lhs.is_nullish() && rhs.is_nullish();

  if (kind_of(lhs) == kind_of(rhs))
    return lhs == rhs;

  // mixed scalars compare numerically
  if (lhs.is_container() || rhs.is_container())
    return false;

  return to_number(lhs) == to_number(rhs);
}

double to_number(const value& v)
{
  switch (v.index())
  {
    case null_variant:
      return 0;

    case bool_variant:
      return std::get<bool>(v) ? 1 : 0;

    case int_variant:
    case real_variant:
      return v.as_number();

    case strg_variant:
      return string_to_number(v.as_string());

    default:
      ;
  }

  return std::numeric_limits<double>::quiet_NaN();
}

std::int64_t parse_index(std::string_view key)
{
  if (key.empty() || ((key.size() > 1) && (key.front() == '0')))
    return -1;

  std::int64_t res = -1;
  const auto   lim = key.data() + key.size();
  auto [ptr, ec]   = std::from_chars(key.data(), lim, res);

  if ((ec != std::errc{}) || (ptr != lim) || (res < 0))
  {
    CXX_UNLIKELY;
    return -1;
  }

  return res;
}

std::ostream& operator<<(std::ostream& os, const value& v)
{
  if (v.is_undefined())
    return os << "undefined";

  return os << to_json(v);
}


void tag_invoke(const json::value_from_tag&, json::value& jv, const value& v)
{
  switch (v.index())
  {
    case undf_variant:
    case null_variant:
      jv = nullptr;
      break;

    case bool_variant:
      jv = std::get<bool>(v);
      break;

    case int_variant:
      jv = std::get<std::int64_t>(v);
      break;

    case real_variant:
      jv = std::get<double>(v);
      break;

    case strg_variant:
      jv.emplace_string() = v.as_string();
      break;

    case sequ_variant:
      {
        json::array& arr = jv.emplace_array();

        arr.reserve(v.as_sequence().size());
        for (const value& elem : v.as_sequence())
          arr.push_back(json::value_from(elem, arr.storage()));

        break;
      }

    default:
      {
        json::object& obj = jv.emplace_object();

        for (const auto& [key, elem] : v.as_record())
        {
          if (elem.is_undefined()) continue;

          obj.emplace(key, json::value_from(elem, obj.storage()));
        }
      }
  }
}

value tag_invoke(const json::value_to_tag<value>&, const json::value& jv)
{
  switch (jv.kind())
  {
    case json::kind::null:
      return value(nullptr);

    case json::kind::bool_:
      return value(jv.get_bool());

    case json::kind::int64:
      return value(jv.get_int64());

    case json::kind::uint64:
      {
        const std::uint64_t num = jv.get_uint64();

        if (num <= std::uint64_t(std::numeric_limits<std::int64_t>::max()))
          return value(std::int64_t(num));

        return value(double(num));
      }

    case json::kind::double_:
      return value(jv.get_double());

    case json::kind::string:
      {
        const json::string& str = jv.get_string();

        return value(std::string(str.data(), str.size()));
      }

    case json::kind::array:
      {
        sequence res;

        res.reserve(jv.get_array().size());
        for (const json::value& elem : jv.get_array())
          res.push_back(json::value_to<value>(elem));

        return value(std::move(res));
      }

    default:
      ;
  }

  record res;

  for (const json::key_value_pair& kv : jv.get_object())
    res.emplace(std::string(kv.key()), json::value_to<value>(kv.value()));

  return value(std::move(res));
}

json::value to_json(const value& v)
{
  return json::value_from(v);
}

value from_json(const json::value& jv)
{
  return json::value_to<value>(jv);
}

value parse(std::string_view json_text)
{
  return from_json(json::parse(json_text));
}

} // namespace treeop
