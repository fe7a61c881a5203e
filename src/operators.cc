/// implements the operator vocabulary

#include "treeop/operators.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace treeop {

namespace {

using marker_entry = std::pair<token, std::string_view>;

constexpr marker_entry markers[] = {
    { token::all,           "*"  },
    { token::deep_all,      "**" },
    { token::where,         "?"  },
    { token::default_value, "{}" },
    { token::context,       "$"  },
    { token::meta,          "#"  },
    { token::lt,            "<"  },
    { token::gt,            ">"  },
    { token::lte,           "<=" },
    { token::gte,           ">=" },
    { token::eq,            "==" },
    { token::neq,           "!=" },
    { token::not_,          "!"  },
    { token::match,         "~"  },
    { token::some,          "|"  }
  };

static_assert(std::size(markers) == std::size_t(token::some) + 1);

}  // namespace

std::string_view marker(token t)
{
  return markers[std::size_t(t)].second;
}

std::optional<token> find_token(std::string_view str)
{
  auto const lim = std::end(markers);
  auto const pos = std::find_if( std::begin(markers), lim,
                                 [str](const marker_entry& e) -> bool
                                 {
                                   return e.second == str;
                                 }
                               );

  if (pos == lim) return std::nullopt;

  return pos->first;
}

bool is_predicate_token(token t)
{
  switch (t)
  {
    case token::lt:
    case token::gt:
    case token::lte:
    case token::gte:
    case token::eq:
    case token::neq:
    case token::not_:
    case token::match:
    case token::all:
    case token::some:
      return true;

    default:
      ;
  }

  return false;
}

bool is_update_token(token t)
{
  return (  (t == token::all)
         || (t == token::where)
         || (t == token::default_value)
         || (t == token::context)
         );
}

bool is_select_token(token t)
{
  return (t == token::all) || (t == token::deep_all) || (t == token::where);
}

} // namespace treeop
