#pragma once

/// \file
/// declarative queries and in-place updates of json-like trees
///
/// \code
///   treeop::value data = treeop::parse(R"({"user":{"name":"Alice","age":30}})");
///
///   auto changes = treeop::update(data, treeop::parse(R"({"user":{"age":31}})"));
///   // data is {"user":{"name":"Alice","age":31}}
///
///   treeop::undo(data, changes);
///   // data is {"user":{"name":"Alice","age":30}}
/// \endcode

#include "treeop/details/errors.hpp"
#include "treeop/operators.hpp"
#include "treeop/predicate.hpp"
#include "treeop/select.hpp"
#include "treeop/serialization.hpp"
#include "treeop/update.hpp"
#include "treeop/value.hpp"
