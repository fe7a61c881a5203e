#pragma once

#include <boost/json/fwd.hpp>

#include "treeop/predicate.hpp"
#include "treeop/select.hpp"
#include "treeop/update.hpp"

namespace treeop {

//
// json representation of statements and change records
//
// reserved keys are written as their markers (see operators.hpp); all other
// keys are field names. Functions have no json representation.

/// converts to json
/// \throws serialization_error if the argument contains a function, or a
///         field whose name is a reserved marker.
/// \{
boost::json::value to_json(const update_statement& stmt);
boost::json::value to_json(const select_statement& stmt);
boost::json::value to_json(const predicate& pred);
boost::json::value to_json(const change_record& changes);
/// \}

/// converts from json
/// \throws serialization_error if a marker is used where it is not valid,
///         or if the json does not have the required shape.
/// \{
update_statement update_from_json(const boost::json::value& jv);
select_statement select_from_json(const boost::json::value& jv);
predicate        predicate_from_json(const boost::json::value& jv);
change_record    change_record_from_json(const boost::json::value& jv);
/// \}

/// tests that a statement does not contain functions
/// \return true
/// \throws serialization_error naming the path of the first function found
/// \{
bool validate_no_functions(const update_statement& stmt);
bool validate_no_functions(const select_statement& stmt);
bool validate_no_functions(const predicate& pred);
/// \}

} // namespace treeop
