#include <boost/json.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/range/adaptor/transformed.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

#include "treeop/treeop.hpp"

namespace bjsn = boost::json;

bjsn::value parseStream(std::istream &inps) {
  bjsn::stream_parser p;
  std::string line;

  while (std::getline(inps, line)) {
    std::error_code ec;

    p.write(line.c_str(), line.size(), ec);

    if (ec) return nullptr;
  }

  std::error_code ec;
  p.finish(ec);
  if (ec) return nullptr;

  return p.release();
}

bjsn::value parseFile(const std::string &filename) {
  std::ifstream is{filename};

  return parseStream(is);
}

template <class N, class T>
bool matchOpt1(const std::vector<std::string> &args, N &pos, std::string opt,
               T &fld) {
  std::string arg(args.at(pos));

  if (arg.find(opt) != 0) return false;

  ++pos;
  fld = boost::lexical_cast<T>(args.at(pos));
  ++pos;
  return true;
}

template <class N, class Fn>
bool matchOpt0(const std::vector<std::string> &args, N &pos, std::string opt,
               Fn fn) {
  std::string arg(args.at(pos));

  if (arg.find(opt) != 0) return false;

  fn();
  ++pos;
  return true;
}

template <class N, class Fn>
bool noSwitch0(const std::vector<std::string> &args, N &pos, Fn fn) {
  if (!fn(args[pos]))
    std::cerr << "unrecognized argument: " << args[pos] << std::endl;

  ++pos;
  return false;
}

bool endsWith(const std::string &str, const std::string &suffix) {
  return (str.size() >= suffix.size() &&
          std::equal(suffix.rbegin(), suffix.rend(), str.rbegin()));
}

struct settings {
  bool verbose = false;
  long selected_case = -1;
  std::string filename = {};
};

/// thrown when a test case is malformed
struct test_case_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

const bjsn::value &field(const bjsn::object &testcase, std::string_view name) {
  const bjsn::value *res = testcase.if_contains(name);

  if (res == nullptr)
    throw test_case_error{"missing field: " + std::string(name)};

  return *res;
}

std::string fieldString(const bjsn::object &testcase, std::string_view name,
                        std::string dflt = {}) {
  const bjsn::value *res = testcase.if_contains(name);

  if (res == nullptr) return dflt;

  return std::string(res->as_string().data(), res->as_string().size());
}

/// builds a change detector from its json description
/// \details
///    "any" and "type" denote the built-in detectors; objects describe
///    nested detectors with "*" for all other keys.
treeop::change_detector detectorFromJson(const bjsn::value &jv) {
  if (jv.is_string()) {
    if (jv.get_string() == "any") return treeop::change_detector(treeop::any_change);
    if (jv.get_string() == "type") return treeop::change_detector(treeop::type_change);

    throw test_case_error{"unknown detector"};
  }

  treeop::change_detector res;

  for (const bjsn::key_value_pair &kv : jv.as_object()) {
    std::string key(kv.key().data(), kv.key().size());

    if (key == treeop::marker(treeop::token::all))
      res.with_all(detectorFromJson(kv.value()));
    else
      res.field(key, detectorFromJson(kv.value()));
  }

  return res;
}

bjsn::value toJson(const std::optional<treeop::change_record> &changes) {
  if (!changes) return "<absent>";

  return treeop::to_json(*changes);
}

bjsn::value toJson(const std::optional<treeop::value> &val) {
  if (!val) return "<absent>";

  return treeop::to_json(*val);
}

/// compares \p got with the field \p name of the test case, if present
int check(const settings &config, const bjsn::object &testcase,
          std::string_view name, const bjsn::value &got) {
  const bjsn::value *expected = testcase.if_contains(name);

  if (expected == nullptr) return 0;

  if (*expected == got) return 0;

  if (config.verbose)
    std::cerr << "  " << name << " mismatch"
              << "\n    exp: " << *expected
              << "\n    got: " << got << std::endl;

  return 1;
}

int runCase(const settings &config, const bjsn::object &testcase) {
  const std::string op = fieldString(testcase, "op");
  treeop::value data;

  if (const bjsn::value *dat = testcase.if_contains("data"))
    data = treeop::from_json(*dat);

  if (op == "predicate") {
    const bool res = treeop::evaluate(
        data, treeop::predicate_from_json(field(testcase, "statement")));

    return check(config, testcase, "expected", res);
  }

  if (op == "select") {
    std::optional<treeop::value> res =
        treeop::select(data, treeop::select_from_json(field(testcase, "statement")));

    return check(config, testcase, "expected", toJson(res));
  }

  std::optional<treeop::change_record> existing;

  if (const bjsn::value *chg = testcase.if_contains("changes"))
    existing = treeop::change_record_from_json(*chg);

  if (op == "update" || op == "update_undo") {
    const treeop::value original = data;
    std::optional<treeop::change_record> res = treeop::update(
        data, treeop::update_from_json(field(testcase, "statement")),
        std::move(existing));

    int errors = check(config, testcase, "expected", toJson(res)) +
                 check(config, testcase, "expected_data", treeop::to_json(data));

    if (op == "update_undo") {
      treeop::undo(data, res);

      if (data != original) {
        if (config.verbose)
          std::cerr << "  undo did not restore the data: " << data << std::endl;

        ++errors;
      }
    }

    return errors;
  }

  if (op == "undo") {
    treeop::undo(data, existing);

    return check(config, testcase, "expected_data", treeop::to_json(data));
  }

  if (op == "transaction") {
    treeop::transaction trans{data};
    const bjsn::array &stmts = field(testcase, "statement").as_array();

    for (const treeop::update_statement &stmt :
         stmts | boost::adaptors::transformed(treeop::update_from_json))
      trans.apply(stmt);

    bjsn::value res = "<reverted>";

    if (fieldString(testcase, "finish", "commit") == "commit")
      res = toJson(trans.commit());
    else
      trans.revert();

    return check(config, testcase, "expected", res) +
           check(config, testcase, "expected_data", treeop::to_json(data));
  }

  if (op == "has_changes") {
    const bool res = treeop::has_changes(
        existing, detectorFromJson(field(testcase, "statement")));

    return check(config, testcase, "expected", res);
  }

  if (op == "roundtrip") {
    const bjsn::value &stmt = field(testcase, "statement");
    const std::string kind = fieldString(testcase, "kind", "update");
    bjsn::value res;

    if (kind == "update")
      res = treeop::to_json(treeop::update_from_json(stmt));
    else if (kind == "select")
      res = treeop::to_json(treeop::select_from_json(stmt));
    else if (kind == "predicate")
      res = treeop::to_json(treeop::predicate_from_json(stmt));
    else if (kind == "changes")
      res = treeop::to_json(treeop::change_record_from_json(stmt));
    else
      throw test_case_error{"unknown roundtrip kind: " + kind};

    if (testcase.contains("expected"))
      return check(config, testcase, "expected", res);

    if (res == stmt) return 0;

    if (config.verbose)
      std::cerr << "  roundtrip mismatch"
                << "\n    exp: " << stmt
                << "\n    got: " << res << std::endl;

    return 1;
  }

  throw test_case_error{"unknown op: " + op};
}

/// runs a test case and checks the expected error, if any
int runGuarded(const settings &config, const bjsn::object &testcase) {
  const std::string expectedError = fieldString(testcase, "expected_error");

  try {
    const int errors = runCase(config, testcase);

    if (expectedError.empty()) return errors;

    if (config.verbose)
      std::cerr << "  expected " << expectedError << " error" << std::endl;
  } catch (const treeop::usage_error &ex) {
    if (config.verbose) std::cerr << "  caught usage error: " << ex.what() << std::endl;

    if (expectedError == "usage") return 0;
  } catch (const treeop::serialization_error &ex) {
    if (config.verbose)
      std::cerr << "  caught serialization error: " << ex.what() << std::endl;

    if (expectedError == "serialization") {
      return fieldString(testcase, "expected_path", ex.path()) != ex.path();
    }
  } catch (const test_case_error &) {
    throw;
  } catch (const std::exception &ex) {
    if (config.verbose) std::cerr << "  caught error: " << ex.what() << std::endl;
  }

  return 1;
}

int main(int argc, const char **argv) {
  constexpr bool MATCH = false;

  int errorCode = 0;
  settings config;
  std::vector<std::string> arguments(argv, argv + argc);
  size_t argn = 1;

  auto setVerbose = [&config]() -> void { config.verbose = true; };
  auto setFile = [&config](const std::string &name) -> bool {
    const bool jsonFile = endsWith(name, ".json");

    if (jsonFile) config.filename = name;

    return jsonFile;
  };

  while (argn < arguments.size()) {
    // clang-format off
    MATCH
    || matchOpt0(arguments, argn, "-v", setVerbose)
    || matchOpt0(arguments, argn, "--verbose", setVerbose)
    || matchOpt1(arguments, argn, "-n", config.selected_case)
    || matchOpt1(arguments, argn, "--case", config.selected_case)
    || noSwitch0(arguments, argn, setFile)
    ;
    // clang-format on
  }

  bjsn::value all = config.filename.empty() ? parseStream(std::cin)
                                            : parseFile(config.filename);

  if (!all.is_array()) {
    std::cerr << "expected an array of test cases" << std::endl;
    return 1;
  }

  const bjsn::array &cases = all.as_array();

  for (size_t i = 0; i < cases.size(); ++i) {
    if ((config.selected_case >= 0) && (size_t(config.selected_case) != i))
      continue;

    const bjsn::object &testcase = cases[i].as_object();
    const std::string name = fieldString(testcase, "name", std::to_string(i));

    if (config.verbose) std::cerr << "[" << i << "] " << name << std::endl;

    int caseErrors = 0;

    try {
      caseErrors = runGuarded(config, testcase);
    } catch (const test_case_error &ex) {
      std::cerr << "malformed test case " << name << ": " << ex.what() << std::endl;
      caseErrors = 1;
    }

    if (caseErrors) std::cerr << "test failed: " << name << std::endl;

    errorCode += caseErrors;
  }

  if (config.verbose && errorCode)
    std::cerr << "errorCode: " << errorCode << std::endl;

  return errorCode;
}
