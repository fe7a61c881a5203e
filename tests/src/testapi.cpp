#include <boost/json.hpp>
#include <iostream>
#include <sstream>
#include <string>

#include "treeop/treeop.hpp"

namespace {

int errorCode = 0;

void expect(bool cond, const std::string &what) {
  if (cond) return;

  std::cerr << "test failed: " << what << std::endl;
  ++errorCode;
}

template <class Fn>
void expectUsageError(Fn fn, const std::string &what) {
  try {
    fn();
    expect(false, what + " (no exception)");
  } catch (const treeop::usage_error &) {
  }
}

template <class Fn>
void expectSerializationError(Fn fn, const std::string &path,
                              const std::string &what) {
  try {
    fn();
    expect(false, what + " (no exception)");
  } catch (const treeop::serialization_error &ex) {
    expect(ex.path() == path, what + " (path: " + ex.path() + ")");
  }
}

void testValues() {
  treeop::value rec = treeop::parse(R"({"a":1,"b":[1,2.5,"x",null,true]})");

  expect(rec.is_record(), "parsed record");
  expect(rec.find("b")->find("1")->as_number() == 2.5, "element access");
  expect(rec.find("b")->find("01") == nullptr, "non canonical index");
  expect(rec.find("c") == nullptr, "absent field");

  expect(treeop::value(1) == treeop::value(1.0), "numeric equality");
  expect(treeop::value(nullptr) != treeop::value(), "null is not undefined");
  expect(treeop::loose_equal(treeop::value(nullptr), treeop::value()),
         "null loosely equals undefined");
  expect(treeop::loose_equal(treeop::value("1"), treeop::value(true)),
         "numeric string loosely equals true");
  expect(!treeop::loose_equal(treeop::value(0), treeop::value()),
         "zero is not undefined");

  expect(treeop::kind_of(treeop::value(1.5)) == treeop::kind_of(treeop::value(2)),
         "integers and doubles are numbers");
  expect(treeop::parse_index("12") == 12, "index");
  expect(treeop::parse_index("-1") == -1, "negative index is not canonical");
  expect(treeop::parse_index("1e2") == -1, "exponent is not canonical");

  std::stringstream os;

  os << treeop::value();
  expect(os.str() == "undefined", "printing undefined");

  // undefined elements print as null, undefined members are omitted
  treeop::sequence holes(2);
  treeop::record members;

  members.emplace("x", treeop::value());
  holes.push_back(treeop::value(std::move(members)));
  expect(treeop::to_json(treeop::value(holes)) == boost::json::parse("[null,null,{}]"),
         "json form of holes");

  // large unsigned integers become doubles
  expect(treeop::parse("18446744073709551615").is_number(), "unsigned json number");
}

void testPredicates() {
  treeop::value person = treeop::parse(R"({"name":"Alice","age":30,"tags":["a","b"]})");

  expect(treeop::evaluate(person, treeop::predicate().field("age", treeop::gt(18))),
         "builder field");
  expect(!treeop::evaluate(person, treeop::predicate().field("age", treeop::lt(18))),
         "builder field fails");
  expect(treeop::evaluate(person, treeop::predicate().field("tags", treeop::some("b"))),
         "some");
  expect(treeop::evaluate(person, treeop::not_(treeop::predicate().field("name", "Bob"))),
         "not");
  expect(treeop::evaluate(treeop::value("Alice"), treeop::match("/^a.i/i")),
         "match with flags");
  expect(treeop::evaluate(treeop::value("line1\nline2"), treeop::match("/^line2$/m")),
         "multiline match");
  expect(treeop::evaluate(treeop::value(5), treeop::any_of({treeop::lt(3), treeop::gt(4)})),
         "any_of");
  expect(!treeop::evaluate(person, treeop::any_of({})), "empty any_of");
  expect(treeop::evaluate(treeop::value(5), treeop::predicate()), "empty predicate");

  // functions receive the value and the context
  treeop::context ctx;

  ctx.emplace("minimum", treeop::value(21));

  treeop::predicate adult = treeop::predicate().field(
      "age", treeop::predicate([](const treeop::value &v, const treeop::context &c) -> bool {
        auto pos = c.find("minimum");

        return pos != c.end() && v.is_number() && v.as_number() >= pos->second.as_number();
      }));

  expect(treeop::evaluate(person, adult, ctx), "function predicate with context");
  expect(!treeop::evaluate(person, adult), "function predicate without context");

  // invalid patterns are logged and evaluate false
  std::stringstream log;

  expect(!treeop::evaluate(treeop::value("x"), treeop::match("("), {}, log), "invalid pattern");
  expect(!log.str().empty(), "invalid pattern is logged");

  expectUsageError([] { treeop::predicate().with(treeop::token::where, true); },
                   "non predicate operator");
  expectUsageError([] { treeop::predicate().with(treeop::token::lt, treeop::predicate()); },
                   "non literal comparison operand");
}

void testSelect() {
  treeop::value data = treeop::parse(R"({"a":1,"b":2})");

  std::optional<treeop::value> res =
      treeop::select(data, treeop::select_statement().field("c", true));

  expect(res.has_value() && res->find("c") != nullptr && res->find("c")->is_undefined(),
         "requested absent field is undefined");

  treeop::value seq = treeop::parse("[10,20,30]");

  res = treeop::select(seq, treeop::select_statement().field("2", true));
  expect(res.has_value() && res->as_sequence().size() == 3 &&
             res->as_sequence()[0].is_undefined() &&
             res->as_sequence()[2] == treeop::value(30),
         "sparse holes are undefined");

  res = treeop::select(seq, treeop::select_statement().with_all(
                                treeop::select_statement().with_where(treeop::gt(15))));
  expect(res.has_value() && *res == treeop::parse("[20,30]"), "guarded all is dense");

  treeop::select_statement pattern;

  pattern.with_where(treeop::predicate().field("id", 2));
  res = treeop::select(treeop::parse(R"({"x":{"y":[{"id":1},{"id":2}]}})"),
                       treeop::select_statement().with_deep_all(pattern));
  expect(res.has_value() && *res == treeop::parse(R"({"x":{"y":[{"id":2}]}})"),
         "deep search");

  // select is idempotent
  treeop::select_statement stmt = treeop::select_from_json(
      boost::json::parse(R"({"*":{"x":true},"a":{"y":true}})"));
  treeop::value nested = treeop::parse(R"({"a":{"x":1,"y":2},"b":{"x":3,"z":4}})");
  std::optional<treeop::value> once = treeop::select(nested, stmt);

  expect(once.has_value() && treeop::select(*once, stmt) == once, "idempotent select");

  expectUsageError([] { treeop::select_statement(treeop::value(1)); }, "scalar select statement");
}

void testTransforms() {
  treeop::value data = treeop::parse(R"({"count":1,"items":[1,2,3]})");

  treeop::update_statement increment(
      [](const treeop::value &current, const treeop::value &, const std::string &,
         const treeop::context &) -> treeop::update_statement {
        return treeop::value(current.as_number() + 1);
      });

  std::optional<treeop::change_record> changes =
      treeop::update(data, treeop::update_statement().field("count", increment));

  expect(data == treeop::parse(R"({"count":2.0,"items":[1,2,3]})"), "transform");
  expect(changes.has_value() && changes->values.at("count").original == treeop::value(1),
         "transform change");

  // transforms see the parent and the resolved key
  std::string seenKeys;

  treeop::update_statement doubler(
      [&seenKeys](const treeop::value &current, const treeop::value &parent,
                  const std::string &key, const treeop::context &) -> treeop::update_statement {
        seenKeys += key;
        expect(parent.is_sequence(), "transform parent");
        return treeop::value(current.as_number() * 2);
      });

  treeop::update(data, treeop::update_statement().field(
                           "items", treeop::update_statement().field("-1", doubler)));
  expect(seenKeys == "2", "resolved negative key");
  expect(*data.find("items") == treeop::parse("[1,2,6.0]"), "negative key transform");

  // a transform may return a deletion or a partial update
  treeop::update_statement dropper(
      [](const treeop::value &, const treeop::value &, const std::string &,
         const treeop::context &) -> treeop::update_statement {
        return treeop::update_statement::remove();
      });

  changes = treeop::update(data, treeop::update_statement().field("count", dropper));
  expect(data.find("count") == nullptr, "transform deletes");
  treeop::undo(data, changes);
  expect(data.find("count") != nullptr, "undo of transform deletion");

  expectSerializationError(
      [&increment] {
        treeop::to_json(treeop::update_statement().field(
            "a", treeop::update_statement().field(
                     "b", treeop::update_statement().with_all(
                              treeop::update_statement().field("c", increment)))));
      },
      "a.b.*.c", "function path");

  expectSerializationError(
      [&increment] {
        treeop::validate_no_functions(treeop::update_statement().field("x", increment));
      },
      "x", "validate update");

  expectSerializationError(
      [] {
        treeop::validate_no_functions(treeop::select_statement().field(
            "s", treeop::select_statement().with_where(treeop::predicate(
                     [](const treeop::value &, const treeop::context &) { return true; }))));
      },
      "s.?", "validate select");

  expect(treeop::validate_no_functions(treeop::update_statement().field("x", 1)),
         "statement without functions");
}

void testContext() {
  treeop::value data = treeop::parse(R"({"doc":{"owner":null,"meta":{"editor":null}}})");

  treeop::update_statement fromContext(
      [](const treeop::value &, const treeop::value &, const std::string &,
         const treeop::context &ctx) -> treeop::update_statement {
        auto pos = ctx.find("user");

        return pos == ctx.end() ? treeop::value(nullptr) : pos->second;
      });

  treeop::context inherited;
  treeop::context local;

  inherited.emplace("user", treeop::value("alice"));
  local.emplace("user", treeop::value("bob"));

  treeop::update_statement stmt = treeop::update_statement().field(
      "doc", treeop::update_statement()
                 .field("owner", fromContext)
                 .field("meta", treeop::update_statement()
                                    .with_context(local)
                                    .field("editor", fromContext)));

  treeop::update(data, stmt, std::nullopt, inherited);
  expect(data == treeop::parse(R"({"doc":{"owner":"alice","meta":{"editor":"bob"}}})"),
         "context override");

  // guards see the context
  treeop::value flags = treeop::parse(R"({"a":1})");
  treeop::update_statement guarded =
      treeop::update_statement()
          .with_where(treeop::predicate(
              [](const treeop::value &, const treeop::context &ctx) -> bool {
                return ctx.find("allow") != ctx.end();
              }))
          .field("a", 2);

  expect(!treeop::update(flags, guarded).has_value(), "guard without context");

  treeop::context allow;

  allow.emplace("allow", treeop::value(true));
  expect(treeop::update(flags, guarded, std::nullopt, allow).has_value(), "guard with context");
}

void testUpdates() {
  treeop::value data = treeop::parse(R"({"user":{"name":"Alice","age":30}})");
  const treeop::value original = data;

  std::optional<treeop::change_record> changes =
      treeop::update(data, treeop::parse(R"({"user":{"age":31}})"));

  expect(changes.has_value(), "changes");
  expect(changes->nested.at("user").values.at("age").current == treeop::value(31),
         "current value");
  expect(changes->nested.at("user").values.at("age").original == treeop::value(30),
         "original value");

  treeop::undo(data, changes);
  expect(data == original, "undo");

  // literal containers are copied into the data
  treeop::value replacement = treeop::parse(R"({"x":1})");
  treeop::update_statement replace =
      treeop::update_statement().field("user", treeop::update_statement::replace(replacement));

  treeop::update(data, replace);
  replacement.as_record().insert_or_assign("x", treeop::value(2));
  expect(*data.find("user") == treeop::parse(R"({"x":1})"), "replacement is a copy");

  // holes after removal
  treeop::value seq = treeop::parse("[1,2,3]");

  changes = treeop::update(seq, treeop::update_statement().field("1", treeop::update_statement::remove()));
  expect(seq.as_sequence().size() == 3 && seq.as_sequence()[1].is_undefined(), "hole");
  treeop::undo(seq, changes);
  expect(seq == treeop::parse("[1,2,3]"), "undo fills hole");

  // all skips the holes left by removals
  treeop::value list = treeop::parse(R"({"l":[{"a":1},{"a":2}]})");

  treeop::update(list, treeop::parse(R"({"l":{"0":[]}})"));

  try {
    treeop::update(list, treeop::parse(R"({"l":{"*":{"a":5}}})"));

    const treeop::sequence &elems = list.find("l")->as_sequence();

    expect(elems.size() == 2 && elems[0].is_undefined() &&
               elems[1] == treeop::parse(R"({"a":5})"),
           "all over a hole");
  } catch (const treeop::usage_error &ex) {
    expect(false, std::string("all over a hole: ") + ex.what());
  }

  // a failing statement leaves the data as it was
  treeop::value mixed = treeop::parse(R"({"l":[1],"m":{"k":0},"s":"t"})");
  const treeop::value beforeFailure = mixed;

  expectUsageError(
      [&mixed] {
        treeop::update(mixed, treeop::parse(R"({"l":{"0":[],"1":2},"m":{"k":1},"s":{"k":1}})"));
      },
      "partial update of a string after other keys");
  expect(mixed == beforeFailure, "failed update is rolled back");

  expectUsageError([] { treeop::update_statement(treeop::parse("[1,2]")); },
                   "ambiguous replacement");
  expectUsageError(
      [] {
        treeop::value v = treeop::parse(R"({"a":"text"})");
        treeop::update(v, treeop::parse(R"({"a":{"b":1}})"));
      },
      "partial update of a string");
  expectUsageError(
      [] {
        treeop::value v = treeop::parse(R"({"a":null})");
        treeop::update(v, treeop::update_statement().field(
                              "a", treeop::update_statement().with_default(1).field("b", 1)));
      },
      "scalar default");
}

void testTransactions() {
  treeop::value data = treeop::parse(R"({"a":1,"b":{"c":1}})");
  treeop::value sequential = data;
  treeop::transaction trans{data};

  trans.apply(treeop::parse(R"({"a":2})")).apply(treeop::parse(R"({"b":{"c":2}})"));
  expect(trans.changes().has_value(), "pending changes");

  std::optional<treeop::change_record> committed = trans.commit();

  expect(!trans.changes().has_value(), "commit clears");

  // sequential updates threading the changes give the same record
  std::optional<treeop::change_record> threaded =
      treeop::update(sequential, treeop::parse(R"({"a":2})"));

  threaded = treeop::update(sequential, treeop::parse(R"({"b":{"c":2}})"), std::move(threaded));

  expect(data == sequential, "transaction matches sequential updates");
  expect(committed.has_value() && threaded.has_value() && *committed == *threaded,
         "transaction changes match sequential changes");

  // a new accumulation starts after commit
  trans.apply(treeop::parse(R"({"a":3})"));
  trans.revert();
  expect(*data.find("a") == treeop::value(2), "revert after commit");

  expect(treeop::has_changes(committed, treeop::change_detector().field(
                                            "b", treeop::change_detector().field("c", treeop::any_change))),
         "detect nested change");
  expect(!treeop::has_changes(committed, treeop::change_detector().field("a", treeop::type_change)),
         "no type change");

  // a failing apply keeps the accumulated changes
  treeop::value doc = treeop::parse(R"({"x":1,"a":0,"b":5})");
  treeop::transaction failing{doc};

  failing.apply(treeop::parse(R"({"x":2})"));
  expectUsageError([&failing] { failing.apply(treeop::parse(R"({"a":1,"b":{"c":1}})")); },
                   "apply with a partial update of a number");
  expect(doc == treeop::parse(R"({"x":2,"a":0,"b":5})"), "failed apply is rolled back");
  expect(failing.changes().has_value(), "failed apply keeps pending changes");

  failing.revert();
  expect(doc == treeop::parse(R"({"x":1,"a":0,"b":5})"), "revert after failed apply");
}

void testSerialization() {
  boost::json::value jv = boost::json::parse(
      R"({"a":{"*":{"b":1},"?":{"c":{">":1}},"{}":{},"$":{"k":"v"},"d":[],"e":[{"x":1}]}})");

  treeop::update_statement stmt = treeop::update_from_json(jv);

  expect(stmt.fields().at("a").all() != nullptr, "all");
  expect(stmt.fields().at("a").fields().at("d").type() == treeop::update_statement::kind::remove,
         "remove");
  expect(stmt.fields().at("a").fields().at("e").type() == treeop::update_statement::kind::replace,
         "replace");
  expect(treeop::to_json(stmt) == jv, "update roundtrip");

  expectSerializationError(
      [] { treeop::to_json(treeop::select_statement().field("*", true)); }, "*",
      "field named like a marker");

  for (treeop::token t : {treeop::token::all, treeop::token::deep_all, treeop::token::where,
                          treeop::token::default_value, treeop::token::context,
                          treeop::token::meta, treeop::token::lt, treeop::token::gt,
                          treeop::token::lte, treeop::token::gte, treeop::token::eq,
                          treeop::token::neq, treeop::token::not_, treeop::token::match,
                          treeop::token::some})
    expect(treeop::find_token(treeop::marker(t)) == t,
           "marker " + std::string(treeop::marker(t)));

  expect(!treeop::find_token("***").has_value(), "unknown marker");
}

}  // namespace

int main() {
  testValues();
  testPredicates();
  testSelect();
  testTransforms();
  testContext();
  testUpdates();
  testTransactions();
  testSerialization();

  if (errorCode)
    std::cerr << "errorCode: " << errorCode << std::endl;

  return errorCode;
}
