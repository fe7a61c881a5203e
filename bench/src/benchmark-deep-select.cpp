#include <faker-cxx/faker.h>

#include <bench.hpp>
#include <boost/json.hpp>
#include <iostream>
#include <string>

#include "treeop/treeop.hpp"

const int SEED_ = 42;
static const size_t N_ = 2000;
static const int N_RUNS_ = 10;
static const int STOCK_RANGE_ = 100;

namespace {

/// counts the items below \p limit the way a hand-written search would
size_t countLowStock(const treeop::value &node, double limit) {
  if (const treeop::value *stock = node.find("stock")) {
    if (stock->is_number() && stock->as_number() < limit) return 1;
  }

  size_t res = 0;

  if (node.is_record()) {
    for (const auto &[key, elem] : node.as_record())
      res += countLowStock(elem, limit);
  } else if (node.is_sequence()) {
    for (const treeop::value &elem : node.as_sequence())
      res += countLowStock(elem, limit);
  }

  return res;
}

/// counts the items in a deep selection result
size_t countItems(const treeop::value &node) {
  if (node.find("stock") != nullptr) return 1;

  size_t res = 0;

  if (node.is_record()) {
    for (const auto &[key, elem] : node.as_record()) res += countItems(elem);
  } else if (node.is_sequence()) {
    for (const treeop::value &elem : node.as_sequence())
      res += countItems(elem);
  }

  return res;
}

}  // namespace

int main(int argc, const char **argv) {
  size_t N = N_;
  if (argc > 1) {
    N = std::stoul(argv[1]);
  }
  size_t N_RUNS = N_RUNS_;
  if (argc > 2) {
    N_RUNS = std::stoul(argv[2]);
  }

  int SEED = SEED_;
  if (argc > 3) {
    SEED = std::stoul(argv[3]);
  }

  int STOCK_RANGE = STOCK_RANGE_;
  if (argc > 4) {
    STOCK_RANGE = std::stoul(argv[4]);
  }

  const double LIMIT = STOCK_RANGE / 10.0;

  faker::getGenerator().seed(SEED);
  std::cout << "N: " << N << "\n";
  std::cout << "N_RUNS: " << N_RUNS << "\n";
  std::cout << "SEED: " << SEED << "\n";
  std::cout << "STOCK_RANGE: " << STOCK_RANGE << "\n";

  // create a catalog of departments, shelves and items
  treeop::record catalog;

  for (size_t i = 0; i < N; ++i) {
    const std::string dept = "dept" + std::to_string(faker::number::integer(0, 9));
    treeop::value &shelves = catalog[dept];

    if (!shelves.is_record()) shelves = treeop::value(treeop::record{});

    treeop::value &shelf =
        shelves.as_record()["shelf" + std::to_string(faker::number::integer(0, 19))];

    if (!shelf.is_sequence()) shelf = treeop::value(treeop::sequence{});

    treeop::record item;

    item.emplace("id", treeop::value(i));
    item.emplace("stock", treeop::value(faker::number::integer(0, STOCK_RANGE)));
    shelf.as_sequence().push_back(treeop::value(std::move(item)));
  }

  const treeop::value data{std::move(catalog)};

  std::cout << "initialized catalog\n";

  // Create treeop benchmark
  treeop::select_statement lowStock = treeop::select_from_json(boost::json::parse(
      R"({"**":{"?":{"stock":{"<":)" + std::to_string(LIMIT) + "}}}}"));

  size_t matches = 0;
  auto treeop_lambda = [&] {
    std::optional<treeop::value> res = treeop::select(data, lowStock);

    matches = res ? countItems(*res) : 0;
  };

  auto treeop_bench = Benchmark("deep select treeop", treeop_lambda);

  auto cpp_lambda = [&] { matches = countLowStock(data, LIMIT); };

  auto cpp_bench = Benchmark("deep select cpp", cpp_lambda);

  auto treeop_results = treeop_bench.run(N_RUNS);
  std::cout << "treeop matches: " << matches << std::endl;
  auto cpp_results = cpp_bench.run(N_RUNS);
  std::cout << "cpp matches: " << matches << std::endl;

  treeop_results.summarize();
  cpp_results.summarize();
  treeop_results.compare_to(cpp_results);
  cpp_results.compare_to(treeop_results);
  return 0;
}
