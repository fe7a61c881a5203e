#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

/// timings of repeated runs of a benchmark
struct BenchmarkResults {
  using duration = std::chrono::duration<double, std::milli>;

  std::string name;
  std::vector<duration> times;

  duration total() const {
    return std::accumulate(times.begin(), times.end(), duration{0});
  }

  duration mean() const {
    if (times.empty()) return duration{0};

    return total() / double(times.size());
  }

  duration best() const {
    if (times.empty()) return duration{0};

    return *std::min_element(times.begin(), times.end());
  }

  void summarize(std::ostream &os = std::cout) const {
    os << name << ": " << times.size() << " runs"
       << ", mean " << mean().count() << "ms"
       << ", best " << best().count() << "ms" << std::endl;
  }

  void compare_to(const BenchmarkResults &other,
                  std::ostream &os = std::cout) const {
    const double theirs = other.mean().count();

    if (theirs == 0) {
      os << name << " vs " << other.name << ": no reference time" << std::endl;
      return;
    }

    os << name << " vs " << other.name << ": " << mean().count() / theirs
       << "x" << std::endl;
  }
};

/// a named workload that can be timed repeatedly
class Benchmark {
 public:
  Benchmark(std::string name, std::function<void()> fn)
      : name_(std::move(name)), fn_(std::move(fn)) {}

  BenchmarkResults run(size_t runs) const {
    BenchmarkResults res{name_, {}};

    res.times.reserve(runs);

    for (size_t i = 0; i < runs; ++i) {
      const auto start = std::chrono::steady_clock::now();

      fn_();
      res.times.push_back(std::chrono::steady_clock::now() - start);
    }

    return res;
  }

 private:
  std::string name_;
  std::function<void()> fn_;
};
