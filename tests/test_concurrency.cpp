#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

#include "rxs/regex.hpp"

using namespace rxs;

int main() {
  using namespace rxs::pat;

  // One compiled pattern, many threads matching independently
  const Regex re = Regex::compile(cap("key", plus(cls("a-z"))) + lit("=") +
                                  plus(group(cap("hex", plus(cls("0-9a-f"))) + opt(lit("-")))));
  std::atomic<int> failures{0};
  std::vector<std::thread> pool;
  for (int w = 0; w < 4; ++w) {
    pool.emplace_back([&, w] {
      for (int i = 0; i < 200; ++i) {
        std::string input = "id=" + std::to_string(w) + "a-" + std::to_string(i) + "f";
        auto m = re.match(input);
        if (!m) { ++failures; continue; }
        ValueRef runs = m->at("hex");
        bool ok = m->str("key") == std::string_view("id") && runs.size() == 2 &&
                  runs[0].str() == std::string_view(std::to_string(w) + "a") &&
                  runs[1].str() == std::string_view(std::to_string(i) + "f");
        if (!ok) ++failures;
      }
    });
  }
  for (auto& t : pool) t.join();
  assert(failures == 0);
  return 0;
}
