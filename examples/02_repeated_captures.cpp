#include <iostream>
#include "rxs/regex.hpp"

int main() {
  using namespace rxs;
  using namespace rxs::pat;

  // (?:([0-9a-f]+)-?)+
  Regex re = Regex::compile(plus(group(cap(plus(cls("0-9a-f"))) + opt(lit("-")))));
  auto m = re.match("1234-5678-9abc-def0");
  if (!m) return 1;

  std::cout << "shape = " << re.shape() << "\n";
  std::cout << "match = " << *m << "\n";
  ValueRef runs = m->at(1);
  for (std::size_t i = 0; i < runs.size(); ++i) std::cout << "  run " << i << ": " << *runs[i].str() << "\n";
  return 0;
}
