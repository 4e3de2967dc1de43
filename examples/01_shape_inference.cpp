#include <iostream>
#include "rxs/regex.hpp"

int main() {
  using namespace rxs;
  using namespace rxs::pat;

  Pattern date = cap("year", exactly(cls("0-9"), 4)) + lit("-") +
                 cap("month", exactly(cls("0-9"), 2)) + lit("-") +
                 cap("day", exactly(cls("0-9"), 2));
  Regex re = Regex::compile(date);

  std::cout << "shape    = " << re.shape() << "\n";
  for (const auto& c : re.captures())
    std::cout << "group " << c.index << " (" << c.name.value_or("-") << ") : " << c.flat << "\n";
  return 0;
}
