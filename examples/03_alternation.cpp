#include <iostream>
#include <string>
#include "rxs/regex.hpp"

int main() {
  using namespace rxs;
  using namespace rxs::pat;

  Regex re = Regex::compile(cap("num", plus(cls("0-9"))) |
                            cap("ident", cls("a-zA-Z_") + star(cls("a-zA-Z0-9_"))) |
                            lit("(") + cap("inner", star(ncls(")"))) + lit(")"));
  std::cout << "shape = " << re.shape() << "\n";

  for (const char* input : {"42", "foo_1", "(x y)", "?"}) {
    auto m = re.match(input);
    if (!m) { std::cout << input << " -> no match\n"; continue; }
    std::string what = m->root().choice().visit(
      [](const ValueRef& r) { return "number " + std::string(*r.str()); },
      [](const ValueRef& r) { return "identifier " + std::string(*r.str()); },
      [](const ValueRef& r) { return "parenthesised '" + std::string(*r.str()) + "'"; });
    std::cout << input << " -> " << what << "   [" << *m << "]\n";
  }
  return 0;
}
