#include <iostream>
#include "rxs/regex.hpp"

// Feed a trace produced elsewhere (here: written by hand) through the same
// value assembly the built-in tracer uses.
int main() {
  using namespace rxs;
  using namespace rxs::pat;

  Regex re = Regex::compile(cap("k", plus(cls("a-z"))) + star(group(lit(",") + cap("v", plus(cls("0-9"))))));
  const Pattern& p = re.pattern();
  const Pattern& loop = p.ch[1];
  const Pattern& v = loop.ch[0].ch[0].ch[1];

  // "ab,1,23"
  Trace t;
  t.record(&p.ch[0], Span{0, 2});
  t.iterate(&loop).record(&v, Span{3, 4});
  t.iterate(&loop).record(&v, Span{5, 7});

  Match m = re.evaluate(Span{0, 7}, t, "ab,1,23");
  std::cout << "shape = " << re.shape() << "\n";
  std::cout << "value = " << m.value() << "\n";
  std::cout << "flat  = " << m << "\n";

  // The same match reported as one span list per capture, without frames
  Trace lists;
  lists.record(&p.ch[0], Span{0, 2});
  lists.record(&v, Span{3, 4});
  lists.record(&v, Span{5, 7});
  std::cout << "lists = " << re.evaluate(Span{0, 7}, lists, "ab,1,23").value() << "\n";
  return 0;
}
