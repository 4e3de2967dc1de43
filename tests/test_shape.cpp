#include <cassert>
#include <string>

#include "rxs/pattern.hpp"
#include "rxs/shape.hpp"

using namespace rxs;

int main() {
  using namespace rxs::pat;

  // 1) Literals carry no captures
  {
    assert(infer(lit("abc")).empty());
    assert(infer(lit("a") + cls("0-9") + any()).empty());
  }

  // 2) One capturing child: no wrapping, lit (cap) lit -> Leaf
  {
    Pattern p = lit("x") + cap(lit("y")) + lit("z");
    CaptureShape s = infer(p);
    assert(to_string(s) == "Leaf");
    assert(s.origin == &p.ch[1]);
  }

  // 3) Two or more: Product in order, names per element
  {
    assert(to_string(infer(cap(lit("a")) + cap(lit("b")))) == "Product[Leaf, Leaf]");
    assert(to_string(infer(cap("x", lit("a")) + cap("y", lit("b")))) == "Product[Leaf(x), Leaf(y)]");
    // capture-free children contribute nothing
    assert(to_string(infer(lit("-") + cap("x", lit("a")) + lit("-") + cap(lit("b")) + lit("-")))
           == "Product[Leaf(x), Leaf]");
  }

  // 4) A capture discards the shape of its child
  {
    Pattern p = cap(cap(lit("A")) + cap(lit("B") + cap(lit("C"))));
    assert(to_string(infer(p)) == "Leaf");
  }

  // 5) Non-capturing groups pass through, and keep nested concatenations nested
  {
    assert(to_string(infer(group(cap("x", lit("a"))))) == "Leaf(x)");
    Pattern p = seq({group(cap(lit("a")) + cap(lit("b"))), cap(lit("c"))});
    assert(to_string(infer(p)) == "Product[Product[Leaf, Leaf], Leaf]");
  }

  // 6) Alternation: Empty when no branch captures, else one slot per branch
  {
    assert(infer(lit("a") | lit("b") | lit("c")).empty());
    Pattern p = cap("x", lit("a")) | lit("b") | cap(lit("c")) + cap(lit("d"));
    CaptureShape s = infer(p);
    assert(to_string(s) == "Sum[Leaf(x), Empty, Product[Leaf, Leaf]]");
    assert(s.origin == &p);
    assert(s.ch[0].name && *s.ch[0].name == "x");
    assert(!s.ch[1].name);
  }

  // 7) A named capture around an alternation names the slot, not the branches
  {
    Pattern p = cap("choice", cap(lit("a")) | cap(lit("b")));
    assert(to_string(infer(p)) == "Leaf(choice)");
  }

  // 8) Quantifiers: Empty inner stays Empty, {0,1} is Opt, everything else Repeated
  {
    assert(infer(star(lit("a"))).empty());
    assert(infer(exactly(lit("a") | lit("b"), 3)).empty());
    assert(to_string(infer(opt(cap(lit("a"))))) == "Opt(Leaf)");
    assert(to_string(infer(star(cap(lit("a"))))) == "Repeated(Leaf)");
    assert(to_string(infer(plus(cap(lit("a"))))) == "Repeated(Leaf)");
    assert(to_string(infer(exactly(cap(lit("a")), 4))) == "Repeated(Leaf)");
    assert(to_string(infer(rep(cap(lit("a")), 2, 5))) == "Repeated(Leaf)");
    assert(to_string(infer(rep(cap(lit("a")), 1, 1))) == "Repeated(Leaf)");
    assert(to_string(infer(rep(cap(lit("a")), 0, 2))) == "Repeated(Leaf)");
    Pattern q = opt(star(cap("x", lit("a")) + cap(lit("b"))));
    assert(to_string(infer(q)) == "Opt(Repeated(Product[Leaf(x), Leaf]))");
  }

  // 9) The hex-run example
  {
    Pattern p = plus(group(cap(plus(cls("0-9a-f"))) + opt(lit("-"))));
    CaptureShape s = infer(p);
    assert(to_string(s) == "Repeated(Leaf)");
    assert(s.origin == &p);
    assert(s.ch[0].origin == &p.ch[0].ch[0].ch[0]);
  }

  // 10) Inference is pure: same tree, equal shapes
  {
    Pattern p = cap("a", lit("a")) + star(cap(lit("b")) | lit("c")) + opt(cap(lit("d")));
    CaptureShape s1 = infer(p);
    CaptureShape s2 = infer(p);
    assert(s1 == s2);
    assert(to_string(s1) == "Product[Leaf(a), Repeated(Sum[Leaf, Empty]), Opt(Leaf)]");
    Pattern other = p;
    assert(infer(other) != s1); // origins differ
    assert(to_string(infer(other)) == to_string(s1));
  }

  return 0;
}
