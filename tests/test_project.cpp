#include <cassert>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "rxs/build.hpp"
#include "rxs/error.hpp"
#include "rxs/numbering.hpp"
#include "rxs/pattern.hpp"
#include "rxs/project.hpp"
#include "rxs/shape.hpp"
#include "rxs/trace.hpp"
#include "rxs/value.hpp"

using namespace rxs;

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  using namespace rxs::pat;

  // 1) Flatten follows numbering, not shape nesting
  {
    Pattern p = cap("x", lit("a")) + star(group(cap(lit("b")) + opt(cap("y", lit("c"))))) + (cap(lit("d")) | lit("e"));
    CaptureShape s = infer(p);
    std::vector<CaptureInfo> caps = capture_table(p, s);
    const Pattern& body = p.ch[1].ch[0].ch[0];

    // input "abcbe": x=0..1, iterations (1..2, some 2..3) and (3..4, none), branch "e"
    Trace t;
    t.record(&p.ch[0], Span{0, 1});
    Trace& it1 = t.iterate(&p.ch[1]);
    it1.record(&body.ch[0], Span{1, 2});
    it1.iterate(&body.ch[1]).record(&body.ch[1].ch[0], Span{2, 3});
    t.iterate(&p.ch[1]).record(&body.ch[0], Span{3, 4});
    t.choose(&p.ch[2], 1);

    CaptureValue v = build(s, t);
    assert(to_string(v) == "(0..1, [(1..2, some(2..3)), (3..4, none)], #1:())");

    std::vector<CaptureValue> flat = flatten(Span{0, 5}, s, v, caps, t);
    assert(flat.size() == 5);
    assert(to_string(flat[0]) == "0..5");
    assert(to_string(flat[1]) == "0..1");
    assert(to_string(flat[2]) == "[1..2, 3..4]");
    assert(to_string(flat[3]) == "[some(2..3), none]");
    assert(to_string(flat[4]) == "nil");  // branch not taken

    // Projection from the value tree agrees with building each flat shape from the trace
    for (const auto& c : caps) assert(flat[c.index] == build(c.flat, t));
  }

  // 2) Unselected branches project to absent values of their flat shape
  {
    Pattern p = star(cap(lit("a"))) | cap(lit("b"));
    CaptureShape s = infer(p);
    std::vector<CaptureInfo> caps = capture_table(p, s);
    Trace t;
    t.choose(&p, 1);
    t.record(&p.ch[1], Span{0, 1});
    CaptureValue v = build(s, t);
    std::vector<CaptureValue> flat = flatten(Span{0, 1}, s, v, caps, t);
    assert(to_string(flat[1]) == "[]");
    assert(to_string(flat[2]) == "0..1");
  }

  // 3) Hidden captures come from the trace
  {
    Pattern p = cap(cap(lit("A")) + cap(lit("B") + cap(lit("C"))));
    CaptureShape s = infer(p);
    std::vector<CaptureInfo> caps = capture_table(p, s);
    Trace t;
    t.record(&p.ch[0].ch[0], Span{0, 1});
    t.record(&p.ch[0].ch[1].ch[0].ch[1], Span{2, 3});
    t.record(&p.ch[0].ch[1], Span{1, 3});
    t.record(&p, Span{0, 3});
    std::vector<CaptureValue> flat = flatten(Span{0, 3}, s, build(s, t), caps, t);
    assert(to_string(flat[1]) == "0..3");
    assert(to_string(flat[2]) == "0..1");
    assert(to_string(flat[3]) == "1..3");
    assert(to_string(flat[4]) == "2..3");
  }

  // 4) ValueRef over products, repeats and optionals
  {
    std::string input = "k=v;k2=v2";
    Pattern pair = cap("key", plus(ncls("=;"))) + lit("=") + cap("val", plus(ncls(";")));
    Pattern p = pair + star(group(lit(";") + opt(cap("more", plus(ncls(";"))))));
    CaptureShape s = infer(p);
    assert(to_string(s) == "Product[Leaf(key), Leaf(val), Repeated(Opt(Leaf(more)))]");

    const Pattern& loop = p.ch[3];
    const Pattern& optional = loop.ch[0].ch[0].ch[1];
    Trace t;
    t.record(&p.ch[0], Span{0, 1});
    t.record(&p.ch[2], Span{2, 3});
    t.iterate(&loop).iterate(&optional).record(&optional.ch[0], Span{4, 9});
    CaptureValue v = build(s, t);

    ValueRef root(s, v, input);
    assert(root.kind() == CaptureShape::Kind::Product);
    assert(root.size() == 3);
    assert(root.member("key").str() == std::string_view("k"));
    assert(root[1].str() == std::string_view("v"));
    assert(root[2].size() == 1);
    assert(root[2][0].present());
    assert(root[2][0].inner().str() == std::string_view("k2=v2"));
    assert(*root[2][0].inner().name() == "more");

    assert(throws<CaptureLookupError>([&]{ root.member("nope"); }));
    assert(throws<CaptureLookupError>([&]{ root.span(); }));
    assert(throws<CaptureLookupError>([&]{ root[3]; }));
    assert(throws<CaptureLookupError>([&]{ root[2][1]; }));
    assert(throws<CaptureLookupError>([&]{ root[0].choice(); }));
    assert(throws<CaptureLookupError>([&]{ root[0].present(); }));
  }

  // 5) A single named leaf answers its own name
  {
    std::string input = "xay";
    Pattern p = lit("x") + cap("mid", lit("a")) + lit("y");
    CaptureShape s = infer(p);
    Trace t;
    t.record(&p.ch[1], Span{1, 2});
    CaptureValue v = build(s, t);
    ValueRef root(s, v, input);
    assert(root.member("mid").str() == std::string_view("a"));
    assert(throws<CaptureLookupError>([&]{ root.member("other"); }));
  }

  // 6) Choice: exhaustive visit and the all-optional projection
  {
    std::string input = "b";
    Pattern p = cap("x", lit("a")) | cap("y", lit("b")) | cap("z", lit("c"));
    CaptureShape s = infer(p);
    Trace t;
    t.choose(&p, 1);
    t.record(&p.ch[1], Span{0, 1});
    CaptureValue v = build(s, t);

    Choice c = ValueRef(s, v, input).choice();
    assert(c.size() == 3);
    assert(c.index() == 1);
    assert(c.value().str() == std::string_view("b"));

    auto opts = c.options();
    assert(opts.size() == 3);
    assert(!opts[0] && opts[1] && !opts[2]);
    assert(*opts[1]->name() == "y");

    std::string seen = c.visit(
      [](const ValueRef&) { return std::string("x"); },
      [](const ValueRef& r) { return "y:" + std::string(*r.str()); },
      [](const ValueRef&) { return std::string("z"); });
    assert(seen == "y:b");

    assert(throws<CaptureLookupError>([&]{
      c.visit([](const ValueRef&) { return 0; }, [](const ValueRef&) { return 1; });
    }));

    // A value that lost its branch is caught on read
    CaptureValue broken = v;
    broken.ch.clear();
    Choice bad = ValueRef(s, broken, input).choice();
    assert(throws<InternalError>([&]{ bad.index(); }));
    assert(throws<InternalError>([&]{ bad.options(); }));
    broken = v;
    broken.selected = 7;
    Choice out_of_range = ValueRef(s, broken, input).choice();
    assert(throws<InternalError>([&]{ out_of_range.options(); }));
  }

  // 7) A value tree that does not conform to the shape is rejected
  {
    Pattern p = cap(lit("a")) + cap(lit("b"));
    CaptureShape s = infer(p);
    std::vector<CaptureInfo> caps = capture_table(p, s);
    Trace t;
    CaptureValue wrong = CaptureValue::leaf(Span{0, 1});
    assert(throws<InternalError>([&]{ flatten(Span{0, 2}, s, wrong, caps, t); }));
  }

  return 0;
}
