#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "rxs/trace.hpp"

namespace rxs {

// Runtime instance of a CaptureShape, fresh per match
struct CaptureValue {
  enum class Kind : uint8_t { Empty, Leaf, Product, Sum, Repeated, Opt };
  Kind kind{Kind::Empty};
  std::optional<Span> span;     // Leaf; none if the group never matched
  std::size_t selected = 0;     // Sum: branch taken, its value is ch[0]
  bool present = false;         // Opt: ch[0] holds the value when present
  std::vector<CaptureValue> ch;

  static CaptureValue leaf(std::optional<Span> s) {
    CaptureValue v; v.kind = Kind::Leaf; v.span = s; return v;
  }
  static CaptureValue product(std::vector<CaptureValue> members) {
    CaptureValue v; v.kind = Kind::Product; v.ch = std::move(members); return v;
  }
  static CaptureValue sum(std::size_t branch, CaptureValue inner) {
    CaptureValue v; v.kind = Kind::Sum; v.selected = branch; v.ch.push_back(std::move(inner)); return v;
  }
  static CaptureValue repeated(std::vector<CaptureValue> items) {
    CaptureValue v; v.kind = Kind::Repeated; v.ch = std::move(items); return v;
  }
  static CaptureValue opt(std::optional<CaptureValue> inner) {
    CaptureValue v; v.kind = Kind::Opt;
    if (inner) { v.present = true; v.ch.push_back(std::move(*inner)); }
    return v;
  }
};

inline bool operator==(const CaptureValue& a, const CaptureValue& b) {
  using K = CaptureValue::Kind;
  if (a.kind != b.kind || a.ch.size() != b.ch.size()) return false;
  if (a.kind == K::Leaf && a.span != b.span) return false;
  if (a.kind == K::Sum && a.selected != b.selected) return false;
  if (a.kind == K::Opt && a.present != b.present) return false;
  for (std::size_t i = 0; i < a.ch.size(); ++i)
    if (!(a.ch[i] == b.ch[i])) return false;
  return true;
}
inline bool operator!=(const CaptureValue& a, const CaptureValue& b) { return !(a == b); }

// Printed form: (0..4, [5..9, 10..14], #1:nil, some(3..4))
inline std::ostream& operator<<(std::ostream& os, const CaptureValue& v) {
  using K = CaptureValue::Kind;
  auto list = [&](const char* open, const char* close) {
    os << open;
    for (std::size_t i = 0; i < v.ch.size(); ++i) os << (i ? ", " : "") << v.ch[i];
    os << close;
  };
  switch (v.kind) {
    case K::Empty:    os << "()"; break;
    case K::Leaf:     if (v.span) os << *v.span; else os << "nil"; break;
    case K::Product:  list("(", ")"); break;
    case K::Sum:      os << "#" << v.selected << ":" << v.ch[0]; break;
    case K::Repeated: list("[", "]"); break;
    case K::Opt:      if (v.present) os << "some(" << v.ch[0] << ")"; else os << "none"; break;
  }
  return os;
}

inline std::string to_string(const CaptureValue& v) {
  std::ostringstream os; os << v; return os.str();
}

} // namespace rxs
