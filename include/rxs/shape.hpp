#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "rxs/pattern.hpp"

namespace rxs {

// Structural type of what a successful match produces. Mirrors the
// capture-bearing nodes of a pattern only.
struct CaptureShape {
  enum class Kind : uint8_t { Empty, Leaf, Product, Sum, Repeated, Opt };
  Kind kind{Kind::Empty};
  std::optional<std::string> name;  // Leaf name; doubles as the element label inside Product/Sum
  std::vector<CaptureShape> ch;     // Product members, Sum branches, or the single Repeated/Opt inner
  const pat::Pattern* origin = nullptr;

  static CaptureShape make(Kind k, const pat::Pattern* o, std::vector<CaptureShape> c = {}) {
    CaptureShape s; s.kind = k; s.origin = o; s.ch = std::move(c); return s;
  }

  bool empty() const { return kind == Kind::Empty; }
};

// Composition algebra, bottom-up. Total on any finite tree.
inline CaptureShape infer(const pat::Pattern& p) {
  using PK = pat::Pattern::Kind;
  using K = CaptureShape::Kind;
  switch (p.kind) {
    case PK::Literal:
      return {};
    case PK::Capture: {
      // The group records its own span; nested captures are not part of this leaf
      CaptureShape s = CaptureShape::make(K::Leaf, &p);
      s.name = p.name;
      return s;
    }
    case PK::Group:
      return p.ch.empty() ? CaptureShape{} : infer(p.ch[0]);
    case PK::Concat: {
      std::vector<CaptureShape> kept;
      for (const auto& c : p.ch) {
        CaptureShape s = infer(c);
        if (!s.empty()) kept.push_back(std::move(s));
      }
      if (kept.empty()) return {};
      if (kept.size() == 1) return std::move(kept[0]);
      return CaptureShape::make(K::Product, &p, std::move(kept));
    }
    case PK::Alternation: {
      std::vector<CaptureShape> branches; branches.reserve(p.ch.size());
      bool any = false;
      for (const auto& c : p.ch) {
        branches.push_back(infer(c));
        any = any || !branches.back().empty();
      }
      if (!any) return {};
      return CaptureShape::make(K::Sum, &p, std::move(branches));
    }
    case PK::Quantifier: {
      if (p.ch.empty()) return {};
      CaptureShape s = infer(p.ch[0]);
      if (s.empty()) return {};
      bool optional = p.min == 0 && p.max && *p.max == 1;
      return CaptureShape::make(optional ? K::Opt : K::Repeated, &p, {std::move(s)});
    }
  }
  return {};
}

inline bool shape_equal(const CaptureShape& a, const CaptureShape& b) {
  if (a.kind != b.kind || a.name != b.name || a.origin != b.origin) return false;
  if (a.ch.size() != b.ch.size()) return false;
  for (std::size_t i = 0; i < a.ch.size(); ++i)
    if (!shape_equal(a.ch[i], b.ch[i])) return false;
  return true;
}

inline bool operator==(const CaptureShape& a, const CaptureShape& b) { return shape_equal(a, b); }
inline bool operator!=(const CaptureShape& a, const CaptureShape& b) { return !shape_equal(a, b); }

inline const char* kind_name(CaptureShape::Kind k) {
  switch (k) {
    case CaptureShape::Kind::Empty:    return "Empty";
    case CaptureShape::Kind::Leaf:     return "Leaf";
    case CaptureShape::Kind::Product:  return "Product";
    case CaptureShape::Kind::Sum:      return "Sum";
    case CaptureShape::Kind::Repeated: return "Repeated";
    case CaptureShape::Kind::Opt:      return "Opt";
  }
  return "?";
}

// Printed form: Product[Leaf(x), Repeated(Leaf)]
inline std::ostream& operator<<(std::ostream& os, const CaptureShape& s) {
  using K = CaptureShape::Kind;
  os << kind_name(s.kind);
  switch (s.kind) {
    case K::Empty:
      break;
    case K::Leaf:
      if (s.name) os << "(" << *s.name << ")";
      break;
    case K::Product:
    case K::Sum:
      os << "[";
      for (std::size_t i = 0; i < s.ch.size(); ++i) os << (i ? ", " : "") << s.ch[i];
      os << "]";
      break;
    case K::Repeated:
    case K::Opt:
      os << "(" << s.ch[0] << ")";
      break;
  }
  return os;
}

inline std::string to_string(const CaptureShape& s) {
  std::ostringstream os; os << s; return os.str();
}

} // namespace rxs
