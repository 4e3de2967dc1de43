#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "rxs/pattern.hpp"
#include "rxs/shape.hpp"

namespace rxs {

// Pre-order walk: a capture is listed before anything inside it and before its later siblings
inline void number(const pat::Pattern& p, std::vector<const pat::Pattern*>& out) {
  if (p.is_capture()) out.push_back(&p);
  for (const auto& c : p.ch) number(c, out);
}

// Backreference order 1..N (element k-1 is group k); the whole match is not listed
inline std::vector<const pat::Pattern*> number(const pat::Pattern& root) {
  std::vector<const pat::Pattern*> out;
  number(root, out);
  return out;
}

// One step from a shape to one of its children
struct Step {
  enum class Kind : uint8_t { Member, Branch, Each, Inner };
  Kind kind{Kind::Member};
  std::size_t index = 0;
};
using ShapePath = std::vector<Step>;

struct CaptureInfo {
  std::size_t index = 0;                 // backreference number, 1..N
  const pat::Pattern* node = nullptr;
  std::optional<std::string> name;
  std::optional<ShapePath> path;         // where its Leaf sits in the shape; none if hidden by an enclosing capture
  CaptureShape flat;                     // Leaf wrapped in Repeated/Opt per quantifier ancestor
};

inline void collect_paths(const CaptureShape& s, ShapePath& cur,
                          std::unordered_map<const pat::Pattern*, ShapePath>& out) {
  using K = CaptureShape::Kind;
  auto descend = [&](Step::Kind k, std::size_t i) {
    cur.push_back(Step{k, i});
    collect_paths(s.ch[i], cur, out);
    cur.pop_back();
  };
  switch (s.kind) {
    case K::Empty:    break;
    case K::Leaf:     out.emplace(s.origin, cur); break;
    case K::Product:  for (std::size_t i = 0; i < s.ch.size(); ++i) descend(Step::Kind::Member, i); break;
    case K::Sum:      for (std::size_t i = 0; i < s.ch.size(); ++i) descend(Step::Kind::Branch, i); break;
    case K::Repeated: descend(Step::Kind::Each, 0); break;
    case K::Opt:      descend(Step::Kind::Inner, 0); break;
  }
}

inline CaptureShape flat_shape(const pat::Pattern& capture, const std::vector<const pat::Pattern*>& quantifiers) {
  CaptureShape s = CaptureShape::make(CaptureShape::Kind::Leaf, &capture);
  s.name = capture.name;
  for (auto it = quantifiers.rbegin(); it != quantifiers.rend(); ++it) {
    const pat::Pattern* q = *it;
    bool optional = q->min == 0 && q->max && *q->max == 1;
    s = CaptureShape::make(optional ? CaptureShape::Kind::Opt : CaptureShape::Kind::Repeated, q, {std::move(s)});
  }
  return s;
}

// Numbering plus, per capture, its position in the shape and its flattened shape
inline std::vector<CaptureInfo> capture_table(const pat::Pattern& root, const CaptureShape& shape) {
  std::unordered_map<const pat::Pattern*, ShapePath> paths;
  ShapePath cur;
  collect_paths(shape, cur, paths);

  std::vector<CaptureInfo> out;
  std::vector<const pat::Pattern*> quantifiers;
  std::function<void(const pat::Pattern&)> walk = [&](const pat::Pattern& p) {
    if (p.is_capture()) {
      CaptureInfo ci;
      ci.index = out.size() + 1;
      ci.node = &p;
      ci.name = p.name;
      auto it = paths.find(&p);
      if (it != paths.end()) ci.path = it->second;
      ci.flat = flat_shape(p, quantifiers);
      out.push_back(std::move(ci));
    }
    bool q = p.kind == pat::Pattern::Kind::Quantifier;
    if (q) quantifiers.push_back(&p);
    for (const auto& c : p.ch) walk(c);
    if (q) quantifiers.pop_back();
  };
  walk(root);
  return out;
}

// name -> backreference number, computed once per compiled pattern
inline std::unordered_map<std::string, std::size_t> name_table(const std::vector<CaptureInfo>& caps) {
  std::unordered_map<std::string, std::size_t> names;
  for (const auto& c : caps) {
    if (!c.name) continue;
    if (!names.emplace(*c.name, c.index).second) throw PatternError("duplicate capture name '" + *c.name + "'");
  }
  return names;
}

} // namespace rxs
