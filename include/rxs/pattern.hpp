#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rxs/error.hpp"

namespace rxs { namespace pat {

struct Pattern {
  enum class Kind : uint8_t { Literal, Capture, Group, Concat, Alternation, Quantifier };
  Kind kind{Kind::Concat};
  std::vector<Pattern> ch;
  // Literal payload: exact bytes, or the (sorted, unique) byte set of a class
  std::string text;
  bool is_class{false};
  bool negated{false};
  // Capture
  std::optional<std::string> name;
  // Quantifier bounds; no max means unbounded
  std::size_t min{0};
  std::optional<std::size_t> max;

  static Pattern node(Kind k, std::vector<Pattern> c = {}) {
    Pattern p; p.kind = k; p.ch = std::move(c); return p;
  }

  bool is_capture() const { return kind == Kind::Capture; }
};

inline const char* kind_name(Pattern::Kind k) {
  switch (k) {
    case Pattern::Kind::Literal:     return "Literal";
    case Pattern::Kind::Capture:     return "Capture";
    case Pattern::Kind::Group:       return "Group";
    case Pattern::Kind::Concat:      return "Concat";
    case Pattern::Kind::Alternation: return "Alternation";
    case Pattern::Kind::Quantifier:  return "Quantifier";
  }
  return "?";
}

// Does a one-byte literal class accept c
inline bool class_accepts(const Pattern& p, unsigned char c) {
  bool in = p.text.find(static_cast<char>(c)) != std::string::npos;
  return in != p.negated;
}

inline bool has_capture(const Pattern& p) {
  if (p.is_capture()) return true;
  for (const auto& c : p.ch) if (has_capture(c)) return true;
  return false;
}

// Expand "0-9a-f" style class text into its byte set
inline std::string expand_class(const std::string& chars) {
  bool seen[256] = {};
  for (std::size_t i = 0; i < chars.size(); ++i) {
    unsigned char lo = static_cast<unsigned char>(chars[i]);
    if (i + 2 < chars.size() && chars[i+1] == '-') {
      unsigned char hi = static_cast<unsigned char>(chars[i+2]);
      if (hi < lo) throw PatternError("class range '" + chars.substr(i, 3) + "' is reversed");
      for (unsigned c = lo; c <= hi; ++c) seen[c] = true;
      i += 2;
    } else {
      seen[lo] = true;
    }
  }
  std::string out;
  for (unsigned c = 0; c < 256; ++c) if (seen[c]) out.push_back(static_cast<char>(c));
  return out;
}

// Leaf builders
inline Pattern lit(std::string s) { Pattern p = Pattern::node(Pattern::Kind::Literal); p.text = std::move(s); return p; }
inline Pattern cls(const std::string& chars) {
  Pattern p = Pattern::node(Pattern::Kind::Literal); p.is_class = true; p.text = expand_class(chars); return p;
}
inline Pattern ncls(const std::string& chars) { Pattern p = cls(chars); p.negated = true; return p; }
inline Pattern any() { Pattern p = Pattern::node(Pattern::Kind::Literal); p.is_class = true; p.negated = true; return p; }

// Grouping builders
inline Pattern cap(Pattern child) { return Pattern::node(Pattern::Kind::Capture, {std::move(child)}); }
inline Pattern cap(std::string name, Pattern child) {
  Pattern p = cap(std::move(child)); p.name = std::move(name); return p;
}
inline Pattern group(Pattern child) { return Pattern::node(Pattern::Kind::Group, {std::move(child)}); }
inline Pattern seq(std::vector<Pattern> ch) { return Pattern::node(Pattern::Kind::Concat, std::move(ch)); }
inline Pattern alt(std::vector<Pattern> ch) { return Pattern::node(Pattern::Kind::Alternation, std::move(ch)); }

// Quantifier builders
inline Pattern rep(Pattern child, std::size_t min, std::optional<std::size_t> max = std::nullopt) {
  Pattern p = Pattern::node(Pattern::Kind::Quantifier, {std::move(child)});
  p.min = min; p.max = max; return p;
}
inline Pattern opt(Pattern child)   { return rep(std::move(child), 0, 1); }
inline Pattern star(Pattern child)  { return rep(std::move(child), 0); }
inline Pattern plus(Pattern child)  { return rep(std::move(child), 1); }
inline Pattern exactly(Pattern child, std::size_t n) { return rep(std::move(child), n, n); }

// Operator sugar: a + b appends to an existing concatenation, a | b to an existing alternation.
// Wrap an operand in group() to keep it as a nested node.
inline Pattern operator+(Pattern a, Pattern b) {
  if (a.kind != Pattern::Kind::Concat) a = seq({std::move(a)});
  a.ch.push_back(std::move(b));
  return a;
}
inline Pattern operator|(Pattern a, Pattern b) {
  if (a.kind != Pattern::Kind::Alternation) a = alt({std::move(a)});
  a.ch.push_back(std::move(b));
  return a;
}

inline bool is_identifier(const std::string& s) {
  if (s.empty()) return false;
  auto alpha = [](char c){ return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
  if (!alpha(s[0])) return false;
  for (char c : s) if (!alpha(c) && !(c >= '0' && c <= '9')) return false;
  return true;
}

// Structural checks; throws PatternError on the first problem found
inline void validate(const Pattern& p, std::unordered_set<std::string>& names) {
  using Kind = Pattern::Kind;
  switch (p.kind) {
    case Kind::Literal:
      if (!p.ch.empty()) throw PatternError("literal with children");
      if (p.is_class && p.text.empty() && !p.negated) throw PatternError("empty character class");
      return;
    case Kind::Capture:
      if (p.name) {
        if (!is_identifier(*p.name)) throw PatternError("invalid capture name '" + *p.name + "'");
        if (!names.insert(*p.name).second) throw PatternError("duplicate capture name '" + *p.name + "'");
      }
      [[fallthrough]];
    case Kind::Group:
    case Kind::Quantifier:
      if (p.ch.size() != 1) {
        throw PatternError(std::string(kind_name(p.kind)) + " needs exactly one child, got " + std::to_string(p.ch.size()));
      }
      if (p.kind == Kind::Quantifier && p.max && *p.max < p.min) {
        throw PatternError("quantifier bound {" + std::to_string(p.min) + "," + std::to_string(*p.max) + "} has max < min");
      }
      break;
    case Kind::Alternation:
      if (p.ch.empty()) throw PatternError("alternation without branches");
      break;
    case Kind::Concat:
      break;
  }
  for (const auto& c : p.ch) validate(c, names);
}

inline void validate(const Pattern& p) {
  std::unordered_set<std::string> names;
  validate(p, names);
}

} } // namespace rxs::pat
