#pragma once
#include <cstddef>
#include <memory>
#include <ostream>
#include <unordered_map>
#include <vector>

#include "rxs/pattern.hpp"

namespace rxs {

// Half-open byte range [begin, end) over the input
struct Span {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::size_t size() const { return end - begin; }
};

inline bool operator==(const Span& a, const Span& b) { return a.begin == b.begin && a.end == b.end; }
inline bool operator!=(const Span& a, const Span& b) { return !(a == b); }
inline std::ostream& operator<<(std::ostream& os, const Span& s) { return os << s.begin << ".." << s.end; }

using NodeId = const pat::Pattern*;

// What the search engine hands over for one successful match. One frame per
// quantifier iteration; the root frame covers the whole match.
struct Trace {
  std::unordered_map<NodeId, std::vector<Span>> captures;                 // capture -> spans in this frame
  std::unordered_map<NodeId, std::vector<std::size_t>> choices;           // alternation -> branches taken
  std::unordered_map<NodeId, std::vector<std::unique_ptr<Trace>>> loops;  // quantifier -> iteration frames

  void record(NodeId capture, Span s) { captures[capture].push_back(s); }
  void choose(NodeId alternation, std::size_t branch) { choices[alternation].push_back(branch); }
  Trace& iterate(NodeId quantifier) {
    auto& frames = loops[quantifier];
    frames.push_back(std::make_unique<Trace>());
    return *frames.back();
  }

  // Backtracking support: drop the most recent record of each kind
  void unrecord(NodeId capture) { captures[capture].pop_back(); }
  void unchoose(NodeId alternation) { choices[alternation].pop_back(); }
  void uniterate(NodeId quantifier) { loops[quantifier].pop_back(); }

  const std::vector<Span>& spans(NodeId capture) const {
    static const std::vector<Span> none;
    auto it = captures.find(capture);
    return it == captures.end() ? none : it->second;
  }
  const std::vector<std::size_t>& chosen(NodeId alternation) const {
    static const std::vector<std::size_t> none;
    auto it = choices.find(alternation);
    return it == choices.end() ? none : it->second;
  }
  std::size_t iteration_count(NodeId quantifier) const {
    auto it = loops.find(quantifier);
    return it == loops.end() ? 0 : it->second.size();
  }
  const Trace& iteration(NodeId quantifier, std::size_t i) const { return *loops.at(quantifier).at(i); }

  // Does this frame hold any record for a node inside the given subtree
  bool touches(const pat::Pattern& p) const {
    if (!spans(&p).empty() || !chosen(&p).empty() || iteration_count(&p) != 0) return true;
    for (const auto& c : p.ch) if (touches(c)) return true;
    return false;
  }
};

} // namespace rxs
