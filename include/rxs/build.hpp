#pragma once
#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "rxs/error.hpp"
#include "rxs/shape.hpp"
#include "rxs/trace.hpp"
#include "rxs/value.hpp"

namespace rxs {

inline std::string describe(const CaptureShape& s) {
  std::string out = kind_name(s.kind);
  if (s.origin && s.origin->name) out += " '" + *s.origin->name + "'";
  return out;
}

// Value of a slot whose subtree never executed
inline CaptureValue absent_value(const CaptureShape& s) {
  using K = CaptureShape::Kind;
  switch (s.kind) {
    case K::Empty:    return {};
    case K::Leaf:     return CaptureValue::leaf(std::nullopt);
    case K::Repeated: return CaptureValue::repeated({});
    case K::Opt:      return CaptureValue::opt(std::nullopt);
    case K::Product: {
      std::vector<CaptureValue> members; members.reserve(s.ch.size());
      for (const auto& c : s.ch) members.push_back(absent_value(c));
      return CaptureValue::product(std::move(members));
    }
    case K::Sum:
      break;
  }
  throw InternalError("no absent value for " + describe(s) + ": exactly one branch must be selected");
}

inline void captures_below(const pat::Pattern& p, std::vector<NodeId>& out) {
  if (p.is_capture()) out.push_back(&p);
  for (const auto& c : p.ch) captures_below(c, out);
}

// An engine may hand over a loop as one span list per capture instead of one
// frame per iteration. Rebuild the frames when the lists line up one to one.
inline std::vector<Trace> spread_iterations(const CaptureShape& s, const Trace& t) {
  const pat::Pattern& body = s.origin->ch[0];
  std::function<void(const pat::Pattern&)> aligned = [&](const pat::Pattern& p) {
    using Kind = pat::Pattern::Kind;
    if ((p.kind == Kind::Quantifier || p.kind == Kind::Alternation) && pat::has_capture(p)) {
      throw InternalError(describe(s) + " spans can not be split per iteration: a nested " +
                          pat::kind_name(p.kind) + " holds captures and recorded no frames");
    }
    for (const auto& c : p.ch) aligned(c);
  };
  aligned(body);

  std::vector<NodeId> caps;
  captures_below(body, caps);
  std::size_t n = caps.empty() ? 0 : t.spans(caps[0]).size();
  for (NodeId c : caps) {
    if (t.spans(c).size() != n) {
      throw InternalError(describe(s) + " captures recorded " + std::to_string(n) + " and " +
                          std::to_string(t.spans(c).size()) + " spans, can not split them per iteration");
    }
  }
  std::vector<Trace> frames(n);
  for (std::size_t i = 0; i < n; ++i)
    for (NodeId c : caps) frames[i].record(c, t.spans(c)[i]);
  return frames;
}

// Iteration frames of a Repeated or Opt slot, whichever way they were recorded
inline std::vector<const Trace*> iterations(const CaptureShape& s, const Trace& t, std::vector<Trace>& spread) {
  const pat::Pattern& q = *s.origin;
  std::size_t n = t.iteration_count(&q);
  bool loose = t.touches(q.ch[0]);
  if (n != 0 && loose) {
    throw InternalError(describe(s) + " has " + std::to_string(n) + " iteration frames and records outside them");
  }
  std::vector<const Trace*> out;
  if (loose) {
    spread = spread_iterations(s, t);
    for (const auto& f : spread) out.push_back(&f);
  } else {
    for (std::size_t i = 0; i < n; ++i) out.push_back(&t.iteration(&q, i));
  }
  return out;
}

// Assemble the value tree for `s` from one trace frame
inline CaptureValue build(const CaptureShape& s, const Trace& t) {
  using K = CaptureShape::Kind;
  switch (s.kind) {
    case K::Empty:
      return {};

    case K::Leaf: {
      const auto& spans = t.spans(s.origin);
      if (spans.empty()) return CaptureValue::leaf(std::nullopt);
      if (spans.size() == 1) return CaptureValue::leaf(spans[0]);
      throw InternalError(describe(s) + " recorded " + std::to_string(spans.size()) + " spans in one frame");
    }

    case K::Product: {
      std::vector<CaptureValue> members; members.reserve(s.ch.size());
      for (const auto& c : s.ch) members.push_back(build(c, t));
      return CaptureValue::product(std::move(members));
    }

    case K::Sum: {
      // Exactly one branch may have left anything in this frame
      const pat::Pattern& alternation = *s.origin;
      const auto& chosen = t.chosen(&alternation);
      if (chosen.size() > 1) {
        throw InternalError(describe(s) + " chose " + std::to_string(chosen.size()) + " times in one frame");
      }
      std::vector<std::size_t> live;
      for (std::size_t i = 0; i < alternation.ch.size(); ++i) {
        bool picked = std::find(chosen.begin(), chosen.end(), i) != chosen.end();
        if (picked || t.touches(alternation.ch[i])) live.push_back(i);
      }
      if (live.size() != 1) {
        throw InternalError(describe(s) + " has " + std::to_string(live.size()) + " non-empty branches, expected exactly one");
      }
      return CaptureValue::sum(live[0], build(s.ch[live[0]], t));
    }

    case K::Repeated: {
      std::vector<Trace> spread;
      auto frames = iterations(s, t, spread);
      std::vector<CaptureValue> items; items.reserve(frames.size());
      for (const Trace* f : frames) items.push_back(build(s.ch[0], *f));
      return CaptureValue::repeated(std::move(items));
    }

    case K::Opt: {
      std::vector<Trace> spread;
      auto frames = iterations(s, t, spread);
      if (frames.empty()) return CaptureValue::opt(std::nullopt);
      if (frames.size() == 1) return CaptureValue::opt(build(s.ch[0], *frames[0]));
      throw InternalError(describe(s) + " executed " + std::to_string(frames.size()) + " times");
    }
  }
  return {};
}

// Reject a trace that does not fit the pattern or the input: records for nodes
// outside their frame, records of the wrong node kind, branch indices past the
// alternation, or spans that are reversed or run past the end of the input.
inline void check_trace(const pat::Pattern& scope, const Trace& t, std::size_t input_size) {
  using Kind = pat::Pattern::Kind;
  std::unordered_set<NodeId> inside;
  std::function<void(const pat::Pattern&)> collect = [&](const pat::Pattern& p) {
    inside.insert(&p);
    for (const auto& c : p.ch) collect(c);
  };
  collect(scope);
  auto expect = [&](NodeId n, Kind k, const char* what) {
    if (!inside.count(n)) throw InternalError(std::string(what) + " recorded for a node outside its frame");
    if (n->kind != k) {
      throw InternalError(std::string(what) + " recorded for a " + pat::kind_name(n->kind) + " node");
    }
  };

  for (const auto& [n, spans] : t.captures) {
    if (spans.empty()) continue;
    expect(n, Kind::Capture, "span");
    for (const Span& sp : spans) {
      if (sp.begin > sp.end || sp.end > input_size) {
        throw InternalError("span " + std::to_string(sp.begin) + ".." + std::to_string(sp.end) +
                            " does not fit an input of " + std::to_string(input_size) + " bytes");
      }
    }
  }
  for (const auto& [n, picked] : t.choices) {
    if (picked.empty()) continue;
    expect(n, Kind::Alternation, "choice");
    for (std::size_t i : picked) {
      if (i >= n->ch.size()) {
        throw InternalError("choice " + std::to_string(i) + " past an alternation of " +
                            std::to_string(n->ch.size()) + " branches");
      }
    }
  }
  for (const auto& [n, frames] : t.loops) {
    if (frames.empty()) continue;
    expect(n, Kind::Quantifier, "iteration");
    for (const auto& f : frames) check_trace(n->ch[0], *f, input_size);
  }
}

} // namespace rxs
