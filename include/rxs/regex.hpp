#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rxs/build.hpp"
#include "rxs/error.hpp"
#include "rxs/numbering.hpp"
#include "rxs/pattern.hpp"
#include "rxs/project.hpp"
#include "rxs/shape.hpp"
#include "rxs/trace.hpp"
#include "rxs/tracer.hpp"
#include "rxs/value.hpp"

namespace rxs {

// Everything derived from a pattern at compile time. Immutable once built and
// shared read-only by every match.
struct Program {
  pat::Pattern root;
  CaptureShape shape;
  std::vector<CaptureInfo> captures;                    // element k-1 is group k
  std::unordered_map<std::string, std::size_t> names;   // name -> group
  CaptureShape whole = CaptureShape::make(CaptureShape::Kind::Leaf, nullptr);
};

class Match {
public:
  Match(std::shared_ptr<const Program> prog, std::string input, Span whole,
        CaptureValue value, std::vector<CaptureValue> flat)
    : prog_(std::move(prog)), input_(std::move(input)), whole_(whole),
      value_(std::move(value)), flat_(std::move(flat)) {}

  Span whole() const { return whole_; }
  std::size_t size() const { return flat_.size(); }
  const std::string& input() const { return input_; }

  // Position k in backreference order; 0 is the whole match
  const CaptureValue& operator[](std::size_t k) const {
    check(k);
    return flat_[k];
  }
  const CaptureShape& shape(std::size_t k) const {
    check(k);
    return k == 0 ? prog_->whole : prog_->captures[k - 1].flat;
  }
  ValueRef at(std::size_t k) const { return ValueRef(shape(k), flat_[k], input_); }
  ValueRef at(const std::string& name) const { return at(lookup(name)); }

  std::optional<Span> span(std::size_t k) const { return at(k).span(); }
  std::optional<std::string_view> str(std::size_t k) const { return at(k).str(); }

  const CaptureValue& named(const std::string& name) const { return flat_[lookup(name)]; }
  std::optional<std::string_view> str(const std::string& name) const { return at(name).str(); }

  // Structured view over the whole shape tree
  ValueRef root() const { return ValueRef(prog_->shape, value_, input_); }
  const CaptureValue& value() const { return value_; }

private:
  void check(std::size_t k) const {
    if (k >= flat_.size()) {
      throw CaptureLookupError("capture " + std::to_string(k) + " out of range, pattern has " +
                               std::to_string(flat_.size() - 1));
    }
  }
  std::size_t lookup(const std::string& name) const {
    auto it = prog_->names.find(name);
    if (it == prog_->names.end()) throw CaptureLookupError("no such named capture '" + name + "'");
    return it->second;
  }

  std::shared_ptr<const Program> prog_;
  std::string input_;
  Span whole_;
  CaptureValue value_;
  std::vector<CaptureValue> flat_;
};

inline std::ostream& operator<<(std::ostream& os, const Match& m) {
  for (std::size_t k = 0; k < m.size(); ++k) {
    os << (k ? " " : "") << k << "=" << m[k];
  }
  return os;
}

inline std::string to_string(const Match& m) {
  std::ostringstream os; os << m; return os.str();
}

class Regex {
public:
  static Regex compile(pat::Pattern p) {
    pat::validate(p);
    auto prog = std::make_shared<Program>();
    prog->root = std::move(p);
    prog->shape = infer(prog->root);
    prog->captures = capture_table(prog->root, prog->shape);
    prog->names = name_table(prog->captures);
    return Regex(std::move(prog));
  }

  const pat::Pattern& pattern() const { return prog_->root; }
  const CaptureShape& shape() const { return prog_->shape; }
  const std::vector<CaptureInfo>& captures() const { return prog_->captures; }
  std::size_t capture_count() const { return prog_->captures.size(); }

  const CaptureInfo& capture(std::size_t k) const {
    if (k == 0 || k > prog_->captures.size()) {
      throw CaptureLookupError("capture " + std::to_string(k) + " out of range, pattern has " +
                               std::to_string(prog_->captures.size()));
    }
    return prog_->captures[k - 1];
  }

  std::optional<std::size_t> index_of(const std::string& name) const {
    auto it = prog_->names.find(name);
    if (it == prog_->names.end()) return std::nullopt;
    return it->second;
  }

  // Resolve a named accessor once, where it is defined rather than per match
  std::size_t require(const std::string& name) const {
    if (auto k = index_of(name)) return *k;
    throw CaptureLookupError("no such named capture '" + name + "'");
  }

  // Assemble a result from a trace produced by any engine
  Match evaluate(Span whole, const Trace& trace, std::string input) const {
    if (whole.begin > whole.end || whole.end > input.size()) {
      throw InternalError("match " + std::to_string(whole.begin) + ".." + std::to_string(whole.end) +
                          " does not fit an input of " + std::to_string(input.size()) + " bytes");
    }
    check_trace(prog_->root, trace, input.size());
    CaptureValue value = build(prog_->shape, trace);
    std::vector<CaptureValue> flat = flatten(whole, prog_->shape, value, prog_->captures, trace);
    return Match(prog_, std::move(input), whole, std::move(value), std::move(flat));
  }

  std::optional<Match> match(std::string_view input) const {
    Trace trace;
    auto whole = trace_match(prog_->root, input, trace);
    if (!whole) return std::nullopt;
    return evaluate(*whole, trace, std::string(input));
  }

  std::optional<Match> search(std::string_view input) const {
    Trace trace;
    auto whole = trace_search(prog_->root, input, trace);
    if (!whole) return std::nullopt;
    return evaluate(*whole, trace, std::string(input));
  }

private:
  explicit Regex(std::shared_ptr<const Program> prog) : prog_(std::move(prog)) {}

  std::shared_ptr<const Program> prog_;
};

} // namespace rxs
