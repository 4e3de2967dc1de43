#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "rxs/build.hpp"
#include "rxs/error.hpp"
#include "rxs/numbering.hpp"
#include "rxs/shape.hpp"
#include "rxs/trace.hpp"
#include "rxs/value.hpp"

namespace rxs {

// Flat value of a path whose enclosing Sum branch was not selected
inline CaptureValue absent_along(const ShapePath& path, std::size_t i) {
  for (; i < path.size(); ++i) {
    if (path[i].kind == Step::Kind::Each)  return CaptureValue::repeated({});
    if (path[i].kind == Step::Kind::Inner) return CaptureValue::opt(std::nullopt);
  }
  return CaptureValue::leaf(std::nullopt);
}

// Follow a capture's path through the value tree; Product/Sum steps vanish,
// Repeated/Opt steps are kept as structure
inline CaptureValue project_path(const CaptureShape& s, const CaptureValue& v, const ShapePath& path, std::size_t i) {
  if (static_cast<int>(s.kind) != static_cast<int>(v.kind)) {
    throw InternalError("value of kind " + std::string(kind_name(static_cast<CaptureShape::Kind>(v.kind))) +
                        " does not conform to " + describe(s));
  }
  if (i == path.size()) return v;
  const Step& st = path[i];
  switch (st.kind) {
    case Step::Kind::Member:
      return project_path(s.ch.at(st.index), v.ch.at(st.index), path, i + 1);
    case Step::Kind::Branch:
      if (v.selected != st.index) return absent_along(path, i + 1);
      return project_path(s.ch.at(st.index), v.ch.at(0), path, i + 1);
    case Step::Kind::Each: {
      std::vector<CaptureValue> items; items.reserve(v.ch.size());
      for (const auto& e : v.ch) items.push_back(project_path(s.ch[0], e, path, i + 1));
      return CaptureValue::repeated(std::move(items));
    }
    case Step::Kind::Inner:
      if (!v.present) return CaptureValue::opt(std::nullopt);
      return CaptureValue::opt(project_path(s.ch[0], v.ch[0], path, i + 1));
  }
  return v;
}

// Backreference-ordered result: [0] whole match, [k] capture k in its flat shape.
// Captures hidden inside an enclosing capture are not in the value tree and
// are built from the trace instead.
inline std::vector<CaptureValue> flatten(Span whole, const CaptureShape& shape, const CaptureValue& value,
                                         const std::vector<CaptureInfo>& captures, const Trace& trace) {
  std::vector<CaptureValue> out;
  out.reserve(captures.size() + 1);
  out.push_back(CaptureValue::leaf(whole));
  for (const auto& c : captures) {
    out.push_back(c.path ? project_path(shape, value, *c.path, 0) : build(c.flat, trace));
  }
  return out;
}

class Choice;

// Read-only view of one slot: its shape, its value and the matched input
class ValueRef {
public:
  ValueRef(const CaptureShape& s, const CaptureValue& v, std::string_view input)
    : shape_(&s), value_(&v), input_(input) {}

  CaptureShape::Kind kind() const { return shape_->kind; }
  const CaptureShape& shape() const { return *shape_; }
  const CaptureValue& value() const { return *value_; }
  const std::optional<std::string>& name() const { return shape_->name; }

  std::optional<Span> span() const {
    expect(CaptureShape::Kind::Leaf, "span");
    return value_->span;
  }
  std::optional<std::string_view> str() const {
    auto s = span();
    if (!s) return std::nullopt;
    return input_.substr(s->begin, s->size());
  }
  bool matched() const { return span().has_value(); }

  // Product members, Sum branches or Repeated items
  std::size_t size() const {
    if (kind() == CaptureShape::Kind::Product || kind() == CaptureShape::Kind::Sum) return shape_->ch.size();
    expect(CaptureShape::Kind::Repeated, "size");
    return value_->ch.size();
  }
  ValueRef operator[](std::size_t i) const {
    if (kind() == CaptureShape::Kind::Product) {
      if (i >= shape_->ch.size()) throw CaptureLookupError("member " + std::to_string(i) + " out of range");
      return ValueRef(shape_->ch[i], value_->ch.at(i), input_);
    }
    expect(CaptureShape::Kind::Repeated, "operator[]");
    if (i >= value_->ch.size()) throw CaptureLookupError("occurrence " + std::to_string(i) + " out of range");
    return ValueRef(shape_->ch[0], value_->ch[i], input_);
  }

  // Product member by label. A named slot that collapsed to a single leaf answers its own name.
  ValueRef member(const std::string& label) const {
    if (kind() == CaptureShape::Kind::Product) {
      for (std::size_t i = 0; i < shape_->ch.size(); ++i)
        if (shape_->ch[i].name == label) return (*this)[i];
    } else if (shape_->name == label) {
      return *this;
    }
    throw CaptureLookupError("no such named capture '" + label + "'");
  }

  bool present() const {
    expect(CaptureShape::Kind::Opt, "present");
    return value_->present;
  }
  ValueRef inner() const {
    if (!present()) throw CaptureLookupError("optional capture is absent");
    return ValueRef(shape_->ch[0], value_->ch[0], input_);
  }

  Choice choice() const;

private:
  void expect(CaptureShape::Kind k, const char* op) const {
    if (kind() != k) {
      throw CaptureLookupError(std::string(op) + " needs a " + kind_name(k) + " slot, this one is " + kind_name(kind()));
    }
  }

  const CaptureShape* shape_;
  const CaptureValue* value_;
  std::string_view input_;
};

// Sum slot accessors. Both views re-check that exactly one branch is populated.
class Choice {
public:
  Choice(const CaptureShape& s, const CaptureValue& v, std::string_view input)
    : shape_(&s), value_(&v), input_(input) {}

  std::size_t size() const { return shape_->ch.size(); }

  std::size_t index() const {
    if (value_->kind != CaptureValue::Kind::Sum || value_->ch.size() != 1 || value_->selected >= size()) {
      throw InternalError("Sum value does not hold exactly one selected branch");
    }
    return value_->selected;
  }
  ValueRef value() const {
    std::size_t i = index();
    return ValueRef(shape_->ch[i], value_->ch[0], input_);
  }

  // One entry per branch, exactly one populated
  std::vector<std::optional<ValueRef>> options() const {
    std::size_t i = index();
    std::vector<std::optional<ValueRef>> out(size());
    out[i] = ValueRef(shape_->ch[i], value_->ch[0], input_);
    std::size_t populated = 0;
    for (const auto& o : out) populated += o.has_value();
    if (populated != 1) throw InternalError("Sum projection populated " + std::to_string(populated) + " options");
    return out;
  }

  // Exhaustive dispatch: one handler per branch, in branch order
  template <class F, class... Fs>
  auto visit(F&& f, Fs&&... fs) const {
    using R = std::invoke_result_t<F&, const ValueRef&>;
    constexpr std::size_t n = 1 + sizeof...(Fs);
    if (n != size()) {
      throw CaptureLookupError("visit needs one handler per branch: got " + std::to_string(n) +
                               ", Sum has " + std::to_string(size()));
    }
    std::array<std::function<R(const ValueRef&)>, n> handlers{{std::forward<F>(f), std::forward<Fs>(fs)...}};
    return handlers[index()](value());
  }

private:
  const CaptureShape* shape_;
  const CaptureValue* value_;
  std::string_view input_;
};

inline Choice ValueRef::choice() const {
  expect(CaptureShape::Kind::Sum, "choice");
  return Choice(*shape_, *value_, input_);
}

} // namespace rxs
