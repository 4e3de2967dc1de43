#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rxs/pattern.hpp"
#include "rxs/trace.hpp"

namespace rxs {

namespace detail {

constexpr std::size_t no_target = ~std::size_t(0);

// One instruction of the flattened pattern
struct Op {
  enum class Code : uint8_t { Lit, Class, CapOpen, CapClose, Branch, Jump, LoopInit, LoopTest, IterBegin, IterEnd, LoopExit, Accept };
  Code code;
  const pat::Pattern* node = nullptr;
  // Branch: branch index. Jump, LoopTest: target. IterEnd: loop head
  std::size_t a = 0;
  // Branch: pc of the next alternative, no_target for the last one
  std::size_t b = no_target;
  // Alternations and loops without captures below leave nothing in the trace
  bool traced = true;
};

struct Compiler {
  std::vector<Op> code;

  std::size_t emit(Op op) { code.push_back(op); return code.size() - 1; }

  void node(const pat::Pattern& p) {
    using Kind = pat::Pattern::Kind;
    switch (p.kind) {
      case Kind::Literal:
        emit({p.is_class ? Op::Code::Class : Op::Code::Lit, &p});
        return;
      case Kind::Capture:
        emit({Op::Code::CapOpen, &p});
        node(p.ch[0]);
        emit({Op::Code::CapClose, &p});
        return;
      case Kind::Group:
        node(p.ch[0]);
        return;
      case Kind::Concat:
        for (const auto& c : p.ch) node(c);
        return;
      case Kind::Alternation: {
        bool traced = pat::has_capture(p);
        std::vector<std::size_t> ends;
        for (std::size_t i = 0; i < p.ch.size(); ++i) {
          std::size_t at = emit({Op::Code::Branch, &p, i, no_target, traced});
          node(p.ch[i]);
          ends.push_back(emit({Op::Code::Jump, &p}));
          if (i + 1 < p.ch.size()) code[at].b = code.size();
        }
        for (std::size_t e : ends) code[e].a = code.size();
        return;
      }
      case Kind::Quantifier: {
        bool traced = pat::has_capture(p.ch[0]);
        emit({Op::Code::LoopInit, &p});
        std::size_t head = emit({Op::Code::LoopTest, &p});
        emit({Op::Code::IterBegin, &p, 0, no_target, traced});
        node(p.ch[0]);
        emit({Op::Code::IterEnd, &p, head, no_target, traced});
        code[head].a = code.size();
        emit({Op::Code::LoopExit, &p});
        return;
      }
    }
  }
};

inline std::vector<Op> compile_program(const pat::Pattern& root) {
  Compiler c;
  c.node(root);
  c.emit({Op::Code::Accept});
  return std::move(c.code);
}

// Greedy backtracking over the flattened pattern. Choice points live on an
// explicit retry stack and every change to the trace or the loop state goes to
// an undo log, so input length never grows the native stack and a failed path
// leaves nothing behind.
struct Machine {
  std::string_view in;
  const std::vector<Op>& code;
  Trace& root;

  struct Loop { std::size_t count = 0; std::size_t start = 0; };
  struct Undo {
    enum class Kind : uint8_t { Record, Choose, Iterate, PopFrame, PushCap, PopCap, PushLoop, PopLoop, SetLoop };
    Kind kind;
    NodeId node = nullptr;
    Trace* frame = nullptr;
    Loop loop{};
    std::size_t value = 0;
  };
  struct Retry { std::size_t pc, pos, log; };

  std::vector<Trace*> frames;
  std::vector<std::size_t> starts;
  std::vector<Loop> loops;
  std::vector<Undo> log;
  std::vector<Retry> retry;

  void undo(const Undo& u) {
    switch (u.kind) {
      case Undo::Kind::Record:   u.frame->unrecord(u.node); break;
      case Undo::Kind::Choose:   u.frame->unchoose(u.node); break;
      case Undo::Kind::Iterate:  frames.pop_back(); u.frame->uniterate(u.node); break;
      case Undo::Kind::PopFrame: frames.push_back(u.frame); break;
      case Undo::Kind::PushCap:  starts.pop_back(); break;
      case Undo::Kind::PopCap:   starts.push_back(u.value); break;
      case Undo::Kind::PushLoop: loops.pop_back(); break;
      case Undo::Kind::PopLoop:  loops.push_back(u.loop); break;
      case Undo::Kind::SetLoop:  loops.back() = u.loop; break;
    }
  }

  void rewind(std::size_t size) {
    while (log.size() > size) { undo(log.back()); log.pop_back(); }
  }

  void set_loop(Loop l) {
    Undo u{Undo::Kind::SetLoop}; u.loop = loops.back();
    log.push_back(u);
    loops.back() = l;
  }

  std::optional<std::size_t> run(std::size_t start, bool anchored) {
    frames.assign(1, &root);
    starts.clear(); loops.clear(); log.clear(); retry.clear();
    std::size_t pc = 0, pos = start;
    for (;;) {
      const Op& op = code[pc];
      bool ok = true;
      switch (op.code) {
        case Op::Code::Lit: {
          const std::string& t = op.node->text;
          if (in.size() - pos >= t.size() && in.compare(pos, t.size(), t) == 0) { pos += t.size(); ++pc; }
          else ok = false;
          break;
        }
        case Op::Code::Class:
          if (pos < in.size() && pat::class_accepts(*op.node, static_cast<unsigned char>(in[pos]))) { ++pos; ++pc; }
          else ok = false;
          break;

        case Op::Code::CapOpen:
          starts.push_back(pos);
          log.push_back({Undo::Kind::PushCap});
          ++pc;
          break;
        case Op::Code::CapClose: {
          Undo popped{Undo::Kind::PopCap}; popped.value = starts.back();
          starts.pop_back();
          log.push_back(popped);
          frames.back()->record(op.node, Span{popped.value, pos});
          log.push_back({Undo::Kind::Record, op.node, frames.back()});
          ++pc;
          break;
        }

        case Op::Code::Branch:
          if (op.b != no_target) retry.push_back({op.b, pos, log.size()});
          if (op.traced) {
            frames.back()->choose(op.node, op.a);
            log.push_back({Undo::Kind::Choose, op.node, frames.back()});
          }
          ++pc;
          break;
        case Op::Code::Jump:
          pc = op.a;
          break;

        case Op::Code::LoopInit:
          loops.push_back(Loop{});
          log.push_back({Undo::Kind::PushLoop});
          ++pc;
          break;
        case Op::Code::LoopTest: {
          const pat::Pattern& q = *op.node;
          std::size_t count = loops.back().count;
          if (q.max && count >= *q.max) { pc = op.a; break; }
          if (count >= q.min) retry.push_back({op.a, pos, log.size()});
          ++pc;
          break;
        }
        case Op::Code::IterBegin: {
          set_loop({loops.back().count, pos});
          if (op.traced) {
            Trace* parent = frames.back();
            frames.push_back(&parent->iterate(op.node));
            log.push_back({Undo::Kind::Iterate, op.node, parent});
          }
          ++pc;
          break;
        }
        case Op::Code::IterEnd: {
          Loop l = loops.back();
          // An empty iteration past the minimum would loop forever
          if (pos == l.start && l.count >= op.node->min) { ok = false; break; }
          if (op.traced) {
            log.push_back({Undo::Kind::PopFrame, op.node, frames.back()});
            frames.pop_back();
          }
          set_loop({l.count + 1, l.start});
          pc = op.a;
          break;
        }
        case Op::Code::LoopExit: {
          Undo popped{Undo::Kind::PopLoop}; popped.loop = loops.back();
          loops.pop_back();
          log.push_back(popped);
          ++pc;
          break;
        }

        case Op::Code::Accept:
          if (anchored && pos != in.size()) { ok = false; break; }
          return pos;
      }
      if (ok) continue;
      if (retry.empty()) {
        rewind(0);
        return std::nullopt;
      }
      Retry r = retry.back();
      retry.pop_back();
      rewind(r.log);
      pc = r.pc;
      pos = r.pos;
    }
  }
};

inline std::optional<Span> trace_from(const std::vector<Op>& code, std::string_view input, std::size_t start,
                                      bool anchored, Trace& out) {
  Machine m{input, code, out};
  auto end = m.run(start, anchored);
  if (!end) return std::nullopt;
  return Span{start, *end};
}

} // namespace detail

// Whole-input match; fills `out` with the trace of the successful path
inline std::optional<Span> trace_match(const pat::Pattern& root, std::string_view input, Trace& out) {
  out = Trace{};
  return detail::trace_from(detail::compile_program(root), input, 0, true, out);
}

// Leftmost match anywhere in the input
inline std::optional<Span> trace_search(const pat::Pattern& root, std::string_view input, Trace& out) {
  auto code = detail::compile_program(root);
  for (std::size_t start = 0; start <= input.size(); ++start) {
    out = Trace{};
    if (auto s = detail::trace_from(code, input, start, false, out)) return s;
  }
  out = Trace{};
  return std::nullopt;
}

} // namespace rxs
