#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace adnet {

// Primitive operations recorded on the tape. The set is closed: every
// composite (sigmoid, dot, norm_sq, ...) is built from these.
enum class Op : std::uint8_t {
    Leaf,
    Add,
    Sub,
    Mul,
    Div,
    Neg,
    Exp
};

// One record of the computation graph
struct Node {
    double value;    // forward value
    double adjoint;  // d(root)/d(this), filled by reverse_trace
    Op op;
    size_t lhs;      // operand indices, Tape::npos when unused
    size_t rhs;
};

class Tape;

// Differentiable scalar: a handle to a node on a tape.
// Cheap to copy; only valid while the owning tape is alive and not cleared.
class Var {
public:
    Var() : tape_(nullptr), index_(0), generation_(0) {}
    Var(Tape* tape, size_t index, size_t generation)
        : tape_(tape), index_(index), generation_(generation) {}

    double value() const;
    double adjoint() const;

    Tape& tape() const {
        if (!tape_) {
            throw std::runtime_error("Var is not attached to a tape");
        }
        return *tape_;
    }

    size_t index() const { return index_; }
    size_t generation() const { return generation_; }
    bool valid() const { return tape_ != nullptr; }

private:
    Tape* tape_;
    size_t index_;
    size_t generation_;  // tape generation the node was pushed in
};

// Arena of nodes for one forward pass. Operands are always pushed before
// their consumers, so index order is a topological order of the graph.
class Tape {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    Tape() = default;

    // Vars hold a pointer to their tape
    Tape(const Tape&) = delete;
    Tape& operator=(const Tape&) = delete;
    Tape(Tape&&) = delete;
    Tape& operator=(Tape&&) = delete;

    // Leaf with no operands
    Var constant(double value);

    // Leaf meant to be read back through its adjoint; same record as constant
    Var variable(double value);

    Var add(Var a, Var b);
    Var sub(Var a, Var b);
    Var mul(Var a, Var b);
    Var div(Var a, Var b);
    Var neg(Var a);
    Var exp(Var a);

    // Zero the adjoint of every node reachable from root, each exactly once
    void reset_trace(Var root);

    // Set root's adjoint to seed and push adjoints back to every node
    // reachable from root. A node is propagated only after all of its
    // consumers have contributed to it.
    void reverse_trace(Var root, double seed = 1.0);

    const Node& node(size_t index) const { return nodes_.at(index); }

    // Node behind v; throws if v is from another tape or from before clear()
    const Node& node(Var v) const { return nodes_[check(v)]; }

    size_t size() const { return nodes_.size(); }
    size_t generation() const { return generation_; }
    void reserve(size_t n) { nodes_.reserve(n); }

    // Drops every node. Vars created before the call are rejected afterwards.
    void clear() {
        nodes_.clear();
        ++generation_;
    }

private:
    Var push(double value, Op op, size_t lhs, size_t rhs);
    size_t check(Var v) const;
    std::vector<bool> reachable(size_t root) const;

    std::vector<Node> nodes_;
    size_t generation_ = 0;
};

inline double Var::value() const { return tape().node(*this).value; }
inline double Var::adjoint() const { return tape().node(*this).adjoint; }

// ============================================================================
// Free-function and operator interface
// ============================================================================

inline Var add(Var a, Var b) { return a.tape().add(a, b); }
inline Var sub(Var a, Var b) { return a.tape().sub(a, b); }
inline Var mul(Var a, Var b) { return a.tape().mul(a, b); }
inline Var div(Var a, Var b) { return a.tape().div(a, b); }
inline Var neg(Var a) { return a.tape().neg(a); }
inline Var exp(Var a) { return a.tape().exp(a); }

inline Var operator+(Var a, Var b) { return add(a, b); }
inline Var operator-(Var a, Var b) { return sub(a, b); }
inline Var operator*(Var a, Var b) { return mul(a, b); }
inline Var operator/(Var a, Var b) { return div(a, b); }
inline Var operator-(Var a) { return neg(a); }

// Plain numbers are lifted to leaf constants on the Var's tape
inline Var operator+(Var a, double b) { return add(a, a.tape().constant(b)); }
inline Var operator+(double a, Var b) { return add(b.tape().constant(a), b); }
inline Var operator-(Var a, double b) { return sub(a, a.tape().constant(b)); }
inline Var operator-(double a, Var b) { return sub(b.tape().constant(a), b); }
inline Var operator*(Var a, double b) { return mul(a, a.tape().constant(b)); }
inline Var operator*(double a, Var b) { return mul(b.tape().constant(a), b); }
inline Var operator/(Var a, double b) { return div(a, a.tape().constant(b)); }
inline Var operator/(double a, Var b) { return div(b.tape().constant(a), b); }

} // namespace adnet
