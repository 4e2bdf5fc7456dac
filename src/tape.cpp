#include "../include/adnet/tape.hpp"
#include <cmath>
#include <stdexcept>

namespace adnet {

Var Tape::push(double value, Op op, size_t lhs, size_t rhs) {
    nodes_.push_back(Node{value, 0.0, op, lhs, rhs});
    return Var(this, nodes_.size() - 1, generation_);
}

size_t Tape::check(Var v) const {
    if (&v.tape() != this) {
        throw std::runtime_error("Var belongs to a different tape");
    }
    if (v.generation() != generation_ || v.index() >= nodes_.size()) {
        throw std::runtime_error("Var refers to a node that is no longer on the tape");
    }
    return v.index();
}

// ============================================================================
// Primitive operations
// ============================================================================

Var Tape::constant(double value) {
    return push(value, Op::Leaf, npos, npos);
}

Var Tape::variable(double value) {
    return push(value, Op::Leaf, npos, npos);
}

Var Tape::add(Var a, Var b) {
    size_t i = check(a), j = check(b);
    return push(nodes_[i].value + nodes_[j].value, Op::Add, i, j);
}

Var Tape::sub(Var a, Var b) {
    size_t i = check(a), j = check(b);
    return push(nodes_[i].value - nodes_[j].value, Op::Sub, i, j);
}

Var Tape::mul(Var a, Var b) {
    size_t i = check(a), j = check(b);
    return push(nodes_[i].value * nodes_[j].value, Op::Mul, i, j);
}

Var Tape::div(Var a, Var b) {
    size_t i = check(a), j = check(b);
    return push(nodes_[i].value / nodes_[j].value, Op::Div, i, j);
}

Var Tape::neg(Var a) {
    size_t i = check(a);
    return push(-nodes_[i].value, Op::Neg, i, npos);
}

Var Tape::exp(Var a) {
    size_t i = check(a);
    return push(std::exp(nodes_[i].value), Op::Exp, i, npos);
}

// ============================================================================
// Backward pass
// ============================================================================

// Marks every node reachable from root through operand links. Operands have
// smaller indices than their consumers, so the mask only needs root + 1 slots.
std::vector<bool> Tape::reachable(size_t root) const {
    std::vector<bool> visited(root + 1, false);
    std::vector<size_t> stack = {root};
    visited[root] = true;

    while (!stack.empty()) {
        size_t i = stack.back();
        stack.pop_back();

        const Node& n = nodes_[i];
        for (size_t operand : {n.lhs, n.rhs}) {
            if (operand != npos && !visited[operand]) {
                visited[operand] = true;
                stack.push_back(operand);
            }
        }
    }

    return visited;
}

void Tape::reset_trace(Var root) {
    size_t r = check(root);
    std::vector<bool> live = reachable(r);

    for (size_t i = 0; i <= r; ++i) {
        if (live[i]) {
            nodes_[i].adjoint = 0.0;
        }
    }
}

void Tape::reverse_trace(Var root, double seed) {
    size_t r = check(root);
    std::vector<bool> live = reachable(r);

    nodes_[r].adjoint = seed;

    // Descending index order visits every consumer before its operands
    for (size_t i = r + 1; i-- > 0;) {
        if (!live[i]) {
            continue;
        }

        const Node& n = nodes_[i];
        double g = n.adjoint;

        switch (n.op) {
            case Op::Leaf:
                break;
            case Op::Add:
                nodes_[n.lhs].adjoint += g;
                nodes_[n.rhs].adjoint += g;
                break;
            case Op::Sub:
                nodes_[n.lhs].adjoint += g;
                nodes_[n.rhs].adjoint -= g;
                break;
            case Op::Mul: {
                // Read both values first: lhs and rhs may be the same node
                double a = nodes_[n.lhs].value;
                double b = nodes_[n.rhs].value;
                nodes_[n.lhs].adjoint += g * b;
                nodes_[n.rhs].adjoint += g * a;
                break;
            }
            case Op::Div: {
                // Quotient rule: d(a/b)/da = 1/b, d(a/b)/db = -a/b^2
                double a = nodes_[n.lhs].value;
                double b = nodes_[n.rhs].value;
                nodes_[n.lhs].adjoint += g / b;
                nodes_[n.rhs].adjoint += -g * a / (b * b);
                break;
            }
            case Op::Neg:
                nodes_[n.lhs].adjoint -= g;
                break;
            case Op::Exp:
                // d(exp(a))/da = exp(a), already stored as the node value
                nodes_[n.lhs].adjoint += g * n.value;
                break;
        }
    }
}

} // namespace adnet
