#pragma once

#include "tape.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

namespace adnet {

// ============================================================================
// Composite operations
//
// Everything here is expressed with the tape primitives, so none of it
// needs a derivative rule of its own.
// ============================================================================

// Lift plain values onto a tape as leaf constants
inline std::vector<Var> constants(Tape& tape, const std::vector<double>& values) {
    std::vector<Var> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(tape.constant(v));
    }
    return out;
}

// Read the forward values back out
inline std::vector<double> values(const std::vector<Var>& xs) {
    std::vector<double> out;
    out.reserve(xs.size());
    for (const Var& x : xs) {
        out.push_back(x.value());
    }
    return out;
}

inline Var sum(const std::vector<Var>& xs) {
    if (xs.empty()) {
        throw std::runtime_error("sum of an empty sequence");
    }
    Var total = xs[0];
    for (size_t i = 1; i < xs.size(); ++i) {
        total = total + xs[i];
    }
    return total;
}

// (1/n) * sum(xs)
inline Var mean(const std::vector<Var>& xs) {
    if (xs.empty()) {
        throw EmptyTrainingSet("mean over zero elements");
    }
    return (1.0 / static_cast<double>(xs.size())) * sum(xs);
}

inline Var dot(const std::vector<Var>& xs, const std::vector<Var>& ys) {
    if (xs.size() != ys.size()) {
        throw DimensionMismatch("dot: length " + std::to_string(xs.size()) +
                                " vs " + std::to_string(ys.size()));
    }
    if (xs.empty()) {
        throw std::runtime_error("dot of empty vectors");
    }
    Var total = xs[0] * ys[0];
    for (size_t i = 1; i < xs.size(); ++i) {
        total = total + xs[i] * ys[i];
    }
    return total;
}

// Elementwise xs - ys
inline std::vector<Var> sub(const std::vector<Var>& xs, const std::vector<Var>& ys) {
    if (xs.size() != ys.size()) {
        throw DimensionMismatch("sub: length " + std::to_string(xs.size()) +
                                " vs " + std::to_string(ys.size()));
    }
    std::vector<Var> out;
    out.reserve(xs.size());
    for (size_t i = 0; i < xs.size(); ++i) {
        out.push_back(xs[i] - ys[i]);
    }
    return out;
}

// Squared Euclidean norm
inline Var norm_sq(const std::vector<Var>& xs) {
    return dot(xs, xs);
}

// ============================================================================
// Activation functions
// ============================================================================

inline Var sigmoid(Var x) {
    return 1.0 / (1.0 + exp(-x));
}

inline Var tanh(Var x) {
    Var e = exp(-2.0 * x);
    return (1.0 - e) / (1.0 + e);
}

} // namespace adnet
