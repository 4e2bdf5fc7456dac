#pragma once

// Main header for the adnet library
// Reverse-mode automatic differentiation on scalars and feedforward
// network training by batch gradient descent

#include "errors.hpp"
#include "tape.hpp"
#include "ops.hpp"
#include "network.hpp"
#include "train.hpp"

namespace adnet {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

} // namespace adnet
