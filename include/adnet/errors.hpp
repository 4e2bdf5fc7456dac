#pragma once

#include <stdexcept>
#include <string>

namespace adnet {

// Vector length disagrees with a layer's arity or with the network output
class DimensionMismatch : public std::runtime_error {
public:
    explicit DimensionMismatch(const std::string& what)
        : std::runtime_error(what) {}
};

// Mean over zero examples
class EmptyTrainingSet : public std::runtime_error {
public:
    explicit EmptyTrainingSet(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace adnet
