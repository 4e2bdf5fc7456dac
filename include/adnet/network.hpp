#pragma once

#include "tape.hpp"
#include "ops.hpp"
#include "errors.hpp"
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace adnet {

enum class Activation {
    Sigmoid,  // 1 / (1 + exp(-x))
    Tanh
};

struct Neuron {
    std::vector<double> weights;  // one per input
    double bias = 0.0;
};

struct Layer {
    std::vector<Neuron> neurons;

    size_t size() const { return neurons.size(); }
    size_t inputs() const { return neurons.empty() ? 0 : neurons.front().weights.size(); }
};

// Fully connected feedforward network. Parameters are stored as plain values
// between passes and bound onto a fresh tape for each evaluation.
struct Network {
    size_t inputs = 0;
    std::vector<Layer> layers;
    Activation activation = Activation::Sigmoid;

    size_t outputs() const { return layers.empty() ? inputs : layers.back().size(); }
    size_t parameter_count() const;

    // Throws DimensionMismatch if any layer's arity disagrees with its input
    void validate() const;
};

// Weights and biases drawn uniformly from [-0.5, 0.5)
template <typename Generator>
Network create_network(size_t inputs, const std::vector<size_t>& layer_sizes, Generator& gen) {
    if (inputs == 0) {
        throw std::invalid_argument("create_network: input count must be positive");
    }

    std::uniform_real_distribution<double> dist(-0.5, 0.5);

    Network net;
    net.inputs = inputs;
    net.layers.reserve(layer_sizes.size());

    size_t fan_in = inputs;
    for (size_t size : layer_sizes) {
        if (size == 0) {
            throw std::invalid_argument("create_network: layer sizes must be positive");
        }

        Layer layer;
        layer.neurons.resize(size);
        for (auto& neuron : layer.neurons) {
            neuron.weights.resize(fan_in);
            for (auto& w : neuron.weights) {
                w = dist(gen);
            }
            neuron.bias = dist(gen);
        }

        net.layers.push_back(std::move(layer));
        fan_in = size;
    }

    return net;
}

// ============================================================================
// Parameters bound to a tape
// ============================================================================

struct NeuronBinding {
    std::vector<Var> weights;
    Var bias;
};

using LayerBinding = std::vector<NeuronBinding>;

struct NetworkBinding {
    size_t inputs = 0;
    std::vector<LayerBinding> layers;
    Activation activation = Activation::Sigmoid;

    // Adjoints of every weight and bias, laid out like the bound network
    Network gradients() const;
};

// Place every weight and bias of the network on the tape as a leaf
NetworkBinding bind(Tape& tape, const Network& network);

// ============================================================================
// Forward evaluation
// ============================================================================

Var activate(Var x, Activation activation);

// activation(dot(input, weights) + bias)
Var run_neuron(const std::vector<Var>& input, const NeuronBinding& neuron,
               Activation activation = Activation::Sigmoid);

std::vector<Var> run_layer(const std::vector<Var>& input, const LayerBinding& layer,
                           Activation activation = Activation::Sigmoid);

// Folds run_layer over the layers; the trace links back to every parameter
std::vector<Var> run_network(const std::vector<Var>& input, const NetworkBinding& network);

// Pure evaluation on a private tape
std::vector<double> run_network(const std::vector<double>& input, const Network& network);

} // namespace adnet
