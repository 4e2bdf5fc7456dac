#include "../include/adnet/network.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace adnet {

size_t Network::parameter_count() const {
    size_t count = 0;
    for (const auto& layer : layers) {
        for (const auto& neuron : layer.neurons) {
            count += neuron.weights.size() + 1;
        }
    }
    return count;
}

void Network::validate() const {
    size_t expected = inputs;
    for (size_t l = 0; l < layers.size(); ++l) {
        for (const auto& neuron : layers[l].neurons) {
            if (neuron.weights.size() != expected) {
                throw DimensionMismatch("layer " + std::to_string(l) + ": neuron has " +
                                        std::to_string(neuron.weights.size()) +
                                        " weights, expected " + std::to_string(expected));
            }
        }
        expected = layers[l].size();
    }
}

NetworkBinding bind(Tape& tape, const Network& network) {
    NetworkBinding binding;
    binding.inputs = network.inputs;
    binding.activation = network.activation;
    binding.layers.reserve(network.layers.size());

    tape.reserve(tape.size() + network.parameter_count());

    for (const auto& layer : network.layers) {
        LayerBinding bound;
        bound.reserve(layer.size());
        for (const auto& neuron : layer.neurons) {
            NeuronBinding b;
            b.weights.reserve(neuron.weights.size());
            for (double w : neuron.weights) {
                b.weights.push_back(tape.variable(w));
            }
            b.bias = tape.variable(neuron.bias);
            bound.push_back(std::move(b));
        }
        binding.layers.push_back(std::move(bound));
    }

    return binding;
}

Network NetworkBinding::gradients() const {
    Network grad;
    grad.inputs = inputs;
    grad.activation = activation;
    grad.layers.reserve(layers.size());

    for (const auto& layer : layers) {
        Layer out;
        out.neurons.reserve(layer.size());
        for (const auto& neuron : layer) {
            Neuron g;
            g.weights.reserve(neuron.weights.size());
            for (const Var& w : neuron.weights) {
                g.weights.push_back(w.adjoint());
            }
            g.bias = neuron.bias.adjoint();
            out.neurons.push_back(std::move(g));
        }
        grad.layers.push_back(std::move(out));
    }

    return grad;
}

Var activate(Var x, Activation activation) {
    switch (activation) {
        case Activation::Sigmoid:
            return sigmoid(x);
        case Activation::Tanh:
            return tanh(x);
    }
    throw std::runtime_error("activate: unknown activation");
}

Var run_neuron(const std::vector<Var>& input, const NeuronBinding& neuron,
               Activation activation) {
    return activate(dot(input, neuron.weights) + neuron.bias, activation);
}

std::vector<Var> run_layer(const std::vector<Var>& input, const LayerBinding& layer,
                           Activation activation) {
    std::vector<Var> out;
    out.reserve(layer.size());
    for (const auto& neuron : layer) {
        if (neuron.weights.size() != input.size()) {
            throw DimensionMismatch("run_layer: expected " + std::to_string(neuron.weights.size()) +
                                    " inputs, got " + std::to_string(input.size()));
        }
        out.push_back(run_neuron(input, neuron, activation));
    }
    return out;
}

std::vector<Var> run_network(const std::vector<Var>& input, const NetworkBinding& network) {
    if (input.size() != network.inputs) {
        throw DimensionMismatch("run_network: expected " + std::to_string(network.inputs) +
                                " inputs, got " + std::to_string(input.size()));
    }

    std::vector<Var> x = input;
    for (const auto& layer : network.layers) {
        x = run_layer(x, layer, network.activation);
    }
    return x;
}

std::vector<double> run_network(const std::vector<double>& input, const Network& network) {
    Tape tape;
    NetworkBinding binding = bind(tape, network);
    return values(run_network(constants(tape, input), binding));
}

} // namespace adnet
