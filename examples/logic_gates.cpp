#include <adnet/adnet.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <random>
#include <vector>

using namespace adnet;

// Train a network on a truth table and print the learned outputs
void run_experiment(const std::string& name, const std::vector<size_t>& layers,
                    const std::vector<Example>& table, std::mt19937& gen) {
    std::cout << "\n=== " << name << " with layers [";
    for (size_t i = 0; i < layers.size(); ++i) {
        std::cout << (i ? ", " : "") << layers[i];
    }
    std::cout << "] ===" << std::endl;

    Network net = create_network(2, layers, gen);

    TrainingOptions options;
    options.verbose = true;
    options.log_every = 1000;

    auto run = train(net, 0.9, 0.005, 10000, table, options);
    auto errors = run.collect();

    std::cout << "Iterations: " << errors.size()
              << (run.status() == TrainingStatus::Converged ? " (converged)" : " (timed out)")
              << std::endl;

    for (const auto& ex : table) {
        auto out = run_network(ex.input, net);
        std::cout << "  " << ex.input[0] << " " << ex.input[1]
                  << " -> " << std::fixed << std::setprecision(4) << out[0]
                  << " (target " << ex.target[0] << ")" << std::defaultfloat << std::endl;
    }
}

int main() {
    std::mt19937 gen(42);

    std::vector<Example> train_or = {
        {{0.0, 0.0}, {0.0}},
        {{0.0, 1.0}, {1.0}},
        {{1.0, 0.0}, {1.0}},
        {{1.0, 1.0}, {1.0}},
    };

    std::vector<Example> train_xor = {
        {{0.0, 0.0}, {0.0}},
        {{0.0, 1.0}, {1.0}},
        {{1.0, 0.0}, {1.0}},
        {{1.0, 1.0}, {0.0}},
    };

    // Linearly separable: a single neuron is enough
    run_experiment("OR", {1}, train_or, gen);

    // Not linearly separable: a single neuron plateaus, a hidden layer learns it
    run_experiment("XOR", {1}, train_xor, gen);
    run_experiment("XOR", {3, 1}, train_xor, gen);

    return 0;
}
