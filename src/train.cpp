#include "../include/adnet/train.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

namespace adnet {

namespace {

void accumulate(Network& total, const Network& g) {
    for (size_t l = 0; l < total.layers.size(); ++l) {
        auto& neurons = total.layers[l].neurons;
        for (size_t n = 0; n < neurons.size(); ++n) {
            const Neuron& src = g.layers[l].neurons[n];
            for (size_t k = 0; k < neurons[n].weights.size(); ++k) {
                neurons[n].weights[k] += src.weights[k];
            }
            neurons[n].bias += src.bias;
        }
    }
}

} // namespace

void apply_gradient_step(Network& network, const Network& gradient, double eta) {
    for (size_t l = 0; l < network.layers.size(); ++l) {
        auto& neurons = network.layers[l].neurons;
        for (size_t n = 0; n < neurons.size(); ++n) {
            const Neuron& g = gradient.layers[l].neurons[n];
            for (size_t k = 0; k < neurons[n].weights.size(); ++k) {
                neurons[n].weights[k] = neurons[n].weights[k] - eta * g.weights[k];
            }
            neurons[n].bias = neurons[n].bias - eta * g.bias;
        }
    }
}

TrainingRun::TrainingRun(Network& network, double eta, double epsilon, size_t timeout,
                         std::vector<Example> examples, TrainingOptions options)
    : network_(&network), eta_(eta), epsilon_(epsilon), timeout_(timeout),
      examples_(std::move(examples)), options_(options) {

    if (examples_.empty()) {
        throw EmptyTrainingSet("train: training set is empty");
    }

    network_->validate();

    for (size_t i = 0; i < examples_.size(); ++i) {
        const Example& ex = examples_[i];
        if (ex.input.size() != network_->inputs) {
            throw DimensionMismatch("example " + std::to_string(i) + ": input length " +
                                    std::to_string(ex.input.size()) + ", network expects " +
                                    std::to_string(network_->inputs));
        }
        if (ex.target.size() != network_->outputs()) {
            throw DimensionMismatch("example " + std::to_string(i) + ": target length " +
                                    std::to_string(ex.target.size()) + ", network produces " +
                                    std::to_string(network_->outputs()));
        }
    }
}

std::optional<double> TrainingRun::next() {
    if (status_ != TrainingStatus::Running) {
        return std::nullopt;
    }

    double error = options_.parallel ? step_parallel() : step_serial();
    size_t iter = iteration_++;
    last_error_ = error;

    if (options_.verbose && options_.log_every > 0 && iter % options_.log_every == 0) {
        print_iteration_info(iter, error);
    }

    if (error < epsilon_) {
        status_ = TrainingStatus::Converged;
        if (options_.verbose) {
            std::cout << "\nConverged at iteration " << iter << std::endl;
            std::cout << "Final error: " << error << std::endl;
        }
    } else if (iter >= timeout_) {
        status_ = TrainingStatus::TimedOut;
        if (options_.report_timeout) {
            std::cerr << "Failed to converge within " << timeout_ << " steps." << std::endl;
        }
    }

    return error;
}

std::vector<double> TrainingRun::collect() {
    std::vector<double> errors;
    while (auto error = next()) {
        errors.push_back(*error);
    }
    return errors;
}

// Whole batch on one tape: the mean over examples is part of the trace
double TrainingRun::step_serial() {
    Tape tape;
    NetworkBinding binding = bind(tape, *network_);

    std::vector<Var> errors;
    errors.reserve(examples_.size());
    for (const auto& ex : examples_) {
        auto output = run_network(constants(tape, ex.input), binding);
        errors.push_back(norm_sq(sub(constants(tape, ex.target), output)));
    }

    Var error = mean(errors);
    tape.reset_trace(error);
    tape.reverse_trace(error, 1.0);

    apply_gradient_step(*network_, binding.gradients(), eta_);
    return error.value();
}

// One tape per example, seeded with 1/N. Gradients are summed in example
// order afterwards so the result does not depend on the thread schedule.
double TrainingRun::step_parallel() {
    size_t n = examples_.size();
    double scale = 1.0 / static_cast<double>(n);

    std::vector<Network> grads(n);
    std::vector<double> errors(n);

    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        Tape tape;
        NetworkBinding binding = bind(tape, *network_);

        const Example& ex = examples_[i];
        auto output = run_network(constants(tape, ex.input), binding);
        Var e = norm_sq(sub(constants(tape, ex.target), output));

        tape.reset_trace(e);
        tape.reverse_trace(e, scale);

        grads[i] = binding.gradients();
        errors[i] = e.value();
    }

    Network total = std::move(grads[0]);
    double error_sum = errors[0];
    for (size_t i = 1; i < n; ++i) {
        accumulate(total, grads[i]);
        error_sum += errors[i];
    }

    apply_gradient_step(*network_, total, eta_);
    return scale * error_sum;
}

void TrainingRun::print_iteration_info(size_t iter, double error) const {
    std::cout << "Iteration " << std::setw(6) << iter
              << " | error " << std::scientific << std::setprecision(6) << error
              << std::defaultfloat << std::endl;
}

TrainingRun train(Network& network, double eta, double epsilon, size_t timeout,
                  std::vector<Example> examples, TrainingOptions options) {
    return TrainingRun(network, eta, epsilon, timeout, std::move(examples), options);
}

} // namespace adnet
