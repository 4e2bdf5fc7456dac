#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "../include/adnet/train.hpp"
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

using namespace adnet;

namespace {

const std::vector<Example> OR_SET = {
    {{0.0, 0.0}, {0.0}},
    {{0.0, 1.0}, {1.0}},
    {{1.0, 0.0}, {1.0}},
    {{1.0, 1.0}, {1.0}},
};

const std::vector<Example> XOR_SET = {
    {{0.0, 0.0}, {0.0}},
    {{0.0, 1.0}, {1.0}},
    {{1.0, 0.0}, {1.0}},
    {{1.0, 1.0}, {0.0}},
};

// Mean squared error of the network over a set, without a trace
double batch_error(const Network& net, const std::vector<Example>& set) {
    double total = 0.0;
    for (const auto& ex : set) {
        auto out = run_network(ex.input, net);
        for (size_t i = 0; i < out.size(); ++i) {
            total += (ex.target[i] - out[i]) * (ex.target[i] - out[i]);
        }
    }
    return total / set.size();
}

// Redirects a stream into a buffer for the lifetime of the object
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream)
        : stream_(stream), old_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(old_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* old_;
};

size_t count_of(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

TrainingOptions quiet() {
    TrainingOptions options;
    options.report_timeout = false;
    return options;
}

} // namespace

TEST_CASE("Linearly separable OR trains with one neuron", "[train]") {
    std::mt19937 gen(42);
    Network net = create_network(2, {1}, gen);

    auto run = train(net, 0.9, 0.005, 10000, OR_SET);
    auto errors = run.collect();

    REQUIRE(run.status() == TrainingStatus::Converged);
    REQUIRE(errors.size() < 10000);
    REQUIRE(errors.back() < 0.005);
    for (size_t i = 0; i + 1 < errors.size(); ++i) {
        REQUIRE(errors[i] >= 0.005);
    }
    REQUIRE(errors.back() < errors.front());

    // The trained network actually computes OR
    for (const auto& ex : OR_SET) {
        REQUIRE(std::round(run_network(ex.input, net)[0]) == ex.target[0]);
    }
}

TEST_CASE("XOR needs a hidden layer", "[train]") {
    SECTION("A single neuron plateaus above epsilon") {
        std::mt19937 gen(42);
        Network net = create_network(2, {1}, gen);

        auto run = train(net, 0.9, 0.005, 2000, XOR_SET, quiet());
        auto errors = run.collect();

        REQUIRE(run.status() == TrainingStatus::TimedOut);
        REQUIRE(errors.size() == 2001);
        REQUIRE(errors.back() > 0.1);
    }

    SECTION("One hidden layer of three neurons converges") {
        std::mt19937 gen(42);
        Network net = create_network(2, {3, 1}, gen);

        auto run = train(net, 0.9, 0.005, 10000, XOR_SET);
        auto errors = run.collect();

        REQUIRE(run.status() == TrainingStatus::Converged);
        REQUIRE(errors.back() < 0.005);
    }

    SECTION("One hidden layer of two neurons converges") {
        std::mt19937 gen(123);
        Network net = create_network(2, {2, 1}, gen);

        auto run = train(net, 0.9, 0.005, 10000, XOR_SET);
        auto errors = run.collect();

        REQUIRE(run.status() == TrainingStatus::Converged);
        REQUIRE(errors.size() < 10001);
    }
}

TEST_CASE("Training is deterministic for a fixed seed", "[train]") {
    std::mt19937 g1(2024);
    std::mt19937 g2(2024);
    Network a = create_network(2, {3, 1}, g1);
    Network b = create_network(2, {3, 1}, g2);

    auto ea = train(a, 0.9, 0.005, 500, XOR_SET, quiet()).collect();
    auto eb = train(b, 0.9, 0.005, 500, XOR_SET, quiet()).collect();

    REQUIRE(ea.size() == eb.size());
    for (size_t i = 0; i < ea.size(); ++i) {
        REQUIRE(ea[i] == eb[i]);
    }
    REQUIRE(a.layers[1].neurons[0].weights == b.layers[1].neurons[0].weights);
}

TEST_CASE("Training run is lazy", "[train]") {
    std::mt19937 gen(1);
    Network net = create_network(2, {2, 1}, gen);
    Network initial = net;

    auto run = train(net, 0.5, 1e-12, 100, XOR_SET, quiet());

    SECTION("Nothing happens before the first pull") {
        REQUIRE(run.iteration() == 0);
        REQUIRE_FALSE(run.last_error().has_value());
        REQUIRE(net.layers[0].neurons[0].weights == initial.layers[0].neurons[0].weights);
    }

    SECTION("Each pull runs one iteration and emits the pre-update error") {
        double expected = batch_error(net, XOR_SET);
        auto first = run.next();

        REQUIRE(first.has_value());
        REQUIRE(approx_equal(*first, expected, 1e-12));
        REQUIRE(run.iteration() == 1);
        REQUIRE(run.status() == TrainingStatus::Running);
        REQUIRE(net.layers[0].neurons[0].weights != initial.layers[0].neurons[0].weights);

        // The network was updated before the value was handed out
        double after_step = batch_error(net, XOR_SET);
        auto second = run.next();
        REQUIRE(approx_equal(*second, after_step, 1e-12));
        REQUIRE(*second != *first);
    }

    SECTION("Consumer may stop early") {
        size_t taken = 0;
        for (double error : run) {
            REQUIRE(std::isfinite(error));
            if (++taken == 5) {
                break;
            }
        }
        REQUIRE(run.iteration() == 5);
        REQUIRE(run.status() == TrainingStatus::Running);
    }

    SECTION("Timeout bounds the sequence at timeout + 1 values") {
        auto errors = run.collect();
        REQUIRE(errors.size() == 101);
        REQUIRE(run.status() == TrainingStatus::TimedOut);
        REQUIRE_FALSE(run.next().has_value());
        REQUIRE(*run.last_error() == errors.back());
    }
}

TEST_CASE("One iteration is one batch gradient descent step", "[train]") {
    // Single neuron, single input: compare against the closed form
    Network net;
    net.inputs = 1;
    net.layers.push_back(Layer{{Neuron{{0.3}, -0.1}}});

    std::vector<Example> set = {{{1.0}, {1.0}}, {{-2.0}, {0.0}}};
    double eta = 0.7;

    double dw = 0.0;
    double db = 0.0;
    for (const auto& ex : set) {
        double x = ex.input[0];
        double y = 1.0 / (1.0 + std::exp(-(0.3 * x - 0.1)));
        double d = -2.0 * (ex.target[0] - y) * y * (1.0 - y) / set.size();
        dw += d * x;
        db += d;
    }

    auto run = train(net, eta, 0.0, 10, set, quiet());
    run.next();

    const Neuron& n = net.layers[0].neurons[0];
    REQUIRE(approx_equal(n.weights[0], 0.3 - eta * dw, 1e-12));
    REQUIRE(approx_equal(n.bias, -0.1 - eta * db, 1e-12));
}

TEST_CASE("Learning rate is not validated", "[train]") {
    std::mt19937 gen(5);
    Network net = create_network(2, {1}, gen);
    Network initial = net;

    auto errors = train(net, 0.0, 0.005, 20, OR_SET, quiet()).collect();

    REQUIRE(errors.size() == 21);
    REQUIRE(net.layers[0].neurons[0].weights == initial.layers[0].neurons[0].weights);
    for (double e : errors) {
        REQUIRE(e == errors.front());
    }
}

TEST_CASE("Parallel evaluation matches the single tape", "[train]") {
    std::mt19937 g1(9);
    std::mt19937 g2(9);
    Network serial = create_network(2, {3, 1}, g1);
    Network parallel = create_network(2, {3, 1}, g2);

    TrainingOptions options = quiet();
    auto es = train(serial, 0.9, 0.005, 200, XOR_SET, options).collect();
    options.parallel = true;
    auto ep = train(parallel, 0.9, 0.005, 200, XOR_SET, options).collect();

    REQUIRE(es.size() == ep.size());
    REQUIRE(es.front() == ep.front());
    for (size_t i = 0; i < es.size(); ++i) {
        REQUIRE(approx_equal(es[i], ep[i], 1e-9));
    }

    SECTION("and is deterministic run to run") {
        std::mt19937 g3(9);
        Network again = create_network(2, {3, 1}, g3);
        auto ea = train(again, 0.9, 0.005, 200, XOR_SET, options).collect();
        REQUIRE(ea == ep);
    }
}

TEST_CASE("Training input errors", "[train]") {
    std::mt19937 gen(3);
    Network net = create_network(2, {2, 1}, gen);

    SECTION("Empty training set fails fast") {
        REQUIRE_THROWS_AS(train(net, 0.9, 0.005, 10, {}), EmptyTrainingSet);
    }

    SECTION("Input length mismatch") {
        std::vector<Example> bad = {{{0.0, 1.0, 2.0}, {1.0}}};
        REQUIRE_THROWS_AS(train(net, 0.9, 0.005, 10, bad), DimensionMismatch);
    }

    SECTION("Target length mismatch") {
        std::vector<Example> bad = {{{0.0, 1.0}, {1.0, 0.0}}};
        REQUIRE_THROWS_AS(train(net, 0.9, 0.005, 10, bad), DimensionMismatch);
    }
}

TEST_CASE("Training reports progress and timeouts", "[train]") {
    std::mt19937 gen(11);
    Network net = create_network(2, {1}, gen);

    SECTION("Timeout warning goes to std::cerr") {
        StreamCapture err(std::cerr);
        auto run = train(net, 0.9, 0.005, 3, XOR_SET);
        auto errors = run.collect();

        REQUIRE(errors.size() == 4);
        REQUIRE(run.status() == TrainingStatus::TimedOut);
        REQUIRE(err.str() == "Failed to converge within 3 steps.\n");
    }

    SECTION("report_timeout = false keeps std::cerr quiet") {
        StreamCapture err(std::cerr);
        auto run = train(net, 0.9, 0.005, 3, XOR_SET, quiet());
        run.collect();

        REQUIRE(run.status() == TrainingStatus::TimedOut);
        REQUIRE(err.str().empty());
    }

    SECTION("verbose prints every log_every iterations") {
        TrainingOptions options = quiet();
        options.verbose = true;
        options.log_every = 2;

        StreamCapture out(std::cout);
        train(net, 0.9, 0.005, 4, XOR_SET, options).collect();

        std::string text = out.str();
        REQUIRE(count_of(text, "Iteration") == 3);
        REQUIRE(text.find("Iteration      0 | error") != std::string::npos);
        REQUIRE(text.find("Iteration      2 | error") != std::string::npos);
        REQUIRE(text.find("Iteration      4 | error") != std::string::npos);
        REQUIRE(text.find("Iteration      1 |") == std::string::npos);
    }

    SECTION("log_every = 0 disables progress lines") {
        TrainingOptions options = quiet();
        options.verbose = true;
        options.log_every = 0;

        StreamCapture out(std::cout);
        train(net, 0.9, 0.005, 4, XOR_SET, options).collect();

        REQUIRE(out.str().empty());
    }

    SECTION("verbose announces convergence") {
        TrainingOptions options = quiet();
        options.verbose = true;
        options.log_every = 0;

        StreamCapture out(std::cout);
        auto run = train(net, 0.9, 0.005, 10000, OR_SET, options);
        auto errors = run.collect();

        REQUIRE(run.status() == TrainingStatus::Converged);
        REQUIRE(out.str().find("Converged at iteration " + std::to_string(errors.size() - 1)) !=
                std::string::npos);
    }

    SECTION("Without verbose nothing is printed") {
        StreamCapture out(std::cout);
        train(net, 0.9, 0.005, 5, XOR_SET, quiet()).collect();
        REQUIRE(out.str().empty());
    }
}

TEST_CASE("begin() pulls an iteration", "[train]") {
    std::mt19937 gen(4);
    Network net = create_network(2, {2, 1}, gen);
    auto run = train(net, 0.9, 0.005, 100, XOR_SET, quiet());

    run.begin();
    REQUIRE(run.iteration() == 1);
    run.begin();
    REQUIRE(run.iteration() == 2);
}
