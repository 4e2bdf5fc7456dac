#pragma once

#include "network.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

namespace adnet {

struct Example {
    std::vector<double> input;
    std::vector<double> target;
};

enum class TrainingStatus {
    Running,
    Converged,  // an emitted error fell below epsilon
    TimedOut    // iteration `timeout` finished without converging
};

struct TrainingOptions {
    bool verbose = false;        // progress lines on std::cout
    size_t log_every = 100;      // iterations between progress lines, 0 for none
    bool report_timeout = true;  // warn on std::cerr when the step budget runs out
    bool parallel = false;       // one tape per example, evaluated with OpenMP
};

// Lazily produced sequence of training errors. Each call to next() runs one
// full batch iteration: forward over every example, backward, then a single
// gradient descent step on the network. The value returned is the error
// before that step.
class TrainingRun {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;
        using pointer = const double*;
        using reference = const double&;

        iterator() : run_(nullptr), current_(0.0) {}
        explicit iterator(TrainingRun* run) : run_(run), current_(0.0) { advance(); }

        reference operator*() const { return current_; }
        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return run_ == other.run_; }
        bool operator!=(const iterator& other) const { return run_ != other.run_; }

    private:
        void advance() {
            auto next = run_->next();
            if (next) {
                current_ = *next;
            } else {
                run_ = nullptr;
            }
        }

        TrainingRun* run_;
        double current_;
    };

    // Throws EmptyTrainingSet or DimensionMismatch before any iteration runs
    TrainingRun(Network& network, double eta, double epsilon, size_t timeout,
                std::vector<Example> examples, TrainingOptions options = {});

    // Error of the next iteration, or nullopt once converged or timed out
    std::optional<double> next();

    // Drain the remaining iterations
    std::vector<double> collect();

    // Not a view: begin() pulls the first value, so every call runs one
    // more iteration. Iterate a run once.
    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    TrainingStatus status() const { return status_; }
    size_t iteration() const { return iteration_; }
    std::optional<double> last_error() const { return last_error_; }

private:
    double step_serial();
    double step_parallel();
    void print_iteration_info(size_t iter, double error) const;

    Network* network_;
    double eta_;
    double epsilon_;
    size_t timeout_;
    std::vector<Example> examples_;
    TrainingOptions options_;

    TrainingStatus status_ = TrainingStatus::Running;
    size_t iteration_ = 0;
    std::optional<double> last_error_;
};

// Batch gradient descent on `network` (mutated in place). The network must
// outlive the returned run.
TrainingRun train(Network& network, double eta, double epsilon, size_t timeout,
                  std::vector<Example> examples, TrainingOptions options = {});

// network <- network - eta * gradient
void apply_gradient_step(Network& network, const Network& gradient, double eta);

} // namespace adnet
