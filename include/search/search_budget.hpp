#pragma once

#include <atomic>
#include <chrono>

namespace amod {

/**
 * @brief Wall-clock and iteration budget for one local search
 *
 * The clock is shared by every task of a sweep (fork() keeps the start time),
 * the iteration count is per task so results do not depend on scheduling.
 */
class SearchBudget {
public:
    SearchBudget(double max_seconds, int max_iterations)
        : max_seconds_(max_seconds), max_iterations_(max_iterations) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        iterations_ = 0;
        exhausted_ = false;
    }

    // Same clock, fresh iteration count
    SearchBudget fork() const {
        SearchBudget copy(*this);
        copy.iterations_ = 0;
        copy.exhausted_ = false;
        return copy;
    }

    void set_cancel_flag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    void record_iteration() { iterations_++; }

    // can_continue() that remembers a refusal
    bool check() {
        if (can_continue()) return true;
        exhausted_ = true;
        return false;
    }

    bool exhausted() const { return exhausted_; }

    bool can_continue() const {
        if (is_cancelled()) return false;
        if (iterations_ >= max_iterations_) return false;
        return elapsed_seconds() < max_seconds_;
    }

    double elapsed_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int iterations() const { return iterations_; }
    bool is_iteration_exhausted() const { return iterations_ >= max_iterations_; }
    bool is_cancelled() const { return cancel_ && cancel_->load(); }

private:
    double max_seconds_;
    int max_iterations_;
    int iterations_ = 0;
    bool exhausted_ = false;
    const std::atomic<bool>* cancel_ = nullptr;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace amod
