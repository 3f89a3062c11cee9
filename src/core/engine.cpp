#include "fractran/engine.hpp"
#include <sstream>
#include <stdexcept>

namespace fractran {

const char* to_string(HaltReason reason) {
    switch (reason) {
        case HaltReason::Running:
            return "running";
        case HaltReason::NoApplicableFraction:
            return "no applicable fraction";
        case HaltReason::ZeroNumerator:
            return "zero numerator";
        case HaltReason::StepLimit:
            return "step limit";
    }
    return "unknown";
}

// ============================================================================
// Trace
// ============================================================================

Trace::Trace(Integer start) {
    states_.push_back(std::move(start));
}

const Integer& Trace::last_live_state() const {
    for (auto it = states_.rbegin(); it != states_.rend(); ++it) {
        if (sgn(*it) != 0) {
            return *it;
        }
    }
    return states_.front();
}

std::vector<size_t> Trace::fire_counts(size_t program_size) const {
    std::vector<size_t> counts(program_size, 0);
    for (auto idx : transitions_) {
        if (idx < program_size) {
            counts[idx]++;
        }
    }
    return counts;
}

void Trace::push_transition(Integer next, size_t fraction_index) {
    bool zero = sgn(next) == 0;
    states_.push_back(std::move(next));
    transitions_.push_back(fraction_index);
    if (zero) {
        halt_reason_ = HaltReason::ZeroNumerator;
    }
}

void Trace::push_halt(HaltReason reason) {
    states_.push_back(Integer(0));
    halt_reason_ = reason;
}

// ============================================================================
// Engine
// ============================================================================

Engine::Engine(Program program, Integer start)
    : program_(std::move(program))
    , trace_(validate_start(start)) {}

const Integer& Engine::validate_start(const Integer& start) {
    if (sgn(start) <= 0) {
        throw ConfigurationError("Starting value " + start.get_str() + " must be a positive integer");
    }
    return start;
}

void Engine::step(Verbosity verbosity) {
    if (trace_.halted()) {
        throw std::logic_error("Cannot step a halted trace");
    }

    const Integer& current = trace_.back();
    Integer product;
    for (size_t i = 0; i < program_.size(); ++i) {
        const auto& fraction = program_[i];

        if (verbosity == Verbosity::Attempts) {
            *log_ << "% [verbose] trying " << fraction.to_string() << " * " << current << "\n";
        }

        product = fraction.numerator() * current;
        if (mpz_divisible_p(product.get_mpz_t(), fraction.denominator().get_mpz_t())) {
            Integer next;
            mpz_divexact(next.get_mpz_t(), product.get_mpz_t(), fraction.denominator().get_mpz_t());
            if (verbosity != Verbosity::Silent) {
                *log_ << "% [verbose] N_" << trace_.size() << " = " << fraction.to_string()
                      << " * " << current << " = " << next
                      << " = " << factorize(next) << "\n";
            }
            trace_.push_transition(std::move(next), i);
            return;
        }
    }

    if (verbosity != Verbosity::Silent) {
        *log_ << "% [verbose] no applicable fraction for " << current << ", halting\n";
    }
    trace_.push_halt(HaltReason::NoApplicableFraction);
}

Integer Engine::run(const std::optional<Integer>& start, Verbosity verbosity,
                    size_t max_steps) {
    if (start) {
        validate_start(*start);
        trace_ = Trace(*start);
    }

    while (!trace_.halted()) {
        step(verbosity);
        // 停止済みなら 0 を重ねて追記しない
        if (!trace_.halted() && trace_.size() + 1 > max_steps) {
            if (verbosity != Verbosity::Silent) {
                *log_ << "% [verbose] step limit " << max_steps << " reached, halting\n";
            }
            trace_.push_halt(HaltReason::StepLimit);
        }
    }

    return trace_.last_live_state();
}

std::string Engine::to_string() const {
    std::ostringstream oss;
    const auto& states = trace_.states();
    const auto& transitions = trace_.transitions();

    for (size_t i = 0; i < states.size(); ++i) {
        if (i > 0) oss << "\n";
        if (sgn(states[i]) == 0) {
            oss << "0 (halted: " << fractran::to_string(trace_.halt_reason()) << ")";
        } else {
            oss << factorize(states[i]);
        }
        if (i < transitions.size()) {
            const auto& fraction = program_[transitions[i]];
            oss << "\n*" << fraction.to_string() << " (" << fraction_label(transitions[i]) << ")";
        }
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Engine& engine) {
    return os << engine.to_string();
}

} // namespace fractran
