/**
 * @file outcome.hpp
 * @brief Success-or-failure value passed from isolated components to the pipeline
 */

#pragma once

#include <string>
#include <variant>
#include <utility>
#include <stdexcept>

namespace Driftwatch {

/**
 * @brief Why an isolated call failed.
 */
struct Failure {
    std::string kind;     // "data_source", "action_execution", "internal"
    std::string message;
};

/**
 * @brief Either a value of T or a Failure.
 *
 * Lets the orchestrator treat partial failure as data instead of control flow.
 */
template <typename T>
class Outcome {
public:
    static Outcome success(T value) { return Outcome(std::move(value)); }
    static Outcome failure(std::string kind, std::string message) {
        return Outcome(Failure{std::move(kind), std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) throw std::logic_error("Outcome holds a failure: " + error().message);
        return std::get<T>(state_);
    }

    T& value() {
        if (!ok()) throw std::logic_error("Outcome holds a failure: " + error().message);
        return std::get<T>(state_);
    }

    const Failure& error() const {
        if (ok()) throw std::logic_error("Outcome holds a value");
        return std::get<Failure>(state_);
    }

private:
    explicit Outcome(T value) : state_(std::move(value)) {}
    explicit Outcome(Failure failure) : state_(std::move(failure)) {}

    std::variant<T, Failure> state_;
};

} // namespace Driftwatch
