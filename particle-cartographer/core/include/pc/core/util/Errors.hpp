#pragma once

#include <stdexcept>
#include <string>

namespace pc {

// Rejected arguments: empty volume, negative radius, empty radius list,
// malformed selection policy. Raised before any radius is processed.
class InputError : public std::invalid_argument {
public:
    explicit InputError(const std::string& what) : std::invalid_argument(what) {}
};

// A single radius failed inside split/contacts/guard. Aborts the sweep.
class RadiusProcessingError : public std::runtime_error {
public:
    RadiusProcessingError(int radius, const std::string& cause)
        : std::runtime_error("radius " + std::to_string(radius) + ": " + cause)
        , radius_(radius)
        , cause_(cause)
    {
    }

    [[nodiscard]] int radius() const noexcept { return radius_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    int radius_;
    std::string cause_;
};

// Raised by a selection stage that cannot decide on the given results.
class SelectionFailure : public std::runtime_error {
public:
    explicit SelectionFailure(const std::string& what) : std::runtime_error(what) {}
};

// Both the constraint-based selection and the Pareto fallback failed.
class OptimizationFailure : public std::runtime_error {
public:
    OptimizationFailure(const std::string& constraintCause, const std::string& fallbackCause)
        : std::runtime_error("radius selection failed (constraint-based: " + constraintCause +
                             "; pareto-fallback: " + fallbackCause + ")")
        , constraintCause_(constraintCause)
        , fallbackCause_(fallbackCause)
    {
    }

    [[nodiscard]] const std::string& constraintCause() const noexcept { return constraintCause_; }
    [[nodiscard]] const std::string& fallbackCause() const noexcept { return fallbackCause_; }

private:
    std::string constraintCause_;
    std::string fallbackCause_;
};

// Cancellation observed between two radii. Not a failure; no summary exists.
class OptimizationCancelled : public std::runtime_error {
public:
    explicit OptimizationCancelled(int nextRadius)
        : std::runtime_error("optimization cancelled before radius " + std::to_string(nextRadius))
        , nextRadius_(nextRadius)
    {
    }

    [[nodiscard]] int nextRadius() const noexcept { return nextRadius_; }

private:
    int nextRadius_;
};

}  // namespace pc
