/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the aggregation and conversation layers.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace crowdpulse::domain {

/** @brief Malformed filter key, day-type label, message or history turn. */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/** @brief Transport or engine failure while talking to the inference engine. */
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Engine is reachable but the configured model is not loaded. */
class InferenceUnavailable : public std::runtime_error {
public:
    explicit InferenceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

/** @brief A row could not be aggregated (non-finite coordinates, infinite metric, misfiled key). */
class InternalAggregationError : public std::runtime_error {
public:
    explicit InternalAggregationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace crowdpulse::domain
