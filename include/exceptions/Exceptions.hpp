#ifndef NETTRANS_EXCEPTIONS_HPP
#define NETTRANS_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace nettrans {

/**
 * @brief Base class for all errors raised by the estimation pipeline.
 *
 * Carries the originating component/function name so every failure reported
 * to the caller names where it happened. what() yields "[source] message".
 */
class NetTransitionException : public std::runtime_error {
public:
    NetTransitionException(const std::string& source, const std::string& message)
        : std::runtime_error("[" + source + "] " + message),
          source_(source),
          message_(message) {}

    const std::string& source() const { return source_; }
    const std::string& message() const { return message_; }

private:
    std::string source_;
    std::string message_;
};

/**
 * @brief The smoothing optimiser did not converge or the data cannot identify the model.
 */
class FitFailureException : public NetTransitionException {
public:
    FitFailureException(const std::string& source, const std::string& message)
        : NetTransitionException(source, "Fit failure: " + message) {}
};

/**
 * @brief Inconsistent configuration (category order, basis size, cost matrix shape, ...).
 */
class InvalidConfigException : public NetTransitionException {
public:
    InvalidConfigException(const std::string& source, const std::string& message)
        : NetTransitionException(source, "Invalid configuration: " + message) {}
};

/**
 * @brief A transport instance has invalid marginals (negative or not normalised).
 */
class InfeasibleProblemException : public NetTransitionException {
public:
    InfeasibleProblemException(const std::string& source, const std::string& message)
        : NetTransitionException(source, "Infeasible transport problem: " + message),
          detail_(message) {}

    /** @brief The violated invariant without the source/category prefix. */
    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

/**
 * @brief Too many bootstrap replicates failed to produce usable results.
 */
class InsufficientReplicatesException : public NetTransitionException {
public:
    InsufficientReplicatesException(const std::string& source, const std::string& message)
        : NetTransitionException(source, "Insufficient replicates: " + message) {}
};

/**
 * @brief Malformed settings or input data files.
 */
class DataFormatException : public NetTransitionException {
public:
    DataFormatException(const std::string& source, const std::string& message)
        : NetTransitionException(source, "Data format error: " + message) {}
};

} // namespace nettrans

#define THROW_INVALID_CONFIG(source, message) throw nettrans::InvalidConfigException((source), (message))
#define THROW_FIT_FAILURE(source, message) throw nettrans::FitFailureException((source), (message))
#define THROW_INFEASIBLE(source, message) throw nettrans::InfeasibleProblemException((source), (message))

#endif // NETTRANS_EXCEPTIONS_HPP
