#ifndef BOOTSTRAP_TYPES_HPP
#define BOOTSTRAP_TYPES_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief A replicate excluded from the aggregate, with the reason.
 */
struct ReplicateFailure {
    int replicate = -1;
    std::string message;
};

/**
 * @brief Pointwise percentile band of the net transition probabilities for one age step.
 */
struct TransitionBand {
    double age_from = 0.0;
    double age_to = 0.0;
    Eigen::MatrixXd lower;    // (1 - level) / 2 quantile
    Eigen::MatrixXd median;
    Eigen::MatrixXd upper;    // (1 + level) / 2 quantile
    Eigen::MatrixXd mean;
    Eigen::MatrixXd std_dev;

    bool contains(int from, int to, double value) const {
        return value >= lower(from, to) && value <= upper(from, to);
    }
};

/**
 * @brief Aggregate of a parametric bootstrap run.
 */
struct BootstrapSummary {
    std::vector<std::string> categories;
    double confidence_level = 0.95;

    int requested = 0;     ///< Replicates configured
    int attempted = 0;     ///< Replicates started before any deadline
    int successful = 0;    ///< Replicates contributing to the bands
    bool interrupted = false;

    std::vector<ReplicateFailure> failures;
    std::vector<TransitionBand> bands;   ///< One per consecutive age pair
};

} // namespace nettrans

#endif // BOOTSTRAP_TYPES_HPP
