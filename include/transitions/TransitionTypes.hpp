#ifndef TRANSITION_TYPES_HPP
#define TRANSITION_TYPES_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Net transitions between two consecutive ages of the grid.
 */
struct AgeStepTransition {
    double age_from = 0.0;
    double age_to = 0.0;

    Eigen::VectorXd supply;          ///< Prevalence at age_from
    Eigen::VectorXd demand;          ///< Prevalence at age_to
    Eigen::MatrixXd flow;            ///< Optimal transport plan (rows sum to supply, columns to demand)
    Eigen::MatrixXd probabilities;   ///< flow rows divided by supply (rows sum to 1)
    double total_cost = 0.0;

    /** Rows whose supply was ~0; their probabilities are the identity row. */
    std::vector<int> degenerate_rows;
};

/**
 * @brief Point estimate over a full age grid.
 */
struct TransitionEstimate {
    std::vector<std::string> categories;
    std::vector<double> ages;
    Eigen::MatrixXd prevalence;      ///< ages.size() x K
    std::vector<AgeStepTransition> steps;

    bool hasDegenerateRows() const {
        for (const auto& step : steps) {
            if (!step.degenerate_rows.empty()) return true;
        }
        return false;
    }
};

} // namespace nettrans

#endif // TRANSITION_TYPES_HPP
