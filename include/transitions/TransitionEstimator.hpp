#ifndef TRANSITION_ESTIMATOR_HPP
#define TRANSITION_ESTIMATOR_HPP

#include "prevalence/SmoothModel.hpp"
#include "transitions/CostMatrix.hpp"
#include "transitions/TransitionTypes.hpp"
#include "transitions/interfaces/ITransportSolver.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Turns a smooth prevalence model into net transition matrices.
 *
 * For every consecutive pair (a, b) of the age grid the prevalence vectors at a
 * and b are matched by the transport solver; dividing each row of the optimal
 * flow by its supply gives the net transition probabilities for that step
 * (annual on an integer age grid).
 */
class TransitionEstimator {
public:
    /**
     * @param solver Transport solver strategy; nullptr selects TransportationSimplexSolver.
     */
    explicit TransitionEstimator(std::shared_ptr<ITransportSolver> solver = nullptr);

    /**
     * @brief Keys:
     * - "degenerate_supply_threshold": supply at or below which a row is given
     *   the identity transition (default: 1e-12).
     */
    void configure(const std::map<std::string, double>& settings);

    /**
     * @brief Point estimate across the grid.
     * @throws InvalidConfigException for a bad grid or a cost matrix built for another category order.
     * @throws InfeasibleProblemException naming the offending age pair.
     */
    TransitionEstimate estimate(const SmoothModel& model,
                                const std::vector<double>& age_grid,
                                const CostMatrix& cost) const;

    /**
     * @brief Transitions only (no prevalence table); used per bootstrap replicate.
     * @param log_warnings Warn about grid ages outside the fitted age range and
     *        about categories with no prevalence to leave from.
     */
    std::vector<AgeStepTransition> estimateSteps(const SmoothModel& model,
                                                 const std::vector<double>& age_grid,
                                                 const CostMatrix& cost,
                                                 bool log_warnings = true) const;

    /**
     * @brief Row-normalises a flow; rows with supply <= threshold become identity rows.
     * @param degenerate_rows Receives the indices of such rows (may be nullptr).
     */
    static Eigen::MatrixXd netTransitionProbabilities(const Eigen::MatrixXd& flow,
                                                      const Eigen::VectorXd& supply,
                                                      double threshold,
                                                      std::vector<int>* degenerate_rows);

    /** @brief Every integer age within the model's fitted range. */
    static std::vector<double> defaultAgeGrid(const SmoothModel& model);

    /** @throws InvalidConfigException unless the grid has >= 2 strictly increasing finite ages. */
    static void validateAgeGrid(const std::vector<double>& age_grid, const std::string& source);

    /** @brief Copy with its own solver instance, for use on another thread. */
    TransitionEstimator clone() const;

    const ITransportSolver& solver() const { return *solver_; }
    double degenerateSupplyThreshold() const { return degenerate_supply_threshold_; }

private:
    std::shared_ptr<ITransportSolver> solver_;
    double degenerate_supply_threshold_ = 1e-12;
};

} // namespace nettrans

#endif // TRANSITION_ESTIMATOR_HPP
