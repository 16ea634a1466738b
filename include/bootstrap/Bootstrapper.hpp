#ifndef BOOTSTRAPPER_HPP
#define BOOTSTRAPPER_HPP

#include "bootstrap/BootstrapTypes.hpp"
#include "prevalence/SmoothModel.hpp"
#include "transitions/CostMatrix.hpp"
#include "transitions/TransitionEstimator.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Parametric bootstrap of the net transition probabilities.
 *
 * Each replicate draws coefficients from N(beta_hat, V) of the fitted
 * SmoothModel, re-derives the prevalence curves and reruns the transition
 * estimator. Pointwise percentile bands are then taken per age step and
 * category pair.
 *
 * PARALLELISM:
 * Replicates run under OpenMP (when available). Replicate r owns its RNG,
 * seeded from (random_seed, r), and writes only to slot r, so results do not
 * depend on the number of threads or on scheduling. The model and cost matrix
 * are shared read-only. Aggregation is a serial reduction after the join.
 *
 * FAILURE POLICY:
 * A replicate raising InfeasibleProblemException is logged with its index and
 * excluded. If fewer than max(2, ceil(min_success_fraction * attempted))
 * replicates succeed the run fails with InsufficientReplicatesException.
 * Any other exception from a replicate is rethrown after the join.
 */
class Bootstrapper {
public:
    explicit Bootstrapper(std::shared_ptr<ITransportSolver> solver = nullptr);

    /**
     * @brief Configures the bootstrap.
     *
     * @param settings Map of configuration keys:
     *   - "bootstrap_replicates": Number of replicates (default: 1000)
     *   - "random_seed": Base seed for reproducible resampling (default: 20240101)
     *   - "confidence_level": Band coverage in (0, 1) (default: 0.95)
     *   - "min_success_fraction": Required share of successful replicates (default: 0.9)
     *   - "max_seconds": Wall-clock budget, 0 for none (default: 0)
     *   - "num_threads": OpenMP threads, 0 for the runtime default (default: 0)
     *   Estimator keys (e.g. "degenerate_supply_threshold") are forwarded.
     * @throws InvalidConfigException for out-of-range values.
     */
    void configure(const std::map<std::string, double>& settings);

    /**
     * @brief Runs the bootstrap.
     * @throws InvalidConfigException for a bad grid or mismatched cost matrix (before any replicate runs).
     * @throws InsufficientReplicatesException if too many replicates failed.
     */
    BootstrapSummary run(const SmoothModel& model,
                         const std::vector<double>& age_grid,
                         const CostMatrix& cost) const;

    /** @brief Linear-interpolation quantile of an ascending sample. */
    static double quantile(const std::vector<double>& sorted, double probability);

    int replicates() const { return replicates_; }
    std::uint64_t seed() const { return seed_; }
    double confidenceLevel() const { return confidence_level_; }

private:
    TransitionEstimator estimator_;

    int replicates_ = 1000;
    std::uint64_t seed_ = 20240101;
    double confidence_level_ = 0.95;
    double min_success_fraction_ = 0.9;
    double max_seconds_ = 0.0;
    int num_threads_ = 0;
};

} // namespace nettrans

#endif // BOOTSTRAPPER_HPP
