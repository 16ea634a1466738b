#ifndef I_TRANSPORT_SOLVER_HPP
#define I_TRANSPORT_SOLVER_HPP

#include "transitions/CostMatrix.hpp"

#include <Eigen/Dense>
#include <memory>

namespace nettrans {

/**
 * @brief Optimal flow between two prevalence vectors.
 *
 * flow(i, j) is the prevalence mass moving from category i at the first age to
 * category j at the second. Row sums equal the supply, column sums the demand.
 */
struct TransportSolution {
    Eigen::MatrixXd flow;
    double total_cost = 0.0;
    int pivots = 0;
};

/**
 * @brief Interface for balanced transportation-problem solvers.
 */
class ITransportSolver {
public:
    virtual ~ITransportSolver() = default;

    /**
     * @brief Minimises sum cost(i,j) * flow(i,j) subject to the row sums equal
     *        to supply, column sums equal to demand and flow >= 0.
     *
     * @param supply Prevalence vector at the earlier age.
     * @param demand Prevalence vector at the later age.
     * @param cost Category-pair cost matrix.
     * @return An optimal basic solution. Identical inputs give bit-identical output.
     * @throws InfeasibleProblemException if a marginal has negative/non-finite
     *         entries or does not sum to one within tolerance.
     * @throws InvalidConfigException if vector sizes do not match the cost matrix.
     */
    virtual TransportSolution solve(const Eigen::VectorXd& supply,
                                    const Eigen::VectorXd& demand,
                                    const CostMatrix& cost) const = 0;

    virtual std::shared_ptr<ITransportSolver> clone() const = 0;
};

} // namespace nettrans

#endif // I_TRANSPORT_SOLVER_HPP
