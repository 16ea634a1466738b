#ifndef TRANSPORTATION_SIMPLEX_SOLVER_HPP
#define TRANSPORTATION_SIMPLEX_SOLVER_HPP

#include "transitions/interfaces/ITransportSolver.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace nettrans {

/**
 * @brief Transportation simplex (MODI / u-v method) specialised to the
 *        bipartite supply/demand structure.
 *
 * - Initial basis: north-west corner rule, m + n - 1 basic cells forming a
 *   spanning tree (degenerate zero cells kept in the basis).
 * - Dual potentials u_i + v_j = c_ij on basic cells.
 * - Entering cell: first non-basic cell in row-major order with negative
 *   reduced cost (Bland's rule).
 * - Leaving cell: first cell in row-major order among the minus-cells of the
 *   stepping-stone cycle that carry the minimum flow.
 *
 * Both tie-breaks are fixed, so the pivot sequence (and the output) depends only
 * on the inputs, and Bland's rule rules out cycling under degeneracy.
 * Marked final to encourage devirtualization.
 */
class TransportationSimplexSolver final : public ITransportSolver {
public:
    TransportationSimplexSolver() = default;

    /**
     * @brief Configure solver parameters.
     * Keys:
     * - "marginal_tolerance": Allowed deviation of each marginal's sum from 1 (default: 1e-6).
     * - "max_pivots": Pivot cap before giving up (default: 10000).
     */
    void configure(const std::map<std::string, double>& settings);

    TransportSolution solve(const Eigen::VectorXd& supply,
                            const Eigen::VectorXd& demand,
                            const CostMatrix& cost) const override;

    std::shared_ptr<ITransportSolver> clone() const override;

    double marginalTolerance() const { return marginal_tolerance_; }

private:
    using Cell = std::pair<int, int>;

    void validateMarginal(const Eigen::VectorXd& marginal, const std::string& name) const;

    /** @brief Basic cells on the tree path from row node `row` to column node `col`. */
    static std::vector<Cell> treePath(const std::vector<Cell>& basis, int rows, int cols, int row, int col);

    double marginal_tolerance_ = 1e-6;
    int max_pivots_ = 10000;
};

} // namespace nettrans

#endif // TRANSPORTATION_SIMPLEX_SOLVER_HPP
