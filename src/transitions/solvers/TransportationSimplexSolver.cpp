#include "transitions/solvers/TransportationSimplexSolver.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadEstimationSettings.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <sstream>

namespace nettrans {

    static const std::string LOG_SOURCE = "TRANSPORT_SIMPLEX";

    namespace {

    std::string formatNumber(double value) {
        std::ostringstream oss;
        oss.precision(10);
        oss << value;
        return oss.str();
    }

    } // namespace

    void TransportationSimplexSolver::configure(const std::map<std::string, double>& settings) {
        auto get = [&](const std::string& key, double def) {
            auto it = settings.find(key);
            return (it != settings.end()) ? it->second : def;
        };

        const double tolerance = get("marginal_tolerance", 1e-6);
        const int max_pivots = integerSetting(settings, "max_pivots", 10000, 1, "TransportationSimplexSolver::configure");

        if (!(tolerance > 0.0)) {
            THROW_INVALID_CONFIG("TransportationSimplexSolver::configure",
                                 "marginal_tolerance must be positive");
        }
        marginal_tolerance_ = tolerance;
        max_pivots_ = max_pivots;

        Logger::getInstance().debug(LOG_SOURCE, "Configured: marginal_tolerance=" + formatNumber(marginal_tolerance_) +
                                                ", max_pivots=" + std::to_string(max_pivots_));
    }

    std::shared_ptr<ITransportSolver> TransportationSimplexSolver::clone() const {
        return std::make_shared<TransportationSimplexSolver>(*this);
    }

    void TransportationSimplexSolver::validateMarginal(const Eigen::VectorXd& marginal, const std::string& name) const {
        const std::string source = "TransportationSimplexSolver::solve";
        for (Eigen::Index k = 0; k < marginal.size(); ++k) {
            if (!std::isfinite(marginal(k))) {
                THROW_INFEASIBLE(source, name + "[" + std::to_string(k) + "] is not finite");
            }
            if (marginal(k) < 0.0) {
                THROW_INFEASIBLE(source, name + "[" + std::to_string(k) + "] = " + formatNumber(marginal(k)) +
                                         " is negative, expected >= 0");
            }
        }
        const double total = marginal.sum();
        if (std::abs(total - 1.0) > marginal_tolerance_) {
            THROW_INFEASIBLE(source, name + " sums to " + formatNumber(total) + ", expected 1.0 ± " +
                                     formatNumber(marginal_tolerance_));
        }
    }

    std::vector<TransportationSimplexSolver::Cell> TransportationSimplexSolver::treePath(
        const std::vector<Cell>& basis, int rows, int cols, int row, int col) {

        // Nodes: rows are 0..rows-1, columns are rows..rows+cols-1; basic cells are edges.
        const int num_nodes = rows + cols;
        std::vector<std::vector<int>> adjacency(static_cast<size_t>(num_nodes));
        for (size_t e = 0; e < basis.size(); ++e) {
            adjacency[static_cast<size_t>(basis[e].first)].push_back(static_cast<int>(e));
            adjacency[static_cast<size_t>(rows + basis[e].second)].push_back(static_cast<int>(e));
        }

        std::vector<int> parent_edge(static_cast<size_t>(num_nodes), -1);
        std::vector<bool> visited(static_cast<size_t>(num_nodes), false);
        std::queue<int> frontier;
        frontier.push(row);
        visited[static_cast<size_t>(row)] = true;

        const int target = rows + col;
        while (!frontier.empty() && !visited[static_cast<size_t>(target)]) {
            const int node = frontier.front();
            frontier.pop();
            for (int e : adjacency[static_cast<size_t>(node)]) {
                const Cell& cell = basis[static_cast<size_t>(e)];
                const int other = (node < rows) ? rows + cell.second : cell.first;
                if (!visited[static_cast<size_t>(other)]) {
                    visited[static_cast<size_t>(other)] = true;
                    parent_edge[static_cast<size_t>(other)] = e;
                    frontier.push(other);
                }
            }
        }

        std::vector<Cell> path;
        if (!visited[static_cast<size_t>(target)]) {
            return path;
        }
        int node = target;
        while (node != row) {
            const Cell& cell = basis[static_cast<size_t>(parent_edge[static_cast<size_t>(node)])];
            path.push_back(cell);
            node = (node < rows) ? rows + cell.second : cell.first;
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    TransportSolution TransportationSimplexSolver::solve(const Eigen::VectorXd& supply,
                                                         const Eigen::VectorXd& demand,
                                                         const CostMatrix& cost) const {
        const std::string source = "TransportationSimplexSolver::solve";
        const int m = cost.size();
        const int n = cost.size();

        if (supply.size() != m || demand.size() != n) {
            THROW_INVALID_CONFIG(source, "Marginal sizes (" + std::to_string(supply.size()) + ", " +
                                         std::to_string(demand.size()) + ") do not match the " +
                                         std::to_string(m) + "x" + std::to_string(n) + " cost matrix");
        }
        validateMarginal(supply, "supply");
        validateMarginal(demand, "demand");

        const Eigen::MatrixXd& C = cost.values();

        // Balance exactly: demand carries the supply total.
        Eigen::VectorXd row_left = supply;
        Eigen::VectorXd col_left = demand * (supply.sum() / demand.sum());

        Eigen::MatrixXd flow = Eigen::MatrixXd::Zero(m, n);
        std::vector<std::vector<bool>> is_basic(static_cast<size_t>(m), std::vector<bool>(static_cast<size_t>(n), false));
        std::vector<Cell> basis;
        basis.reserve(static_cast<size_t>(m + n - 1));

        // --- North-west corner initial basis ---
        int i = 0;
        int j = 0;
        while (true) {
            const double x = std::min(row_left(i), col_left(j));
            flow(i, j) = x;
            basis.emplace_back(i, j);
            is_basic[static_cast<size_t>(i)][static_cast<size_t>(j)] = true;
            row_left(i) -= x;
            col_left(j) -= x;

            if (i == m - 1 && j == n - 1) break;
            if (i == m - 1) { ++j; continue; }
            if (j == n - 1) { ++i; continue; }
            if (row_left(i) <= col_left(j)) ++i; else ++j;
        }

        const double cost_scale = 1.0 + C.cwiseAbs().maxCoeff();
        const double reduced_cost_tol = 1e-12 * cost_scale;

        Eigen::VectorXd u(m);
        Eigen::VectorXd v(n);
        int pivots = 0;

        while (true) {
            // --- Dual potentials on the spanning tree (u_0 = 0) ---
            std::vector<bool> u_known(static_cast<size_t>(m), false);
            std::vector<bool> v_known(static_cast<size_t>(n), false);
            u(0) = 0.0;
            u_known[0] = true;
            bool progress = true;
            while (progress) {
                progress = false;
                for (const Cell& cell : basis) {
                    const size_t r = static_cast<size_t>(cell.first);
                    const size_t c = static_cast<size_t>(cell.second);
                    if (u_known[r] && !v_known[c]) {
                        v(cell.second) = C(cell.first, cell.second) - u(cell.first);
                        v_known[c] = true;
                        progress = true;
                    } else if (!u_known[r] && v_known[c]) {
                        u(cell.first) = C(cell.first, cell.second) - v(cell.second);
                        u_known[r] = true;
                        progress = true;
                    }
                }
            }

            // --- Entering cell (Bland: first negative reduced cost, row-major) ---
            int enter_row = -1;
            int enter_col = -1;
            for (int r = 0; r < m && enter_row < 0; ++r) {
                for (int c = 0; c < n; ++c) {
                    if (is_basic[static_cast<size_t>(r)][static_cast<size_t>(c)]) continue;
                    if (C(r, c) - u(r) - v(c) < -reduced_cost_tol) {
                        enter_row = r;
                        enter_col = c;
                        break;
                    }
                }
            }
            if (enter_row < 0) break;

            if (pivots >= max_pivots_) {
                THROW_INFEASIBLE(source, "no optimal basis after " + std::to_string(max_pivots_) + " pivots");
            }

            // --- Stepping-stone cycle: entering (+), then alternating -, +, ... along the tree path ---
            const std::vector<Cell> path = treePath(basis, m, n, enter_row, enter_col);
            if (path.empty()) {
                THROW_INFEASIBLE(source, "basis is not a spanning tree (internal error)");
            }

            double theta = std::numeric_limits<double>::infinity();
            for (size_t k = 0; k < path.size(); k += 2) {
                theta = std::min(theta, flow(path[k].first, path[k].second));
            }
            Cell leaving(m, n);
            for (size_t k = 0; k < path.size(); k += 2) {
                if (flow(path[k].first, path[k].second) <= theta && path[k] < leaving) {
                    leaving = path[k];
                }
            }

            flow(enter_row, enter_col) += theta;
            for (size_t k = 0; k < path.size(); ++k) {
                if (k % 2 == 0) {
                    flow(path[k].first, path[k].second) -= theta;
                } else {
                    flow(path[k].first, path[k].second) += theta;
                }
            }
            flow(leaving.first, leaving.second) = 0.0;

            basis.erase(std::find(basis.begin(), basis.end(), leaving));
            is_basic[static_cast<size_t>(leaving.first)][static_cast<size_t>(leaving.second)] = false;
            basis.emplace_back(enter_row, enter_col);
            is_basic[static_cast<size_t>(enter_row)][static_cast<size_t>(enter_col)] = true;

            ++pivots;
        }

        TransportSolution solution;
        solution.flow = flow.cwiseMax(0.0);
        solution.total_cost = (solution.flow.array() * C.array()).sum();
        solution.pivots = pivots;
        return solution;
    }

} // namespace nettrans
