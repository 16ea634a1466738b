#include "transitions/TransitionEstimator.hpp"
#include "transitions/solvers/TransportationSimplexSolver.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace nettrans {

    static const std::string LOG_SOURCE = "TransitionEstimator";

    namespace {

    std::string formatAge(double age) {
        std::ostringstream oss;
        oss << age;
        return oss.str();
    }

    } // namespace

    TransitionEstimator::TransitionEstimator(std::shared_ptr<ITransportSolver> solver)
        : solver_(solver ? std::move(solver) : std::make_shared<TransportationSimplexSolver>()) {}

    void TransitionEstimator::configure(const std::map<std::string, double>& settings) {
        auto it = settings.find("degenerate_supply_threshold");
        if (it != settings.end()) {
            if (!(it->second >= 0.0)) {
                THROW_INVALID_CONFIG("TransitionEstimator::configure",
                                     "degenerate_supply_threshold must be non-negative, got " + std::to_string(it->second));
            }
            degenerate_supply_threshold_ = it->second;
        }
    }

    TransitionEstimator TransitionEstimator::clone() const {
        TransitionEstimator copy(solver_->clone());
        copy.degenerate_supply_threshold_ = degenerate_supply_threshold_;
        return copy;
    }

    void TransitionEstimator::validateAgeGrid(const std::vector<double>& age_grid, const std::string& source) {
        if (age_grid.size() < 2) {
            THROW_INVALID_CONFIG(source, "Age grid needs at least two ages, got " + std::to_string(age_grid.size()));
        }
        for (size_t i = 0; i < age_grid.size(); ++i) {
            if (!std::isfinite(age_grid[i])) {
                THROW_INVALID_CONFIG(source, "Age grid entry " + std::to_string(i) + " is not finite");
            }
            if (i > 0 && !(age_grid[i] > age_grid[i - 1])) {
                THROW_INVALID_CONFIG(source, "Age grid must be strictly increasing: age " + formatAge(age_grid[i]) +
                                             " follows " + formatAge(age_grid[i - 1]));
            }
        }
    }

    std::vector<double> TransitionEstimator::defaultAgeGrid(const SmoothModel& model) {
        std::vector<double> grid;
        const int first = static_cast<int>(std::ceil(model.minAge()));
        const int last = static_cast<int>(std::floor(model.maxAge()));
        for (int age = first; age <= last; ++age) {
            grid.push_back(static_cast<double>(age));
        }
        return grid;
    }

    Eigen::MatrixXd TransitionEstimator::netTransitionProbabilities(const Eigen::MatrixXd& flow,
                                                                    const Eigen::VectorXd& supply,
                                                                    double threshold,
                                                                    std::vector<int>* degenerate_rows) {
        const Eigen::Index K = flow.rows();
        Eigen::MatrixXd probabilities = Eigen::MatrixXd::Zero(K, flow.cols());
        for (Eigen::Index i = 0; i < K; ++i) {
            const double row_total = flow.row(i).sum();
            if (supply(i) <= threshold || !(row_total > 0.0)) {
                // No outflow to measure: treat the category as absorbing for this step.
                probabilities(i, i) = 1.0;
                if (degenerate_rows) degenerate_rows->push_back(static_cast<int>(i));
                continue;
            }
            probabilities.row(i) = flow.row(i) / row_total;
        }
        return probabilities;
    }

    std::vector<AgeStepTransition> TransitionEstimator::estimateSteps(const SmoothModel& model,
                                                                      const std::vector<double>& age_grid,
                                                                      const CostMatrix& cost,
                                                                      bool log_warnings) const {
        const std::string source = "TransitionEstimator::estimate";
        validateAgeGrid(age_grid, source);
        cost.requireCategoryOrder(model.categories(), source);

        if (log_warnings) {
            // The fitted curves are flat outside the data's age range.
            const auto outside = std::count_if(age_grid.begin(), age_grid.end(), [&model](double age) {
                return age < model.minAge() || age > model.maxAge();
            });
            if (outside > 0) {
                Logger::getInstance().warning(LOG_SOURCE, std::to_string(outside) +
                                                          " grid age(s) lie outside the fitted age range [" +
                                                          formatAge(model.minAge()) + ", " + formatAge(model.maxAge()) +
                                                          "]; prevalence there is held at the boundary value.");
            }
        }

        std::vector<AgeStepTransition> steps;
        steps.reserve(age_grid.size() - 1);

        Eigen::VectorXd current = model.prevalence(age_grid.front());
        for (size_t a = 0; a + 1 < age_grid.size(); ++a) {
            AgeStepTransition step;
            step.age_from = age_grid[a];
            step.age_to = age_grid[a + 1];
            step.supply = current;
            step.demand = model.prevalence(step.age_to);

            TransportSolution solution;
            try {
                solution = solver_->solve(step.supply, step.demand, cost);
            } catch (const InfeasibleProblemException& e) {
                THROW_INFEASIBLE(source, "age " + formatAge(step.age_from) + " -> " + formatAge(step.age_to) +
                                         ": " + e.detail());
            }

            step.flow = std::move(solution.flow);
            step.total_cost = solution.total_cost;
            step.probabilities = netTransitionProbabilities(step.flow, step.supply,
                                                            degenerate_supply_threshold_, &step.degenerate_rows);

            if (log_warnings && !step.degenerate_rows.empty()) {
                std::string names;
                for (int r : step.degenerate_rows) {
                    names += (names.empty() ? "" : ", ") + model.categories()[static_cast<size_t>(r)];
                }
                Logger::getInstance().warning(LOG_SOURCE, "Age " + formatAge(step.age_from) + " -> " +
                                                          formatAge(step.age_to) + ": no prevalence in {" + names +
                                                          "}; transition set to identity.");
            }

            current = step.demand;
            steps.push_back(std::move(step));
        }
        return steps;
    }

    TransitionEstimate TransitionEstimator::estimate(const SmoothModel& model,
                                                     const std::vector<double>& age_grid,
                                                     const CostMatrix& cost) const {
        TransitionEstimate estimate;
        estimate.steps = estimateSteps(model, age_grid, cost, true);
        estimate.categories = model.categories();
        estimate.ages = age_grid;
        estimate.prevalence = model.prevalenceTable(age_grid);

        Logger::getInstance().info(LOG_SOURCE, "Estimated " + std::to_string(estimate.steps.size()) +
                                               " transition matrices over ages " + formatAge(age_grid.front()) +
                                               " to " + formatAge(age_grid.back()));
        return estimate;
    }

} // namespace nettrans
