#include "prevalence/PrevalenceSmoother.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadEstimationSettings.hpp"

#include <Eigen/Cholesky>
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace nettrans {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "PrevalenceSmoother";

    void PrevalenceSmoother::configure(const std::map<std::string, double>& settings) {
        const std::string source = "PrevalenceSmoother::configure";
        auto get = [&](const std::string& key, double def) {
            auto it = settings.find(key);
            return (it != settings.end()) ? it->second : def;
        };

        const int basis_size = integerSetting(settings, "basis_size", basis_size_, 4, source);
        const int penalty_order = integerSetting(settings, "penalty_order", 2, 1, source);
        const int reference_category = integerSetting(settings, "reference_category", 0, 0, source);
        const int max_newton_iterations = integerSetting(settings, "max_newton_iterations", 100, 1, source);
        const int lambda_sweeps = integerSetting(settings, "lambda_sweeps", 2, 1, source);
        const double tolerance = get("tolerance", 1e-8);
        const double log10_lambda_min = get("log10_lambda_min", -2.0);
        const double log10_lambda_max = get("log10_lambda_max", 6.0);
        const double log10_lambda_step = get("log10_lambda_step", 0.5);

        if (penalty_order > 3) {
            THROW_INVALID_CONFIG(source, "penalty_order must be 1, 2 or 3, got " + std::to_string(penalty_order));
        }
        if (basis_size > 0 && basis_size <= penalty_order) {
            THROW_INVALID_CONFIG(source,
                                 "basis_size (" + std::to_string(basis_size) + ") must exceed penalty_order (" +
                                 std::to_string(penalty_order) + ")");
        }
        if (!(tolerance > 0.0)) {
            THROW_INVALID_CONFIG(source, "tolerance must be positive");
        }
        if (!(log10_lambda_step > 0.0) || !(log10_lambda_max >= log10_lambda_min)) {
            THROW_INVALID_CONFIG(source,
                                 "Smoothing grid needs log10_lambda_step > 0 and log10_lambda_max >= log10_lambda_min");
        }

        basis_size_ = basis_size;
        penalty_order_ = penalty_order;
        reference_category_ = reference_category;
        max_newton_iterations_ = max_newton_iterations;
        lambda_sweeps_ = lambda_sweeps;
        tolerance_ = tolerance;
        log10_lambda_min_ = log10_lambda_min;
        log10_lambda_max_ = log10_lambda_max;
        log10_lambda_step_ = log10_lambda_step;

        logger.info(LOG_SOURCE, "Configured smoother: BasisSize=" +
                                (basis_size_ > 0 ? std::to_string(basis_size_) : std::string("auto")) +
                                ", PenaltyOrder=" + std::to_string(penalty_order_) +
                                ", Reference=" + std::to_string(reference_category_) +
                                ", LambdaGrid=[" + std::to_string(log10_lambda_min_) + ", " +
                                std::to_string(log10_lambda_max_) + "] step " + std::to_string(log10_lambda_step_));
    }

    int PrevalenceSmoother::basisSizeFor(double age_range) const {
        if (basis_size_ > 0) {
            return basis_size_;
        }
        // Roughly one basis function per five years of age.
        const int derived = static_cast<int>(std::ceil(age_range / 5.0)) + 3;
        return std::max(5, derived);
    }

    SmoothModel PrevalenceSmoother::fit(const std::vector<CategoryCount>& records,
                                        const std::vector<std::string>& category_order) const {
        if (records.empty()) {
            THROW_FIT_FAILURE("PrevalenceSmoother::fit", "No records supplied.");
        }
        return fit(aggregateCounts(records, category_order));
    }

    int PrevalenceSmoother::contrastCategory(const Problem& problem, int contrast) const {
        return contrast < problem.reference ? contrast : contrast + 1;
    }

    PrevalenceSmoother::Problem PrevalenceSmoother::buildProblem(const CountTable& table) const {
        const std::string source = "PrevalenceSmoother::fit";
        const int K = table.numCategories();

        if (K < 2) {
            THROW_INVALID_CONFIG(source, "At least two categories are required, got " + std::to_string(K));
        }
        if (reference_category_ >= K) {
            THROW_INVALID_CONFIG(source, "reference_category " + std::to_string(reference_category_) +
                                         " outside [0, " + std::to_string(K - 1) + "]");
        }
        if (table.counts.rows() != table.numAges() || table.counts.cols() != K) {
            THROW_INVALID_CONFIG(source, "Count matrix shape does not match ages x categories");
        }
        if (table.numAges() == 0 || !(table.total() > 0.0)) {
            THROW_FIT_FAILURE(source, "Total count across all ages is zero.");
        }

        const Eigen::VectorXd totals = table.rowTotals();
        int observed_ages = 0;
        for (Eigen::Index i = 0; i < totals.size(); ++i) {
            if (totals(i) > 0.0) ++observed_ages;
        }
        if (observed_ages < 2) {
            THROW_FIT_FAILURE(source, "Observations at " + std::to_string(observed_ages) +
                                      " distinct age(s); at least two are needed to identify an age trend.");
        }

        const Eigen::VectorXd category_totals = table.counts.colwise().sum().transpose();
        for (int k = 0; k < K; ++k) {
            if (!(category_totals(k) > 0.0)) {
                THROW_FIT_FAILURE(source, "Category '" + table.categories[k] +
                                          "' has zero observations at every age; its prevalence is not identifiable.");
            }
        }

        const double lower = table.ages.front();
        const double upper = table.ages.back();
        const int nb = basisSizeFor(upper - lower);
        if (nb <= penalty_order_) {
            THROW_INVALID_CONFIG(source, "basis_size (" + std::to_string(nb) + ") must exceed penalty_order (" +
                                         std::to_string(penalty_order_) + ")");
        }

        BSplineBasis basis(lower, upper, nb);

        Problem problem;
        problem.num_categories = K;
        problem.num_contrasts = K - 1;
        problem.basis_size = nb;
        problem.reference = reference_category_;
        problem.design = basis.designMatrix(table.ages);
        problem.counts = table.counts;
        problem.totals = totals;
        problem.penalty = basis.differencePenalty(penalty_order_);
        problem.penalty_rank = nb - penalty_order_;
        problem.outer.reserve(table.ages.size());
        for (Eigen::Index i = 0; i < problem.design.rows(); ++i) {
            problem.outer.push_back(problem.design.row(i).transpose() * problem.design.row(i));
        }
        return problem;
    }

    Eigen::VectorXd PrevalenceSmoother::initialCoefficients(const Problem& problem) const {
        // B-splines sum to one, so a constant coefficient block gives a constant
        // log-odds curve at the pooled prevalence.
        const int nb = problem.basis_size;
        const Eigen::VectorXd category_totals = problem.counts.colwise().sum().transpose();
        Eigen::VectorXd beta(problem.num_contrasts * nb);
        for (int c = 0; c < problem.num_contrasts; ++c) {
            const int k = contrastCategory(problem, c);
            const double log_odds = std::log(category_totals(k) / category_totals(problem.reference));
            beta.segment(c * nb, nb).setConstant(log_odds);
        }
        return beta;
    }

    double PrevalenceSmoother::evaluate(const Problem& problem,
                                        const Eigen::VectorXd& beta,
                                        Eigen::VectorXd* score,
                                        Eigen::MatrixXd* information) const {
        const int K = problem.num_categories;
        const int C = problem.num_contrasts;
        const int nb = problem.basis_size;

        if (score) score->setZero(C * nb);
        if (information) information->setZero(C * nb, C * nb);

        double log_likelihood = 0.0;
        Eigen::VectorXd eta(K);
        Eigen::VectorXd prob(K);

        for (Eigen::Index i = 0; i < problem.design.rows(); ++i) {
            const double n_i = problem.totals(i);
            if (n_i <= 0.0) continue;

            const auto b = problem.design.row(i);
            eta.setZero();
            for (int c = 0; c < C; ++c) {
                eta(contrastCategory(problem, c)) = b.dot(beta.segment(c * nb, nb));
            }
            const double shift = eta.maxCoeff();
            const double log_norm = shift + std::log((eta.array() - shift).exp().sum());
            prob = (eta.array() - log_norm).exp().matrix();

            for (int k = 0; k < K; ++k) {
                const double y = problem.counts(i, k);
                if (y > 0.0) {
                    log_likelihood += y * (eta(k) - log_norm);
                }
            }

            if (score) {
                for (int c = 0; c < C; ++c) {
                    const int k = contrastCategory(problem, c);
                    score->segment(c * nb, nb) += (problem.counts(i, k) - n_i * prob(k)) * b.transpose();
                }
            }
            if (information) {
                for (int c = 0; c < C; ++c) {
                    const double p_c = prob(contrastCategory(problem, c));
                    for (int d = 0; d < C; ++d) {
                        const double p_d = prob(contrastCategory(problem, d));
                        const double w = n_i * ((c == d ? p_c : 0.0) - p_c * p_d);
                        information->block(c * nb, d * nb, nb, nb) += w * problem.outer[static_cast<size_t>(i)];
                    }
                }
            }
        }
        return log_likelihood;
    }

    Eigen::MatrixXd PrevalenceSmoother::penaltyMatrix(const Problem& problem, const Eigen::VectorXd& lambdas) const {
        const int nb = problem.basis_size;
        Eigen::MatrixXd S = Eigen::MatrixXd::Zero(problem.num_contrasts * nb, problem.num_contrasts * nb);
        for (int c = 0; c < problem.num_contrasts; ++c) {
            S.block(c * nb, c * nb, nb, nb) = lambdas(c) * problem.penalty;
        }
        return S;
    }

    double PrevalenceSmoother::penaltyValue(const Problem& problem,
                                            const Eigen::VectorXd& beta,
                                            const Eigen::VectorXd& lambdas) const {
        const int nb = problem.basis_size;
        double total = 0.0;
        for (int c = 0; c < problem.num_contrasts; ++c) {
            const auto block = beta.segment(c * nb, nb);
            total += lambdas(c) * block.dot(problem.penalty * block);
        }
        return 0.5 * total;
    }

    PrevalenceSmoother::FitState PrevalenceSmoother::fitFixedLambda(const Problem& problem,
                                                                    const Eigen::VectorXd& lambdas,
                                                                    const Eigen::VectorXd& beta_start) const {
        const Eigen::MatrixXd S = penaltyMatrix(problem, lambdas);

        FitState state;
        state.beta = beta_start;

        Eigen::VectorXd score;
        Eigen::MatrixXd information;

        for (int iter = 1; iter <= max_newton_iterations_; ++iter) {
            state.iterations = iter;

            const double ll = evaluate(problem, state.beta, &score, &information);
            const double lp = ll - penaltyValue(problem, state.beta, lambdas);
            if (!std::isfinite(lp)) {
                return state;
            }

            const Eigen::VectorXd gradient = score - S * state.beta;
            Eigen::MatrixXd H = information + S;

            Eigen::LLT<Eigen::MatrixXd> llt(H);
            if (llt.info() != Eigen::Success) {
                logger.debug(LOG_SOURCE, "Penalised information not positive definite at iteration " +
                                         std::to_string(iter));
                return state;
            }

            const Eigen::VectorXd delta = llt.solve(gradient);
            const double decrement = 0.5 * gradient.dot(delta);

            state.log_likelihood = ll;
            state.penalised_log_likelihood = lp;
            state.hessian = H;

            if (decrement < tolerance_ * (1.0 + std::abs(lp))) {
                state.converged = true;
                return state;
            }

            // Step halving on the penalised log-likelihood.
            double step = 1.0;
            bool accepted = false;
            Eigen::VectorXd candidate;
            for (int h = 0; h < 40; ++h) {
                candidate = state.beta + step * delta;
                const double lp_candidate = evaluate(problem, candidate, nullptr, nullptr) -
                                            penaltyValue(problem, candidate, lambdas);
                if (std::isfinite(lp_candidate) && lp_candidate >= lp) {
                    accepted = true;
                    break;
                }
                step *= 0.5;
            }

            if (!accepted) {
                // No ascent direction left at machine precision: accept as optimum if close.
                state.converged = decrement < std::sqrt(tolerance_) * (1.0 + std::abs(lp));
                return state;
            }
            state.beta = candidate;
        }

        return state;
    }

    SmoothModel PrevalenceSmoother::fit(const CountTable& table) const {
        const std::string source = "PrevalenceSmoother::fit";
        const Problem problem = buildProblem(table);
        const int C = problem.num_contrasts;

        logger.info(LOG_SOURCE, "Fitting " + std::to_string(problem.num_categories) + " categories over " +
                                std::to_string(table.numAges()) + " ages [" + std::to_string(table.ages.front()) +
                                ", " + std::to_string(table.ages.back()) + "], basis size " +
                                std::to_string(problem.basis_size));

        std::vector<double> grid;
        for (double g = log10_lambda_min_; g <= log10_lambda_max_ + 1e-9; g += log10_lambda_step_) {
            grid.push_back(g);
        }

        // Start from the grid point closest to lambda = 10.
        double start = grid.front();
        for (double g : grid) {
            if (std::abs(g - 1.0) < std::abs(start - 1.0)) start = g;
        }

        auto laml = [&](const FitState& st, const Eigen::VectorXd& lambdas) {
            Eigen::LLT<Eigen::MatrixXd> llt(st.hessian);
            const double log_det_h = 2.0 * llt.matrixLLT().diagonal().array().log().sum();
            double log_det_s = 0.0;
            for (int c = 0; c < C; ++c) {
                log_det_s += problem.penalty_rank * std::log(lambdas(c));
            }
            return st.penalised_log_likelihood + 0.5 * log_det_s - 0.5 * log_det_h;
        };

        const Eigen::VectorXd beta_init = initialCoefficients(problem);
        std::vector<double> log_lambdas(static_cast<size_t>(C), start);
        auto toLambdas = [](const std::vector<double>& logs) {
            Eigen::VectorXd lambdas(static_cast<Eigen::Index>(logs.size()));
            for (size_t c = 0; c < logs.size(); ++c) {
                lambdas(static_cast<Eigen::Index>(c)) = std::pow(10.0, logs[c]);
            }
            return lambdas;
        };

        FitState best = fitFixedLambda(problem, toLambdas(log_lambdas), beta_init);
        best.log_marginal_likelihood = best.converged ? laml(best, toLambdas(log_lambdas))
                                                      : -std::numeric_limits<double>::infinity();
        int fits = 1;

        for (int sweep = 0; sweep < lambda_sweeps_; ++sweep) {
            bool changed = false;
            for (int c = 0; c < C; ++c) {
                for (double g : grid) {
                    if (std::abs(g - log_lambdas[static_cast<size_t>(c)]) < 1e-12) continue;

                    std::vector<double> trial_logs = log_lambdas;
                    trial_logs[static_cast<size_t>(c)] = g;
                    const Eigen::VectorXd trial = toLambdas(trial_logs);

                    FitState st = fitFixedLambda(problem, trial, best.converged ? best.beta : beta_init);
                    ++fits;
                    if (!st.converged) {
                        logger.debug(LOG_SOURCE, "Fit did not converge at log10(lambda_" + std::to_string(c) +
                                                 ") = " + std::to_string(g));
                        continue;
                    }
                    st.log_marginal_likelihood = laml(st, trial);
                    if (st.log_marginal_likelihood > best.log_marginal_likelihood + 1e-10) {
                        best = std::move(st);
                        log_lambdas = std::move(trial_logs);
                        changed = true;
                    }
                }
            }
            if (!changed) break;
        }

        if (!best.converged) {
            THROW_FIT_FAILURE(source, "Penalised Newton iterations did not converge for any smoothing strength (" +
                                      std::to_string(fits) + " fits, cap " + std::to_string(max_newton_iterations_) +
                                      " iterations each).");
        }

        const Eigen::VectorXd lambdas = toLambdas(log_lambdas);
        Eigen::LLT<Eigen::MatrixXd> llt(best.hessian);
        if (llt.info() != Eigen::Success) {
            THROW_FIT_FAILURE(source, "Penalised information matrix is singular at the optimum.");
        }
        const Eigen::Index p = best.hessian.rows();
        Eigen::MatrixXd covariance = llt.solve(Eigen::MatrixXd::Identity(p, p));
        covariance = 0.5 * (covariance + covariance.transpose()).eval();
        if (!covariance.allFinite()) {
            THROW_FIT_FAILURE(source, "Coefficient covariance contains non-finite entries.");
        }

        SmoothFitDiagnostics diagnostics;
        diagnostics.effective_degrees_of_freedom =
            static_cast<double>(p) - (covariance * penaltyMatrix(problem, lambdas)).trace();
        diagnostics.log_likelihood = best.log_likelihood;
        diagnostics.log_marginal_likelihood = best.log_marginal_likelihood;
        diagnostics.newton_iterations = best.iterations;
        diagnostics.fits_evaluated = fits;

        std::ostringstream lambda_text;
        for (int c = 0; c < C; ++c) {
            lambda_text << (c ? ", " : "") << table.categories[static_cast<size_t>(contrastCategory(problem, c))]
                        << "=" << lambdas(c);
        }
        logger.info(LOG_SOURCE, "Fit complete: lambda {" + lambda_text.str() + "}, EDF=" +
                                std::to_string(diagnostics.effective_degrees_of_freedom) +
                                ", logLik=" + std::to_string(diagnostics.log_likelihood) +
                                ", fits=" + std::to_string(fits));

        return SmoothModel(table.categories,
                           problem.reference,
                           BSplineBasis(table.ages.front(), table.ages.back(), problem.basis_size),
                           best.beta,
                           covariance,
                           lambdas,
                           diagnostics);
    }

} // namespace nettrans
