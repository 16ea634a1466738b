#ifndef PREVALENCE_SMOOTHER_HPP
#define PREVALENCE_SMOOTHER_HPP

#include "prevalence/CategoryCounts.hpp"
#include "prevalence/SmoothModel.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Fits smooth age-specific category prevalences by penalised multinomial regression.
 *
 * MODEL:
 * Counts y_ik at age a_i follow a multinomial distribution with probabilities
 * softmax(eta(a_i)), where eta_k(a) = B(a) beta_k for every non-reference
 * category and eta_ref = 0. B is a cubic B-spline basis on equally spaced knots
 * and each beta_k carries the difference penalty lambda_k * beta_k' S beta_k
 * (P-splines, Eilers & Marx 1996), a discrete stand-in for the integrated
 * squared second derivative of the curve.
 *
 * ESTIMATION:
 * - For fixed lambda: penalised Newton-Raphson with step halving.
 * - Smoothing strengths: maximise the Laplace approximation to the log
 *   marginal likelihood
 *       l(b) - 1/2 sum_k lambda_k b_k'Sb_k + 1/2 sum_k rank(S) log lambda_k - 1/2 log|H|
 *   by coordinate-wise search over a log10 grid, warm-starting every fit.
 * - Coefficient covariance: H^{-1} at the selected lambda (Bayesian posterior
 *   covariance), used downstream for parametric resampling.
 *
 * Ages with no observations contribute nothing to the likelihood; the penalty
 * carries the curves across them.
 */
class PrevalenceSmoother {
public:
    PrevalenceSmoother() = default;

    /**
     * @brief Configures the smoother.
     *
     * @param settings Map of configuration keys:
     *   - "basis_size": Spline functions per contrast (default: max(5, ceil(age range / 5) + 3))
     *   - "penalty_order": Difference order of the roughness penalty (default: 2)
     *   - "reference_category": Index of the baseline category (default: 0)
     *   - "max_newton_iterations": Newton iteration cap per fit (default: 100)
     *   - "tolerance": Convergence tolerance on the Newton decrement (default: 1e-8)
     *   - "log10_lambda_min" / "log10_lambda_max" / "log10_lambda_step":
     *       smoothing-strength search grid (default: -2 / 6 / 0.5)
     *   - "lambda_sweeps": Coordinate passes over the contrasts (default: 2)
     * @throws InvalidConfigException for out-of-range values.
     */
    void configure(const std::map<std::string, double>& settings);

    /**
     * @brief Aggregates the records with the given category order and fits.
     * @throws InvalidConfigException for inconsistent records/order.
     * @throws FitFailureException if the data cannot identify the model or the
     *         optimiser fails to converge.
     */
    SmoothModel fit(const std::vector<CategoryCount>& records,
                    const std::vector<std::string>& category_order) const;

    /** @copydoc fit */
    SmoothModel fit(const CountTable& table) const;

    /** @brief Basis size used for data spanning the given age range. */
    int basisSizeFor(double age_range) const;

    int penaltyOrder() const { return penalty_order_; }
    int referenceCategory() const { return reference_category_; }

private:
    /** @brief Data and fixed matrices shared by every fit at different lambdas. */
    struct Problem {
        int num_categories = 0;
        int num_contrasts = 0;
        int basis_size = 0;
        int reference = 0;
        Eigen::MatrixXd design;               // ages x nb
        Eigen::MatrixXd counts;               // ages x K
        Eigen::VectorXd totals;               // per age
        std::vector<Eigen::MatrixXd> outer;   // B_i' B_i per age
        Eigen::MatrixXd penalty;              // nb x nb
        int penalty_rank = 0;
    };

    struct FitState {
        Eigen::VectorXd beta;
        Eigen::MatrixXd hessian;              // negative Hessian of the penalised log-likelihood
        double log_likelihood = 0.0;
        double penalised_log_likelihood = 0.0;
        double log_marginal_likelihood = 0.0;
        int iterations = 0;
        bool converged = false;
    };

    Problem buildProblem(const CountTable& table) const;

    int contrastCategory(const Problem& problem, int contrast) const;

    Eigen::VectorXd initialCoefficients(const Problem& problem) const;

    /** @brief Log-likelihood and, optionally, score and information at beta. */
    double evaluate(const Problem& problem,
                    const Eigen::VectorXd& beta,
                    Eigen::VectorXd* score,
                    Eigen::MatrixXd* information) const;

    double penaltyValue(const Problem& problem, const Eigen::VectorXd& beta, const Eigen::VectorXd& lambdas) const;

    Eigen::MatrixXd penaltyMatrix(const Problem& problem, const Eigen::VectorXd& lambdas) const;

    FitState fitFixedLambda(const Problem& problem,
                            const Eigen::VectorXd& lambdas,
                            const Eigen::VectorXd& beta_start) const;

    int basis_size_ = 0;                // 0 => derive from the age range
    int penalty_order_ = 2;
    int reference_category_ = 0;
    int max_newton_iterations_ = 100;
    double tolerance_ = 1e-8;
    double log10_lambda_min_ = -2.0;
    double log10_lambda_max_ = 6.0;
    double log10_lambda_step_ = 0.5;
    int lambda_sweeps_ = 2;
};

} // namespace nettrans

#endif // PREVALENCE_SMOOTHER_HPP
