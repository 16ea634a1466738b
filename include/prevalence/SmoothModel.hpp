#ifndef SMOOTH_MODEL_HPP
#define SMOOTH_MODEL_HPP

#include "prevalence/BSplineBasis.hpp"

#include <Eigen/Dense>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Diagnostics recorded by the smoother for the selected smoothing strengths.
 */
struct SmoothFitDiagnostics {
    double effective_degrees_of_freedom = 0.0;
    double log_likelihood = 0.0;
    double log_marginal_likelihood = 0.0;
    int newton_iterations = 0;
    int fits_evaluated = 0;
};

/**
 * @brief Fitted multinomial P-spline model of category prevalence over age.
 *
 * Each non-reference category k has a linear predictor eta_k(age) = B(age) beta_k
 * (log-odds against the reference category); the reference category's predictor
 * is fixed at zero and prevalences are the softmax of the predictors, so every
 * evaluated vector is non-negative and sums to one by construction.
 *
 * Coefficients are stored contrast-major: the block for the c-th non-reference
 * category occupies [c * basisSize(), (c + 1) * basisSize()).
 *
 * Instances are immutable values. The coefficient covariance (and its square
 * root used for resampling) is shared read-only between a model and every
 * model derived from it via withCoefficients()/resample().
 */
class SmoothModel {
public:
    /**
     * @param categories Ordered category labels (K >= 2).
     * @param reference_category Index of the baseline category.
     * @param basis Spline basis shared by all contrasts.
     * @param coefficients (K-1) * basis.size() coefficients.
     * @param covariance Coefficient covariance, square of matching dimension.
     * @param lambdas Smoothing strength for each contrast (K-1 entries).
     * @param diagnostics Fit summary carried along for reporting.
     * @throws InvalidConfigException on any dimension mismatch.
     */
    SmoothModel(std::vector<std::string> categories,
                int reference_category,
                BSplineBasis basis,
                Eigen::VectorXd coefficients,
                Eigen::MatrixXd covariance,
                Eigen::VectorXd lambdas,
                SmoothFitDiagnostics diagnostics = SmoothFitDiagnostics());

    int numCategories() const { return static_cast<int>(categories_.size()); }
    int numContrasts() const { return numCategories() - 1; }
    int basisSize() const { return basis_.size(); }
    int referenceCategory() const { return reference_category_; }
    const std::vector<std::string>& categories() const { return categories_; }
    const BSplineBasis& basis() const { return basis_; }
    double minAge() const { return basis_.lower(); }
    double maxAge() const { return basis_.upper(); }

    const Eigen::VectorXd& coefficients() const { return coefficients_; }
    const Eigen::MatrixXd& covariance() const { return *covariance_; }
    const Eigen::VectorXd& lambdas() const { return lambdas_; }

    /** @brief Category index modelled by the c-th contrast. */
    int contrastCategory(int contrast) const;

    /** @brief Linear predictors for all K categories at age (reference entry is 0). */
    Eigen::VectorXd linearPredictors(double age) const;

    /** @brief Prevalence vector at age (entries >= 0, sum 1). */
    Eigen::VectorXd prevalence(double age) const;

    /** @brief Prevalence for every age: ages.size() x K. */
    Eigen::MatrixXd prevalenceTable(const std::vector<double>& ages) const;

    /** @brief Same model with different coefficients (covariance and lambdas kept). */
    SmoothModel withCoefficients(const Eigen::VectorXd& coefficients) const;

    /**
     * @brief Draws beta* ~ N(beta_hat, V) and returns the model evaluated at beta*.
     */
    SmoothModel resample(std::mt19937& gen) const;

    const SmoothFitDiagnostics& diagnostics() const { return diagnostics_; }

    /** @brief Numerically stable softmax of linear predictors. */
    static Eigen::VectorXd softmax(const Eigen::VectorXd& eta);

private:
    std::vector<std::string> categories_;
    int reference_category_;
    BSplineBasis basis_;
    Eigen::VectorXd coefficients_;
    std::shared_ptr<const Eigen::MatrixXd> covariance_;
    std::shared_ptr<const Eigen::MatrixXd> covariance_root_;  // L with L * L^T = V
    Eigen::VectorXd lambdas_;

    SmoothFitDiagnostics diagnostics_;

    static Eigen::MatrixXd computeCovarianceRoot(const Eigen::MatrixXd& covariance);
};

} // namespace nettrans

#endif // SMOOTH_MODEL_HPP
