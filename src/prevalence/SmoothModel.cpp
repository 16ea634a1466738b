#include "prevalence/SmoothModel.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <cmath>
#include <utility>

namespace nettrans {

    static const std::string LOG_SOURCE = "SmoothModel";

    SmoothModel::SmoothModel(std::vector<std::string> categories,
                             int reference_category,
                             BSplineBasis basis,
                             Eigen::VectorXd coefficients,
                             Eigen::MatrixXd covariance,
                             Eigen::VectorXd lambdas,
                             SmoothFitDiagnostics diagnostics)
        : categories_(std::move(categories)),
          reference_category_(reference_category),
          basis_(std::move(basis)),
          coefficients_(std::move(coefficients)),
          lambdas_(std::move(lambdas)),
          diagnostics_(diagnostics) {

        const int K = numCategories();
        if (K < 2) {
            THROW_INVALID_CONFIG("SmoothModel::SmoothModel", "At least two categories are required.");
        }
        if (reference_category_ < 0 || reference_category_ >= K) {
            THROW_INVALID_CONFIG("SmoothModel::SmoothModel",
                                 "Reference category index " + std::to_string(reference_category_) +
                                 " outside [0, " + std::to_string(K - 1) + "]");
        }
        const Eigen::Index n_coef = static_cast<Eigen::Index>(numContrasts()) * basis_.size();
        if (coefficients_.size() != n_coef) {
            THROW_INVALID_CONFIG("SmoothModel::SmoothModel",
                                 "Expected " + std::to_string(n_coef) + " coefficients, got " +
                                 std::to_string(coefficients_.size()));
        }
        if (covariance.rows() != n_coef || covariance.cols() != n_coef) {
            THROW_INVALID_CONFIG("SmoothModel::SmoothModel",
                                 "Covariance must be " + std::to_string(n_coef) + "x" + std::to_string(n_coef) +
                                 ", got " + std::to_string(covariance.rows()) + "x" + std::to_string(covariance.cols()));
        }
        if (lambdas_.size() != numContrasts()) {
            THROW_INVALID_CONFIG("SmoothModel::SmoothModel",
                                 "Expected " + std::to_string(numContrasts()) + " smoothing parameters, got " +
                                 std::to_string(lambdas_.size()));
        }

        covariance_root_ = std::make_shared<const Eigen::MatrixXd>(computeCovarianceRoot(covariance));
        covariance_ = std::make_shared<const Eigen::MatrixXd>(std::move(covariance));
    }

    Eigen::MatrixXd SmoothModel::computeCovarianceRoot(const Eigen::MatrixXd& covariance) {
        if (covariance.size() == 0) {
            return covariance;
        }
        Eigen::LLT<Eigen::MatrixXd> llt(covariance);
        if (llt.info() == Eigen::Success) {
            return llt.matrixL();
        }

        // Semi-definite (or slightly indefinite from round-off): symmetric square root
        // with negative eigenvalues clamped to zero.
        Logger::getInstance().debug(LOG_SOURCE, "Covariance not positive definite; using eigen square root.");
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(covariance);
        Eigen::VectorXd sqrt_vals = eig.eigenvalues().cwiseMax(0.0).cwiseSqrt();
        return eig.eigenvectors() * sqrt_vals.asDiagonal();
    }

    int SmoothModel::contrastCategory(int contrast) const {
        if (contrast < 0 || contrast >= numContrasts()) {
            THROW_INVALID_CONFIG("SmoothModel::contrastCategory",
                                 "Contrast index " + std::to_string(contrast) + " out of range");
        }
        return contrast < reference_category_ ? contrast : contrast + 1;
    }

    Eigen::VectorXd SmoothModel::linearPredictors(double age) const {
        const int K = numCategories();
        const int nb = basisSize();
        const Eigen::RowVectorXd b = basis_.evaluate(age);

        Eigen::VectorXd eta = Eigen::VectorXd::Zero(K);
        for (int c = 0; c < numContrasts(); ++c) {
            eta(contrastCategory(c)) = b.dot(coefficients_.segment(static_cast<Eigen::Index>(c) * nb, nb));
        }
        return eta;
    }

    Eigen::VectorXd SmoothModel::softmax(const Eigen::VectorXd& eta) {
        const double shift = eta.maxCoeff();
        Eigen::VectorXd p = (eta.array() - shift).exp().matrix();
        return p / p.sum();
    }

    Eigen::VectorXd SmoothModel::prevalence(double age) const {
        return softmax(linearPredictors(age));
    }

    Eigen::MatrixXd SmoothModel::prevalenceTable(const std::vector<double>& ages) const {
        Eigen::MatrixXd table(static_cast<Eigen::Index>(ages.size()), numCategories());
        for (size_t i = 0; i < ages.size(); ++i) {
            table.row(static_cast<Eigen::Index>(i)) = prevalence(ages[i]).transpose();
        }
        return table;
    }

    SmoothModel SmoothModel::withCoefficients(const Eigen::VectorXd& coefficients) const {
        if (coefficients.size() != coefficients_.size()) {
            THROW_INVALID_CONFIG("SmoothModel::withCoefficients",
                                 "Expected " + std::to_string(coefficients_.size()) + " coefficients, got " +
                                 std::to_string(coefficients.size()));
        }
        SmoothModel copy(*this);
        copy.coefficients_ = coefficients;
        return copy;
    }

    SmoothModel SmoothModel::resample(std::mt19937& gen) const {
        std::normal_distribution<double> dist(0.0, 1.0);
        Eigen::VectorXd z(coefficients_.size());
        for (Eigen::Index i = 0; i < z.size(); ++i) {
            z(i) = dist(gen);
        }
        return withCoefficients(coefficients_ + (*covariance_root_) * z);
    }

} // namespace nettrans
