#ifndef BSPLINE_BASIS_HPP
#define BSPLINE_BASIS_HPP

#include <Eigen/Dense>
#include <vector>

namespace nettrans {

/**
 * @brief B-spline basis on equally spaced knots (P-spline construction).
 *
 * The basis has `size` functions of the given degree covering [lower, upper].
 * Knots extend `degree` spacings beyond both ends so every point of the range
 * is covered by degree+1 non-zero functions that sum to one. Arguments outside
 * the range are clamped to it.
 */
class BSplineBasis {
public:
    /**
     * @throws InvalidConfigException if size < degree + 1, degree < 1, or the
     *         range is empty or non-finite.
     */
    BSplineBasis(double lower, double upper, int size, int degree = 3);

    int size() const { return size_; }
    int degree() const { return degree_; }
    double lower() const { return lower_; }
    double upper() const { return upper_; }

    /** @brief Row of all `size()` basis values at x. */
    Eigen::RowVectorXd evaluate(double x) const;

    /** @brief Design matrix with one row per entry of xs. */
    Eigen::MatrixXd designMatrix(const std::vector<double>& xs) const;

    /**
     * @brief Difference penalty S = D'D where D takes order-th differences of
     *        adjacent coefficients. Its null space holds polynomials of degree
     *        order-1 in the coefficient index.
     * @throws InvalidConfigException if order < 1 or order >= size().
     */
    Eigen::MatrixXd differencePenalty(int order) const;

    const std::vector<double>& knots() const { return knots_; }

private:
    double lower_;
    double upper_;
    int size_;
    int degree_;
    double spacing_;
    std::vector<double> knots_;
};

} // namespace nettrans

#endif // BSPLINE_BASIS_HPP
