#include "prevalence/BSplineBasis.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <cmath>

namespace nettrans {

BSplineBasis::BSplineBasis(double lower, double upper, int size, int degree)
    : lower_(lower), upper_(upper), size_(size), degree_(degree), spacing_(0.0) {
    if (degree_ < 1) {
        THROW_INVALID_CONFIG("BSplineBasis::BSplineBasis", "Spline degree must be positive, got " + std::to_string(degree_));
    }
    if (size_ < degree_ + 1) {
        THROW_INVALID_CONFIG("BSplineBasis::BSplineBasis",
                             "Basis size " + std::to_string(size_) + " is too small for degree " +
                             std::to_string(degree_) + " (need at least " + std::to_string(degree_ + 1) + ")");
    }
    if (!std::isfinite(lower_) || !std::isfinite(upper_) || !(upper_ > lower_)) {
        THROW_INVALID_CONFIG("BSplineBasis::BSplineBasis",
                             "Basis range must be finite and non-empty, got [" + std::to_string(lower_) + ", " +
                             std::to_string(upper_) + "]");
    }

    const int segments = size_ - degree_;
    spacing_ = (upper_ - lower_) / segments;

    // size + degree + 1 knots, the first `degree` lying below `lower`.
    knots_.resize(static_cast<size_t>(size_ + degree_ + 1));
    for (int j = 0; j < static_cast<int>(knots_.size()); ++j) {
        knots_[j] = lower_ + (j - degree_) * spacing_;
    }
}

Eigen::RowVectorXd BSplineBasis::evaluate(double x) const {
    Eigen::RowVectorXd row = Eigen::RowVectorXd::Zero(size_);

    x = std::min(std::max(x, lower_), upper_);
    const int segments = size_ - degree_;
    int seg = static_cast<int>(std::floor((x - lower_) / spacing_));
    seg = std::min(std::max(seg, 0), segments - 1);

    // Knot span index: knots_[span] <= x < knots_[span + 1].
    const int span = seg + degree_;

    // Cox-de Boor triangular scheme for the degree+1 non-zero functions.
    std::vector<double> values(static_cast<size_t>(degree_ + 1), 0.0);
    std::vector<double> left(static_cast<size_t>(degree_ + 1), 0.0);
    std::vector<double> right(static_cast<size_t>(degree_ + 1), 0.0);
    values[0] = 1.0;
    for (int j = 1; j <= degree_; ++j) {
        left[j] = x - knots_[span + 1 - j];
        right[j] = knots_[span + j] - x;
        double saved = 0.0;
        for (int r = 0; r < j; ++r) {
            const double temp = values[r] / (right[r + 1] + left[j - r]);
            values[r] = saved + right[r + 1] * temp;
            saved = left[j - r] * temp;
        }
        values[j] = saved;
    }

    for (int r = 0; r <= degree_; ++r) {
        row(seg + r) = values[r];
    }
    return row;
}

Eigen::MatrixXd BSplineBasis::designMatrix(const std::vector<double>& xs) const {
    Eigen::MatrixXd B(static_cast<Eigen::Index>(xs.size()), size_);
    for (size_t i = 0; i < xs.size(); ++i) {
        B.row(static_cast<Eigen::Index>(i)) = evaluate(xs[i]);
    }
    return B;
}

Eigen::MatrixXd BSplineBasis::differencePenalty(int order) const {
    if (order < 1 || order >= size_) {
        THROW_INVALID_CONFIG("BSplineBasis::differencePenalty",
                             "Penalty order must lie in [1, " + std::to_string(size_ - 1) + "], got " +
                             std::to_string(order));
    }

    Eigen::MatrixXd D = Eigen::MatrixXd::Identity(size_, size_);
    for (int k = 0; k < order; ++k) {
        const Eigen::Index rows = D.rows() - 1;
        D = (D.bottomRows(rows) - D.topRows(rows)).eval();
    }
    return D.transpose() * D;
}

} // namespace nettrans
