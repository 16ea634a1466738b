#ifndef COST_MATRIX_HPP
#define COST_MATRIX_HPP

#include <Eigen/Dense>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Fixed category-pair transition costs for one estimation run.
 *
 * Entry (i, j) is the cost of moving one unit of prevalence from category i to
 * category j. The matrix remembers the category order it was built for so that
 * consumers can reject it when paired with a model using a different order.
 */
class CostMatrix {
public:
    CostMatrix(std::vector<std::string> categories, Eigen::MatrixXd costs);

    int size() const { return static_cast<int>(categories_.size()); }
    const std::vector<std::string>& categories() const { return categories_; }
    const Eigen::MatrixXd& values() const { return costs_; }
    double operator()(int from, int to) const { return costs_(from, to); }

    /**
     * @brief Verifies the matrix was built for exactly this category order.
     * @throws InvalidConfigException naming the first mismatching position.
     */
    void requireCategoryOrder(const std::vector<std::string>& categories, const std::string& source) const;

private:
    std::vector<std::string> categories_;
    Eigen::MatrixXd costs_;
};

/**
 * @brief Functional form of the category-distance cost.
 */
enum class CostFunction {
    Power,     ///< scale * |i - j|^exponent
    Linear,    ///< scale * |i - j|
    Custom,    ///< user callback cost(i, j)
    Explicit   ///< user-supplied K x K matrix
};

struct CostConfig {
    CostFunction function = CostFunction::Power;
    double exponent = 2.0;
    double scale = 1.0;
    std::function<double(int, int)> custom;
    Eigen::MatrixXd explicit_costs;

    /**
     * @brief Reads "cost_exponent" (default 2) and "cost_scale" (default 1).
     *        An exponent of exactly 1 selects the linear form.
     */
    static CostConfig fromSettings(const std::map<std::string, double>& settings);
};

/**
 * @brief Builds the cost matrix encoding which transitions are cheap.
 *
 * The default convex cost |i - j|^2 under the natural category order makes
 * adjacent-category moves cheap and long jumps expensive, which selects the
 * plausible flow among all flows matching two prevalence vectors.
 */
class CostMatrixBuilder {
public:
    /**
     * @throws InvalidConfigException for empty/duplicate labels, dimension
     *         mismatches, negative or non-finite costs, a non-convex power, or a
     *         diagonal entry that is not strictly the cheapest in its row.
     */
    CostMatrix build(const std::vector<std::string>& category_order, const CostConfig& config = CostConfig()) const;
};

} // namespace nettrans

#endif // COST_MATRIX_HPP
