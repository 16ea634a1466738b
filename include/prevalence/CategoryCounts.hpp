#ifndef CATEGORY_COUNTS_HPP
#define CATEGORY_COUNTS_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief One cross-sectional observation cell: how many respondents of a given
 *        age fell into a given category.
 */
struct CategoryCount {
    double age = 0.0;          ///< Integer age or age-interval midpoint.
    std::string category;      ///< Label from the ordered category set.
    double count = 0.0;        ///< Non-negative count (may be a survey weight total).
};

/**
 * @brief Per-age category counts, one row per distinct age (ascending).
 */
struct CountTable {
    std::vector<double> ages;
    std::vector<std::string> categories;
    Eigen::MatrixXd counts;    ///< ages.size() x categories.size()

    int numAges() const { return static_cast<int>(ages.size()); }
    int numCategories() const { return static_cast<int>(categories.size()); }

    /** @brief Total observations per age. */
    Eigen::VectorXd rowTotals() const { return counts.rowwise().sum(); }

    double total() const { return counts.sum(); }

    /** @brief Raw observed proportions; rows with no observations are left at zero. */
    Eigen::MatrixXd observedProportions() const;
};

/**
 * @brief Aggregates records into a CountTable using the given category order.
 *
 * Records sharing an (age, category) pair are summed. Ages are kept as given
 * and sorted ascending.
 *
 * @throws InvalidConfigException if the order has fewer than two labels or
 *         duplicates, a record uses a label outside the order, an age is
 *         non-finite, or a count is negative or non-finite.
 */
CountTable aggregateCounts(const std::vector<CategoryCount>& records,
                           const std::vector<std::string>& category_order);

/**
 * @brief Category labels in order of first appearance in the records.
 */
std::vector<std::string> categoriesInOrderOfAppearance(const std::vector<CategoryCount>& records);

} // namespace nettrans

#endif // CATEGORY_COUNTS_HPP
