#include "prevalence/CategoryCounts.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace nettrans {

Eigen::MatrixXd CountTable::observedProportions() const {
    Eigen::MatrixXd props = Eigen::MatrixXd::Zero(counts.rows(), counts.cols());
    const Eigen::VectorXd totals = rowTotals();
    for (Eigen::Index i = 0; i < counts.rows(); ++i) {
        if (totals(i) > 0.0) {
            props.row(i) = counts.row(i) / totals(i);
        }
    }
    return props;
}

CountTable aggregateCounts(const std::vector<CategoryCount>& records,
                           const std::vector<std::string>& category_order) {
    const std::string source = "aggregateCounts";

    if (category_order.size() < 2) {
        THROW_INVALID_CONFIG(source, "At least two categories are required, got " +
                                     std::to_string(category_order.size()));
    }

    std::map<std::string, int> index_of;
    for (size_t k = 0; k < category_order.size(); ++k) {
        if (!index_of.emplace(category_order[k], static_cast<int>(k)).second) {
            THROW_INVALID_CONFIG(source, "Duplicate category label '" + category_order[k] + "' in category order");
        }
    }

    std::set<double> distinct_ages;
    for (const auto& rec : records) {
        if (!std::isfinite(rec.age)) {
            THROW_INVALID_CONFIG(source, "Non-finite age for category '" + rec.category + "'");
        }
        if (!std::isfinite(rec.count) || rec.count < 0.0) {
            THROW_INVALID_CONFIG(source, "Count at age " + std::to_string(rec.age) + " for category '" +
                                         rec.category + "' must be finite and non-negative, got " +
                                         std::to_string(rec.count));
        }
        if (index_of.find(rec.category) == index_of.end()) {
            THROW_INVALID_CONFIG(source, "Category '" + rec.category + "' at age " + std::to_string(rec.age) +
                                         " is not part of the configured category order");
        }
        distinct_ages.insert(rec.age);
    }

    CountTable table;
    table.categories = category_order;
    table.ages.assign(distinct_ages.begin(), distinct_ages.end());
    table.counts = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(table.ages.size()),
                                         static_cast<Eigen::Index>(category_order.size()));

    for (const auto& rec : records) {
        const auto it = std::lower_bound(table.ages.begin(), table.ages.end(), rec.age);
        const Eigen::Index row = static_cast<Eigen::Index>(std::distance(table.ages.begin(), it));
        table.counts(row, index_of.at(rec.category)) += rec.count;
    }

    return table;
}

std::vector<std::string> categoriesInOrderOfAppearance(const std::vector<CategoryCount>& records) {
    std::vector<std::string> labels;
    std::set<std::string> seen;
    for (const auto& rec : records) {
        if (seen.insert(rec.category).second) {
            labels.push_back(rec.category);
        }
    }
    return labels;
}

} // namespace nettrans
