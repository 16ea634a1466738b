#include "transitions/CostMatrix.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>
#include <utility>

namespace nettrans {

CostMatrix::CostMatrix(std::vector<std::string> categories, Eigen::MatrixXd costs)
    : categories_(std::move(categories)), costs_(std::move(costs)) {
    if (costs_.rows() != size() || costs_.cols() != size()) {
        THROW_INVALID_CONFIG("CostMatrix::CostMatrix",
                             "Cost matrix is " + std::to_string(costs_.rows()) + "x" + std::to_string(costs_.cols()) +
                             " but " + std::to_string(size()) + " categories were given");
    }
}

void CostMatrix::requireCategoryOrder(const std::vector<std::string>& categories, const std::string& source) const {
    if (categories.size() != categories_.size()) {
        THROW_INVALID_CONFIG(source, "Cost matrix covers " + std::to_string(categories_.size()) +
                                     " categories but the model has " + std::to_string(categories.size()));
    }
    for (size_t k = 0; k < categories.size(); ++k) {
        if (categories[k] != categories_[k]) {
            THROW_INVALID_CONFIG(source, "Category order mismatch at position " + std::to_string(k) +
                                         ": cost matrix has '" + categories_[k] + "', model has '" +
                                         categories[k] + "'. Rebuild the cost matrix for the new order.");
        }
    }
}

CostConfig CostConfig::fromSettings(const std::map<std::string, double>& settings) {
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return (it != settings.end()) ? it->second : def;
    };

    CostConfig config;
    config.exponent = get("cost_exponent", 2.0);
    config.scale = get("cost_scale", 1.0);
    config.function = (config.exponent == 1.0) ? CostFunction::Linear : CostFunction::Power;
    return config;
}

CostMatrix CostMatrixBuilder::build(const std::vector<std::string>& category_order, const CostConfig& config) const {
    const std::string source = "CostMatrixBuilder::build";
    const int K = static_cast<int>(category_order.size());

    if (K == 0) {
        THROW_INVALID_CONFIG(source, "Category order is empty.");
    }
    std::set<std::string> unique(category_order.begin(), category_order.end());
    if (static_cast<int>(unique.size()) != K) {
        THROW_INVALID_CONFIG(source, "Category order contains duplicate labels.");
    }
    if (!std::isfinite(config.scale) || !(config.scale > 0.0)) {
        THROW_INVALID_CONFIG(source, "Cost scale must be positive, got " + std::to_string(config.scale));
    }

    Eigen::MatrixXd costs(K, K);
    switch (config.function) {
        case CostFunction::Power:
            if (!std::isfinite(config.exponent) || config.exponent < 1.0) {
                THROW_INVALID_CONFIG(source, "Cost exponent must be >= 1 for a convex distance cost, got " +
                                             std::to_string(config.exponent));
            }
            for (int i = 0; i < K; ++i)
                for (int j = 0; j < K; ++j)
                    costs(i, j) = config.scale * std::pow(static_cast<double>(std::abs(i - j)), config.exponent);
            break;
        case CostFunction::Linear:
            for (int i = 0; i < K; ++i)
                for (int j = 0; j < K; ++j)
                    costs(i, j) = config.scale * std::abs(i - j);
            break;
        case CostFunction::Custom:
            if (!config.custom) {
                THROW_INVALID_CONFIG(source, "Custom cost function selected but no callback supplied.");
            }
            for (int i = 0; i < K; ++i)
                for (int j = 0; j < K; ++j)
                    costs(i, j) = config.scale * config.custom(i, j);
            break;
        case CostFunction::Explicit:
            if (config.explicit_costs.rows() != K || config.explicit_costs.cols() != K) {
                THROW_INVALID_CONFIG(source, "Explicit cost matrix is " +
                                             std::to_string(config.explicit_costs.rows()) + "x" +
                                             std::to_string(config.explicit_costs.cols()) + ", expected " +
                                             std::to_string(K) + "x" + std::to_string(K));
            }
            costs = config.scale * config.explicit_costs;
            break;
    }

    for (int i = 0; i < K; ++i) {
        for (int j = 0; j < K; ++j) {
            if (!std::isfinite(costs(i, j)) || costs(i, j) < 0.0) {
                THROW_INVALID_CONFIG(source, "Cost from '" + category_order[i] + "' to '" + category_order[j] +
                                             "' must be finite and non-negative, got " + std::to_string(costs(i, j)));
            }
            if (i != j && !(costs(i, i) < costs(i, j))) {
                THROW_INVALID_CONFIG(source, "Staying in '" + category_order[i] + "' (cost " +
                                             std::to_string(costs(i, i)) + ") must be cheaper than moving to '" +
                                             category_order[j] + "' (cost " + std::to_string(costs(i, j)) + ")");
            }
        }
    }

    std::ostringstream summary;
    summary << "Built " << K << "x" << K << " cost matrix";
    if (config.function == CostFunction::Power) summary << " (|i-j|^" << config.exponent << ")";
    Logger::getInstance().debug("CostMatrixBuilder", summary.str());

    return CostMatrix(category_order, costs);
}

} // namespace nettrans
