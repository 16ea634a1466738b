#include <catch2/catch.hpp>

#include "TestData.hpp"
#include "bootstrap/Bootstrapper.hpp"
#include "prevalence/PrevalenceSmoother.hpp"
#include "transitions/CostMatrix.hpp"
#include "transitions/TransitionEstimator.hpp"

using namespace nettrans;

namespace {

// Normal / overweight / obese prevalence rising with age from 0 to 10.
class WeightStatusScenario {
public:
    WeightStatusScenario()
        : categories_(testdata::weightCategories()),
          model_(PrevalenceSmoother().fit(testdata::expectedCounts(0, 10, 10000.0), categories_)),
          cost_(CostMatrixBuilder().build(categories_)),
          grid_(TransitionEstimator::defaultAgeGrid(model_)) {}

protected:
    std::vector<std::string> categories_;
    SmoothModel model_;
    CostMatrix cost_;
    std::vector<double> grid_;
};

} // namespace

const char* tag_end_to_end = "[end-to-end]";

TEST_CASE_METHOD(WeightStatusScenario, "Net transitions match the true prevalence curves", tag_end_to_end) {
    TransitionEstimator estimator;
    const TransitionEstimate estimate = estimator.estimate(model_, grid_, cost_);

    REQUIRE(grid_.size() == 11u);
    REQUIRE(estimate.steps.size() == 10u);
    CHECK(estimate.categories == categories_);

    double previous_outflow = 0.0;
    for (const auto& step : estimate.steps) {
        INFO("age " << step.age_from);
        const Eigen::MatrixXd expected = testdata::monotoneTransition(testdata::truePrevalence(step.age_from),
                                                                      testdata::truePrevalence(step.age_to));
        CHECK((step.probabilities - expected).cwiseAbs().maxCoeff() < 1e-3);

        for (int i = 0; i < 3; ++i) {
            CHECK(step.probabilities.row(i).sum() == Approx(1.0).margin(1e-12));
        }

        // Normal -> overweight is positive and rises with age; nobody skips a category.
        const double outflow = step.probabilities(0, 1);
        CHECK(outflow > 0.0);
        CHECK(outflow > previous_outflow);
        previous_outflow = outflow;
        CHECK(step.probabilities(0, 2) == Approx(0.0).margin(1e-9));

        // Obesity only grows, so the obese never leave.
        CHECK(step.probabilities(2, 2) == Approx(1.0).margin(1e-9));
        CHECK(step.probabilities(1, 2) > 0.0);
    }
}

TEST_CASE_METHOD(WeightStatusScenario, "Bootstrap bands bracket the point estimate", tag_end_to_end) {
    TransitionEstimator estimator;
    const TransitionEstimate estimate = estimator.estimate(model_, grid_, cost_);

    Bootstrapper bootstrapper;
    bootstrapper.configure({{"bootstrap_replicates", 300.0}, {"random_seed", 2024.0}});
    const BootstrapSummary summary = bootstrapper.run(model_, grid_, cost_);

    REQUIRE(summary.bands.size() == estimate.steps.size());
    CHECK(summary.successful == 300);
    for (size_t s = 0; s < summary.bands.size(); ++s) {
        const auto& band = summary.bands[s];
        const double point = estimate.steps[s].probabilities(0, 1);
        INFO("age " << band.age_from << ": " << point
                    << " against [" << band.lower(0, 1) << ", " << band.upper(0, 1) << "]");
        CHECK(band.contains(0, 1, point));
        CHECK(band.upper(0, 1) - band.lower(0, 1) < 0.1);
    }
}
