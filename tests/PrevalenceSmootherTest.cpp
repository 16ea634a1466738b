#include <catch2/catch.hpp>

#include "TestData.hpp"
#include "exceptions/Exceptions.hpp"
#include "prevalence/PrevalenceSmoother.hpp"

#include <algorithm>

using namespace nettrans;

namespace {

double maxErrorAgainstTruth(const SmoothModel& model, int first, int last) {
    double worst = 0.0;
    for (int a = first; a <= last; ++a) {
        worst = std::max(worst, (model.prevalence(a) - testdata::truePrevalence(a)).cwiseAbs().maxCoeff());
    }
    return worst;
}

std::vector<CategoryCount> withAgeZeroed(std::vector<CategoryCount> records, double age) {
    for (auto& rec : records) {
        if (rec.age == age) rec.count = 0.0;
    }
    return records;
}

} // namespace

const char* tag_smoother = "[smoother]";

TEST_CASE("Expected counts recover linear logits", tag_smoother) {
    PrevalenceSmoother smoother;
    const SmoothModel model = smoother.fit(testdata::expectedCounts(0, 10, 10000.0), testdata::weightCategories());

    CHECK(model.numCategories() == 3);
    CHECK(model.referenceCategory() == 0);
    CHECK(model.minAge() == 0.0);
    CHECK(model.maxAge() == 10.0);
    CHECK(maxErrorAgainstTruth(model, 0, 10) < 1e-5);
    CHECK(model.prevalence(4.5)(2) == Approx(testdata::truePrevalence(4.5)(2)).margin(1e-5));
}

TEST_CASE("Recovery improves with sample size", tag_smoother) {
    PrevalenceSmoother smoother;
    std::mt19937 gen_small(11);
    std::mt19937 gen_large(12);

    const SmoothModel small = smoother.fit(testdata::sampledCounts(0, 10, 200, gen_small),
                                           testdata::weightCategories());
    const SmoothModel large = smoother.fit(testdata::sampledCounts(0, 10, 20000, gen_large),
                                           testdata::weightCategories());

    const double small_error = maxErrorAgainstTruth(small, 0, 10);
    const double large_error = maxErrorAgainstTruth(large, 0, 10);
    CHECK(large_error < small_error);
    CHECK(large_error < 0.02);
}

TEST_CASE("Fitted prevalence is a probability vector at every age", tag_smoother) {
    std::mt19937 gen(3);
    PrevalenceSmoother smoother;
    const SmoothModel model = smoother.fit(testdata::sampledCounts(0, 10, 500, gen), testdata::weightCategories());

    for (double age = -2.0; age <= 12.0; age += 0.25) {
        const Eigen::VectorXd p = model.prevalence(age);
        INFO("age " << age);
        CHECK(p.sum() == Approx(1.0).margin(1e-12));
        CHECK(p.minCoeff() >= 0.0);
    }
    const Eigen::MatrixXd table = model.prevalenceTable({0.0, 5.0, 10.0});
    REQUIRE(table.rows() == 3);
    CHECK(table.row(1).transpose().isApprox(model.prevalence(5.0)));
}

TEST_CASE("An age without observations is interpolated from its neighbours", tag_smoother) {
    PrevalenceSmoother smoother;
    const auto categories = testdata::weightCategories();

    const SmoothModel zeroed = smoother.fit(withAgeZeroed(testdata::expectedCounts(0, 10, 5000.0), 5.0), categories);

    auto records = testdata::expectedCounts(0, 10, 5000.0);
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [](const CategoryCount& r) { return r.age == 5.0; }),
                  records.end());
    const SmoothModel missing = smoother.fit(records, categories);

    for (const SmoothModel* model : {&zeroed, &missing}) {
        const Eigen::VectorXd before = model->prevalence(4.0);
        const Eigen::VectorXd at = model->prevalence(5.0);
        const Eigen::VectorXd after = model->prevalence(6.0);
        for (int k = 0; k < 3; ++k) {
            INFO("category " << k);
            CHECK(at(k) >= std::min(before(k), after(k)) - 1e-9);
            CHECK(at(k) <= std::max(before(k), after(k)) + 1e-9);
        }
    }
}

TEST_CASE("The reference category does not change fitted prevalence", tag_smoother) {
    const auto records = testdata::expectedCounts(0, 10, 8000.0);

    PrevalenceSmoother by_normal;
    PrevalenceSmoother by_overweight;
    by_overweight.configure({{"reference_category", 1.0}});

    const SmoothModel a = by_normal.fit(records, testdata::weightCategories());
    const SmoothModel b = by_overweight.fit(records, testdata::weightCategories());
    CHECK(b.referenceCategory() == 1);
    CHECK(b.contrastCategory(0) == 0);
    CHECK(b.contrastCategory(1) == 2);
    for (double age = 0.0; age <= 10.0; age += 1.0) {
        INFO("age " << age);
        CHECK(a.prevalence(age).isApprox(b.prevalence(age), 1e-5));
    }
}

TEST_CASE("A fit reports its covariance and diagnostics", tag_smoother) {
    std::mt19937 gen(5);
    PrevalenceSmoother smoother;
    const SmoothModel model = smoother.fit(testdata::sampledCounts(0, 10, 1000, gen), testdata::weightCategories());

    const Eigen::Index p = 2 * model.basisSize();
    REQUIRE(model.coefficients().size() == p);
    REQUIRE(model.covariance().rows() == p);
    CHECK(model.covariance().isApprox(model.covariance().transpose()));
    CHECK(model.covariance().diagonal().minCoeff() > 0.0);

    REQUIRE(model.lambdas().size() == 2);
    CHECK(model.lambdas().minCoeff() >= 1e-2 * 0.999);
    CHECK(model.lambdas().maxCoeff() <= 1e6 * 1.001);

    const SmoothFitDiagnostics& diag = model.diagnostics();
    CHECK(diag.effective_degrees_of_freedom > 0.0);
    CHECK(diag.effective_degrees_of_freedom <= static_cast<double>(p) + 1e-9);
    CHECK(diag.log_likelihood < 0.0);
    CHECK(diag.fits_evaluated >= 1);
}

TEST_CASE("Resampling is reproducible for a seed", tag_smoother) {
    PrevalenceSmoother smoother;
    const SmoothModel model = smoother.fit(testdata::expectedCounts(0, 10, 1000.0), testdata::weightCategories());

    std::mt19937 gen_a(99), gen_b(99), gen_c(100);
    const SmoothModel a = model.resample(gen_a);
    const SmoothModel b = model.resample(gen_b);
    const SmoothModel c = model.resample(gen_c);

    CHECK((a.coefficients().array() == b.coefficients().array()).all());
    CHECK_FALSE(a.coefficients().isApprox(model.coefficients()));
    CHECK_FALSE(a.coefficients().isApprox(c.coefficients()));
    CHECK(&a.covariance() == &model.covariance());
}

TEST_CASE("Default basis size follows the age range", tag_smoother) {
    PrevalenceSmoother smoother;
    CHECK(smoother.basisSizeFor(10.0) == 5);
    CHECK(smoother.basisSizeFor(40.0) == 11);

    smoother.configure({{"basis_size", 9.0}});
    CHECK(smoother.basisSizeFor(40.0) == 9);
}

TEST_CASE("Unidentifiable data is a fit failure", tag_smoother) {
    PrevalenceSmoother smoother;
    const auto categories = testdata::weightCategories();

    CHECK_THROWS_AS(smoother.fit(std::vector<CategoryCount>{}, categories), FitFailureException);

    auto all_zero = testdata::expectedCounts(0, 10, 100.0);
    for (auto& rec : all_zero) rec.count = 0.0;
    CHECK_THROWS_AS(smoother.fit(all_zero, categories), FitFailureException);

    CHECK_THROWS_AS(smoother.fit(testdata::expectedCounts(4, 4, 100.0), categories), FitFailureException);

    auto no_obese = testdata::expectedCounts(0, 10, 100.0);
    for (auto& rec : no_obese) {
        if (rec.category == "obese") rec.count = 0.0;
    }
    CHECK_THROWS_WITH(smoother.fit(no_obese, categories), Catch::Contains("obese"));
    CHECK_THROWS_AS(smoother.fit(no_obese, categories), FitFailureException);
}

TEST_CASE("Invalid smoother settings are rejected", tag_smoother) {
    PrevalenceSmoother smoother;
    CHECK_THROWS_AS(smoother.configure({{"basis_size", 3.0}}), InvalidConfigException);
    CHECK_THROWS_AS(smoother.configure({{"penalty_order", 4.0}}), InvalidConfigException);
    CHECK_THROWS_AS(smoother.configure({{"log10_lambda_step", 0.0}}), InvalidConfigException);

    smoother.configure({{"basis_size", 9.0}});
    CHECK_THROWS_WITH(smoother.configure({{"basis_size", 1e10}}), Catch::Contains("basis_size"));
    CHECK_THROWS_WITH(smoother.configure({{"lambda_sweeps", 3e9}}), Catch::Contains("lambda_sweeps"));
    CHECK_THROWS_WITH(smoother.configure({{"max_newton_iterations", 1e11}}),
                      Catch::Contains("max_newton_iterations"));
    CHECK_THROWS_WITH(smoother.configure({{"reference_category", -1.0}}), Catch::Contains("reference_category"));
    CHECK(smoother.basisSizeFor(40.0) == 9);

    PrevalenceSmoother bad_reference;
    bad_reference.configure({{"reference_category", 3.0}});
    CHECK_THROWS_AS(bad_reference.fit(testdata::expectedCounts(0, 10, 100.0), testdata::weightCategories()),
                    InvalidConfigException);
}
