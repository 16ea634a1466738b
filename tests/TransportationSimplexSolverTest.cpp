#include <catch2/catch.hpp>

#include "exceptions/Exceptions.hpp"
#include "transitions/CostMatrix.hpp"
#include "transitions/solvers/TransportationSimplexSolver.hpp"

#include <random>

using namespace nettrans;

namespace {

Eigen::VectorXd vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v(i++) = x;
    return v;
}

CostMatrix squaredDistanceCost(int K) {
    std::vector<std::string> labels;
    for (int k = 0; k < K; ++k) labels.push_back("c" + std::to_string(k));
    return CostMatrixBuilder().build(labels);
}

void checkMarginals(const TransportSolution& solution, const Eigen::VectorXd& supply, const Eigen::VectorXd& demand) {
    CHECK(solution.flow.minCoeff() >= 0.0);
    for (Eigen::Index i = 0; i < supply.size(); ++i) {
        INFO("row " << i);
        CHECK(solution.flow.row(i).sum() == Approx(supply(i)).margin(1e-9));
    }
    for (Eigen::Index j = 0; j < demand.size(); ++j) {
        INFO("column " << j);
        CHECK(solution.flow.col(j).sum() == Approx(demand(j)).margin(1e-9));
    }
}

} // namespace

const char* tag_transport = "[transport]";

TEST_CASE("Transport solver finds the 2x2 optimum", tag_transport) {
    Eigen::MatrixXd C(2, 2);
    C << 0.0, 1.0,
         1.0, 0.0;
    CostMatrix cost({"a", "b"}, C);

    TransportationSimplexSolver solver;
    const auto solution = solver.solve(vec({0.6, 0.4}), vec({0.5, 0.5}), cost);

    CHECK(solution.flow(0, 0) == Approx(0.5).margin(1e-12));
    CHECK(solution.flow(0, 1) == Approx(0.1).margin(1e-12));
    CHECK(solution.flow(1, 0) == Approx(0.0).margin(1e-12));
    CHECK(solution.flow(1, 1) == Approx(0.4).margin(1e-12));
    REQUIRE(solution.total_cost == Approx(0.1).margin(1e-12));
}

TEST_CASE("Convex cost moves mass only between adjacent categories", tag_transport) {
    const auto supply = vec({0.5, 0.3, 0.2});
    const auto demand = vec({0.3, 0.4, 0.3});

    TransportationSimplexSolver solver;
    const auto solution = solver.solve(supply, demand, squaredDistanceCost(3));

    Eigen::MatrixXd expected(3, 3);
    expected << 0.3, 0.2, 0.0,
                0.0, 0.2, 0.1,
                0.0, 0.0, 0.2;
    INFO(solution.flow);
    REQUIRE(solution.flow.isApprox(expected, 1e-12));
    REQUIRE(solution.total_cost == Approx(0.3).margin(1e-12));
    checkMarginals(solution, supply, demand);
}

TEST_CASE("Solver pivots away from the north-west corner start", tag_transport) {
    // Moving between the outer categories is cheap, through the middle one expensive.
    CostConfig config;
    config.function = CostFunction::Explicit;
    config.explicit_costs.resize(3, 3);
    config.explicit_costs << 0.0, 5.0, 1.0,
                             5.0, 0.0, 5.0,
                             1.0, 5.0, 0.0;
    const CostMatrix cost = CostMatrixBuilder().build({"x", "y", "z"}, config);

    const auto supply = vec({0.5, 0.3, 0.2});
    const auto demand = vec({0.2, 0.3, 0.5});

    TransportationSimplexSolver solver;
    const auto solution = solver.solve(supply, demand, cost);

    Eigen::MatrixXd expected(3, 3);
    expected << 0.2, 0.0, 0.3,
                0.0, 0.3, 0.0,
                0.0, 0.0, 0.2;
    INFO(solution.flow);
    REQUIRE(solution.flow.isApprox(expected, 1e-12));
    REQUIRE(solution.total_cost == Approx(0.3).margin(1e-12));
    REQUIRE(solution.pivots > 0);
}

TEST_CASE("Equal marginals stay on the diagonal", tag_transport) {
    const auto p = vec({0.2, 0.5, 0.3});

    TransportationSimplexSolver solver;
    const auto solution = solver.solve(p, p, squaredDistanceCost(3));

    INFO(solution.flow);
    REQUIRE(solution.flow.isApprox(Eigen::MatrixXd(p.asDiagonal()), 1e-12));
    REQUIRE(solution.total_cost == Approx(0.0).margin(1e-15));
}

TEST_CASE("Random instances match their marginals and solve deterministically", tag_transport) {
    std::mt19937 gen(7);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    TransportationSimplexSolver solver;

    for (int trial = 0; trial < 50; ++trial) {
        const int K = 2 + trial % 5;
        Eigen::VectorXd supply(K), demand(K);
        for (int k = 0; k < K; ++k) {
            supply(k) = unif(gen);
            demand(k) = unif(gen);
        }
        supply /= supply.sum();
        demand /= demand.sum();

        CostConfig config;
        config.function = CostFunction::Explicit;
        config.explicit_costs = Eigen::MatrixXd::Zero(K, K);
        for (int i = 0; i < K; ++i)
            for (int j = 0; j < K; ++j)
                if (i != j) config.explicit_costs(i, j) = 1.0 + unif(gen);
        std::vector<std::string> labels;
        for (int k = 0; k < K; ++k) labels.push_back("k" + std::to_string(k));
        const CostMatrix cost = CostMatrixBuilder().build(labels, config);

        const auto first = solver.solve(supply, demand, cost);
        const auto second = solver.solve(supply, demand, cost);

        INFO("trial " << trial);
        checkMarginals(first, supply, demand);
        CHECK((first.flow.array() == second.flow.array()).all());
        CHECK(first.total_cost == second.total_cost);

        // Never worse than keeping min(p_i, q_i) in place and moving the rest at the dearest price.
        const double stay = supply.cwiseMin(demand).sum();
        CHECK(first.total_cost <= (1.0 - stay) * config.explicit_costs.maxCoeff() + 1e-12);
    }
}

TEST_CASE("Negative supply is infeasible and names the entry", tag_transport) {
    TransportationSimplexSolver solver;
    try {
        solver.solve(vec({0.6, -0.01, 0.41}), vec({0.3, 0.4, 0.3}), squaredDistanceCost(3));
        FAIL("expected InfeasibleProblemException");
    } catch (const InfeasibleProblemException& e) {
        const std::string what = e.what();
        INFO(what);
        CHECK(what.find("supply[1]") != std::string::npos);
        CHECK(what.find("negative") != std::string::npos);
    }
}

TEST_CASE("Unnormalised demand is infeasible", tag_transport) {
    TransportationSimplexSolver solver;
    try {
        solver.solve(vec({0.5, 0.3, 0.2}), vec({0.3, 0.4, 0.27}), squaredDistanceCost(3));
        FAIL("expected InfeasibleProblemException");
    } catch (const InfeasibleProblemException& e) {
        INFO(e.detail());
        CHECK(e.detail().find("demand sums to 0.97") != std::string::npos);
    }
}

TEST_CASE("Marginal sums within tolerance are accepted", tag_transport) {
    TransportationSimplexSolver solver;
    const auto supply = vec({0.5, 0.3, 0.2 + 1e-8});
    const auto demand = vec({0.3, 0.4, 0.3});
    const auto solution = solver.solve(supply, demand, squaredDistanceCost(3));
    REQUIRE(solution.flow.sum() == Approx(supply.sum()).margin(1e-12));
}

TEST_CASE("Marginal size mismatch is a configuration error", tag_transport) {
    TransportationSimplexSolver solver;
    REQUIRE_THROWS_AS(solver.solve(vec({0.5, 0.5}), vec({0.3, 0.4, 0.3}), squaredDistanceCost(3)),
                      InvalidConfigException);
}

TEST_CASE("Solver configure validates its settings", tag_transport) {
    TransportationSimplexSolver solver;
    REQUIRE_THROWS_AS(solver.configure({{"marginal_tolerance", 0.0}}), InvalidConfigException);
    REQUIRE_THROWS_AS(solver.configure({{"max_pivots", 0.0}}), InvalidConfigException);
    REQUIRE_THROWS_AS(solver.configure({{"max_pivots", 2.5}}), InvalidConfigException);
    REQUIRE_THROWS_WITH(solver.configure({{"max_pivots", 5e9}}), Catch::Contains("max_pivots"));

    solver.configure({{"marginal_tolerance", 0.05}});
    REQUIRE(solver.marginalTolerance() == Approx(0.05));
    REQUIRE_NOTHROW(solver.solve(vec({0.5, 0.3, 0.2}), vec({0.3, 0.4, 0.27}), squaredDistanceCost(3)));
}

TEST_CASE("A cloned solver solves identically", tag_transport) {
    TransportationSimplexSolver solver;
    const auto copy = solver.clone();
    const auto supply = vec({0.1, 0.6, 0.3});
    const auto demand = vec({0.4, 0.2, 0.4});
    const auto a = solver.solve(supply, demand, squaredDistanceCost(3));
    const auto b = copy->solve(supply, demand, squaredDistanceCost(3));
    REQUIRE((a.flow.array() == b.flow.array()).all());
}
