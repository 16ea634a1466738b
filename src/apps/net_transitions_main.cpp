#include <Eigen/Dense>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "bootstrap/Bootstrapper.hpp"
#include "exceptions/Exceptions.hpp"
#include "output/TransitionWriter.hpp"
#include "prevalence/CategoryCounts.hpp"
#include "prevalence/PrevalenceSmoother.hpp"
#include "transitions/CostMatrix.hpp"
#include "transitions/TransitionEstimator.hpp"
#include "transitions/solvers/TransportationSimplexSolver.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadCountData.hpp"
#include "utils/ReadEstimationSettings.hpp"

using nettrans::BootstrapSummary;
using nettrans::Bootstrapper;
using nettrans::CostConfig;
using nettrans::CostMatrixBuilder;
using nettrans::CountTable;
using nettrans::Logger;
using nettrans::LogLevel;
using nettrans::NetTransitionException;
using nettrans::PrevalenceSmoother;
using nettrans::SmoothModel;
using nettrans::TransitionEstimate;
using nettrans::TransitionEstimator;
using nettrans::TransitionWriter;
using nettrans::TransportationSimplexSolver;

namespace {

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct Args {
    std::string dataPath;
    std::string settingsPath;
    std::string outputDir = "output";
    std::string categories;      // comma-separated, empty => order of appearance
    std::string logLevel = "INFO";
    std::string logFile;

    // Overrides of the settings file; negative => not given
    int replicates = -1;
    long long seed = -1;
    int threads = -1;

    bool bootstrap = true;
};

void printUsage(const char* programName) {
    std::cout
        << "Usage: " << programName
        << " --data PATH [--settings PATH] [--output DIR] [--categories a,b,c]\n";
    std::cout
        << "       " << std::string(std::char_traits<char>::length(programName), ' ')
        << " [--replicates N] [--seed N] [--threads N] [--no-bootstrap]"
        << " [--log-level DEBUG|INFO|WARNING|ERROR] [--log-file PATH]\n";
    std::cout
        << "\n  --data        CSV with header age,category,count\n"
        << "  --settings    key value settings file (see data/configuration/estimation_settings.txt)\n"
        << "  --categories  ordered category labels; defaults to order of first appearance\n";
}

Args parseArgs(int argc, char** argv) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto requireValue = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(std::string("Missing value after ") + flag);
            }
            return std::string(argv[++i]);
        };
        auto requireInt = [&](const char* flag) -> long long {
            const std::string value = requireValue(flag);
            try {
                size_t consumed = 0;
                const long long parsed = std::stoll(value, &consumed);
                if (consumed == value.size()) return parsed;
            } catch (const std::exception&) {
                throw UsageError(std::string(flag) + " expects an integer, got '" + value + "'");
            }
            throw UsageError(std::string(flag) + " expects an integer, got '" + value + "'");
        };
        auto requireCount = [&](const char* flag, long long min_value) -> int {
            const long long parsed = requireInt(flag);
            if (parsed < min_value || parsed > std::numeric_limits<int>::max()) {
                throw UsageError(std::string(flag) + " must lie in [" + std::to_string(min_value) + ", " +
                                 std::to_string(std::numeric_limits<int>::max()) + "], got " +
                                 std::to_string(parsed));
            }
            return static_cast<int>(parsed);
        };

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        }
        if (a == "--data") {
            args.dataPath = requireValue("--data");
            continue;
        }
        if (a == "--settings") {
            args.settingsPath = requireValue("--settings");
            continue;
        }
        if (a == "--output") {
            args.outputDir = requireValue("--output");
            continue;
        }
        if (a == "--categories") {
            args.categories = requireValue("--categories");
            continue;
        }
        if (a == "--replicates") {
            args.replicates = requireCount("--replicates", 1);
            continue;
        }
        if (a == "--seed") {
            args.seed = requireInt("--seed");
            continue;
        }
        if (a == "--threads") {
            args.threads = requireCount("--threads", 0);
            continue;
        }
        if (a == "--no-bootstrap") {
            args.bootstrap = false;
            continue;
        }
        if (a == "--log-level") {
            args.logLevel = requireValue("--log-level");
            continue;
        }
        if (a == "--log-file") {
            args.logFile = requireValue("--log-file");
            continue;
        }

        throw UsageError("Unknown argument: " + a);
    }

    if (args.dataPath.empty()) {
        throw UsageError("--data is required");
    }
    if (args.seed < -1) {
        throw UsageError("--seed must be non-negative");
    }
    return args;
}

std::map<std::string, double> commandLineOverrides(const Args& args) {
    std::map<std::string, double> overrides;
    if (args.replicates > 0) overrides["bootstrap_replicates"] = args.replicates;
    if (args.seed >= 0) overrides["random_seed"] = static_cast<double>(args.seed);
    if (args.threads >= 0) overrides["num_threads"] = args.threads;
    return overrides;
}

void printTransitionSummary(const TransitionEstimate& estimate, const BootstrapSummary* summary) {
    const size_t K = estimate.categories.size();
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n=== Net transition probabilities ===\n";
    for (size_t s = 0; s < estimate.steps.size(); ++s) {
        const auto& step = estimate.steps[s];
        std::cout << "\nAge " << std::defaultfloat << step.age_from << " -> " << step.age_to << std::fixed << "\n";
        for (size_t i = 0; i < K; ++i) {
            std::cout << "  " << std::setw(16) << std::left << estimate.categories[i] << std::right;
            for (size_t j = 0; j < K; ++j) {
                const auto ii = static_cast<Eigen::Index>(i);
                const auto jj = static_cast<Eigen::Index>(j);
                std::cout << "  " << step.probabilities(ii, jj);
                if (summary) {
                    const auto& band = summary->bands[s];
                    std::cout << " [" << band.lower(ii, jj) << ", " << band.upper(ii, jj) << "]";
                }
            }
            std::cout << "\n";
        }
    }
    if (summary) {
        std::cout << "\nBootstrap: " << summary->successful << "/" << summary->attempted
                  << " replicates succeeded (" << summary->requested << " requested"
                  << (summary->interrupted ? ", interrupted by deadline" : "") << ")\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);

    Args args;
    try {
        args = parseArgs(argc, argv);
        Logger::getInstance().setLogLevel(Logger::levelFromString(args.logLevel));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        if (!args.logFile.empty() && !Logger::getInstance().setLogFile(args.logFile)) {
            Logger::getInstance().warning("main", "Could not open log file " + args.logFile + ", logging to stderr only");
        }

#ifdef _OPENMP
        if (args.threads > 0) {
            omp_set_num_threads(args.threads);
        }
#endif

        const auto t0 = std::chrono::steady_clock::now();

        std::map<std::string, double> settings;
        if (!args.settingsPath.empty()) {
            settings = nettrans::readSettingsFile(args.settingsPath);
        }
        settings = nettrans::mergeSettings(settings, commandLineOverrides(args));

        const auto records = nettrans::readCountData(args.dataPath);
        const std::vector<std::string> categories = args.categories.empty()
            ? nettrans::categoriesInOrderOfAppearance(records)
            : nettrans::splitCategoryList(args.categories);

        const CountTable table = nettrans::aggregateCounts(records, categories);

        PrevalenceSmoother smoother;
        smoother.configure(settings);
        const SmoothModel model = smoother.fit(table);

        const auto cost = CostMatrixBuilder().build(categories, CostConfig::fromSettings(settings));

        auto solver = std::make_shared<TransportationSimplexSolver>();
        solver->configure(settings);

        TransitionEstimator estimator(solver);
        estimator.configure(settings);
        const std::vector<double> grid = TransitionEstimator::defaultAgeGrid(model);
        const TransitionEstimate estimate = estimator.estimate(model, grid, cost);

        std::unique_ptr<BootstrapSummary> summary;
        if (args.bootstrap) {
            Bootstrapper bootstrapper(solver);
            bootstrapper.configure(settings);
            summary = std::make_unique<BootstrapSummary>(bootstrapper.run(model, grid, cost));
        }

        TransitionWriter writer;
        writer.writeAll(args.outputDir, estimate, summary.get());
        writer.writeObservedVsFitted(FileUtils::joinPaths(args.outputDir, "observed_vs_fitted.csv"), table, model);

        printTransitionSummary(estimate, summary.get());

        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        Logger::getInstance().info("main", "Finished in " + std::to_string(elapsed) + " s; results in " + args.outputDir);
        return 0;
    } catch (const NetTransitionException& e) {
        Logger::getInstance().error("main", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().error("main", std::string("Unexpected error: ") + e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
