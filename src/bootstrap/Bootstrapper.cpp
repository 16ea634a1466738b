#include "bootstrap/Bootstrapper.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadEstimationSettings.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <random>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ba = boost::accumulators;

namespace nettrans {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "Bootstrapper";

    namespace {

    using BandAccumulatorType = ba::accumulator_set<double,
        ba::stats<
            ba::tag::mean,
            ba::tag::variance(ba::lazy),
            ba::tag::count
        >
    >;

    enum class SlotStatus { NotRun, Succeeded, Failed };

    struct ReplicateSlot {
        SlotStatus status = SlotStatus::NotRun;
        std::vector<Eigen::MatrixXd> probabilities;   // one per age step
        std::string failure;
        std::exception_ptr error;
    };

    } // namespace

    Bootstrapper::Bootstrapper(std::shared_ptr<ITransportSolver> solver)
        : estimator_(std::move(solver)) {}

    void Bootstrapper::configure(const std::map<std::string, double>& settings) {
        auto get = [&](const std::string& key, double default_val) {
            auto it = settings.find(key);
            return (it != settings.end()) ? it->second : default_val;
        };

        const int replicates = integerSetting(settings, "bootstrap_replicates", replicates_, 1,
                                              "Bootstrapper::configure");
        const double seed = get("random_seed", static_cast<double>(seed_));
        if (!(seed >= 0.0) || seed != std::floor(seed) || seed > 9007199254740992.0) {
            THROW_INVALID_CONFIG("Bootstrapper::configure",
                                 "random_seed must be a non-negative integer, got " + std::to_string(seed));
        }
        const double level = get("confidence_level", confidence_level_);
        if (!(level > 0.0 && level < 1.0)) {
            THROW_INVALID_CONFIG("Bootstrapper::configure",
                                 "confidence_level must lie in (0, 1), got " + std::to_string(level));
        }
        const double fraction = get("min_success_fraction", min_success_fraction_);
        if (!(fraction >= 0.0 && fraction <= 1.0)) {
            THROW_INVALID_CONFIG("Bootstrapper::configure",
                                 "min_success_fraction must lie in [0, 1], got " + std::to_string(fraction));
        }
        const double max_seconds = get("max_seconds", max_seconds_);
        if (!(max_seconds >= 0.0)) {
            THROW_INVALID_CONFIG("Bootstrapper::configure",
                                 "max_seconds must be non-negative, got " + std::to_string(max_seconds));
        }
        const int threads = integerSetting(settings, "num_threads", num_threads_, 0, "Bootstrapper::configure");

        estimator_.configure(settings);

        replicates_ = replicates;
        seed_ = static_cast<std::uint64_t>(seed);
        confidence_level_ = level;
        min_success_fraction_ = fraction;
        max_seconds_ = max_seconds;
        num_threads_ = threads;

        logger.info(LOG_SOURCE, "Configured bootstrap: replicates=" + std::to_string(replicates_) +
                                ", seed=" + std::to_string(seed_) +
                                ", confidence_level=" + std::to_string(confidence_level_) +
                                ", min_success_fraction=" + std::to_string(min_success_fraction_) +
                                ", max_seconds=" + std::to_string(max_seconds_) +
                                ", num_threads=" + std::to_string(num_threads_));
    }

    double Bootstrapper::quantile(const std::vector<double>& sorted, double probability) {
        if (sorted.empty()) {
            THROW_INVALID_CONFIG("Bootstrapper::quantile", "Cannot take a quantile of an empty sample");
        }
        if (sorted.size() == 1) return sorted.front();
        const double h = (static_cast<double>(sorted.size()) - 1.0) * std::clamp(probability, 0.0, 1.0);
        const size_t lo = static_cast<size_t>(std::floor(h));
        const size_t hi = std::min(lo + 1, sorted.size() - 1);
        return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
    }

    BootstrapSummary Bootstrapper::run(const SmoothModel& model,
                                       const std::vector<double>& age_grid,
                                       const CostMatrix& cost) const {
        const std::string source = "Bootstrapper::run";
        TransitionEstimator::validateAgeGrid(age_grid, source);
        cost.requireCategoryOrder(model.categories(), source);

        const int n = replicates_;
        const size_t num_steps = age_grid.size() - 1;
        std::vector<ReplicateSlot> slots(static_cast<size_t>(n));

        const std::uint32_t seed_lo = static_cast<std::uint32_t>(seed_ & 0xffffffffULL);
        const std::uint32_t seed_hi = static_cast<std::uint32_t>(seed_ >> 32);

        const bool has_deadline = max_seconds_ > 0.0;
        const auto start = std::chrono::steady_clock::now();
        auto elapsedSeconds = [&start]() {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        };
        std::atomic<bool> deadline_hit(false);

        int threads = 1;
#ifdef _OPENMP
        threads = num_threads_ > 0 ? num_threads_ : omp_get_max_threads();
#endif
        logger.info(LOG_SOURCE, "Running " + std::to_string(n) + " replicates over " +
                                std::to_string(num_steps) + " age steps on " + std::to_string(threads) + " thread(s)");

        #pragma omp parallel num_threads(threads)
        {
        // Each thread gets its own solver instance.
        const TransitionEstimator thread_estimator = estimator_.clone();

        #pragma omp for schedule(dynamic)
        for (int r = 0; r < n; ++r) {
            ReplicateSlot& slot = slots[static_cast<size_t>(r)];

            if (has_deadline) {
                if (deadline_hit.load(std::memory_order_relaxed) || elapsedSeconds() >= max_seconds_) {
                    deadline_hit.store(true, std::memory_order_relaxed);
                    continue;
                }
            }

            std::seed_seq seq{seed_lo, seed_hi, static_cast<std::uint32_t>(r)};
            std::mt19937 gen(seq);

            try {
                const SmoothModel replicate = model.resample(gen);
                std::vector<AgeStepTransition> steps = thread_estimator.estimateSteps(replicate, age_grid, cost, false);
                slot.probabilities.reserve(steps.size());
                for (auto& step : steps) {
                    slot.probabilities.push_back(std::move(step.probabilities));
                }
                slot.status = SlotStatus::Succeeded;
            } catch (const InfeasibleProblemException& e) {
                slot.status = SlotStatus::Failed;
                slot.failure = e.what();
                slot.probabilities.clear();
            } catch (...) {
                // Rethrown after the join; an exception may not leave the parallel region.
                slot.status = SlotStatus::Failed;
                slot.error = std::current_exception();
            }
        }
        } // omp parallel

        for (const auto& slot : slots) {
            if (slot.error) std::rethrow_exception(slot.error);
        }

        BootstrapSummary summary;
        summary.categories = model.categories();
        summary.confidence_level = confidence_level_;
        summary.requested = n;
        summary.interrupted = deadline_hit.load();

        for (int r = 0; r < n; ++r) {
            const ReplicateSlot& slot = slots[static_cast<size_t>(r)];
            if (slot.status == SlotStatus::NotRun) continue;
            ++summary.attempted;
            if (slot.status == SlotStatus::Succeeded) {
                ++summary.successful;
            } else {
                summary.failures.push_back({r, slot.failure});
                logger.warning(LOG_SOURCE, "Replicate " + std::to_string(r) + " excluded: " + slot.failure);
            }
        }

        if (summary.interrupted) {
            logger.warning(LOG_SOURCE, "Deadline of " + std::to_string(max_seconds_) + " s reached after " +
                                       std::to_string(summary.attempted) + " of " + std::to_string(n) +
                                       " replicates");
        }

        const int required = std::max(2, static_cast<int>(std::ceil(min_success_fraction_ *
                                                                    static_cast<double>(summary.attempted) - 1e-9)));
        if (summary.successful < required) {
            std::ostringstream oss;
            oss << summary.successful << " of " << summary.attempted << " attempted replicates succeeded ("
                << n << " requested), at least " << required << " required";
            if (!summary.failures.empty()) {
                oss << "; first failure (replicate " << summary.failures.front().replicate << "): "
                    << summary.failures.front().message;
            }
            logger.error(LOG_SOURCE, oss.str());
            throw InsufficientReplicatesException(source, oss.str());
        }

        const int K = model.numCategories();
        const double p_lower = 0.5 * (1.0 - confidence_level_);
        const double p_upper = 0.5 * (1.0 + confidence_level_);
        std::vector<double> values;
        values.reserve(static_cast<size_t>(summary.successful));

        summary.bands.reserve(num_steps);
        for (size_t s = 0; s < num_steps; ++s) {
            TransitionBand band;
            band.age_from = age_grid[s];
            band.age_to = age_grid[s + 1];
            band.lower = Eigen::MatrixXd::Zero(K, K);
            band.median = Eigen::MatrixXd::Zero(K, K);
            band.upper = Eigen::MatrixXd::Zero(K, K);
            band.mean = Eigen::MatrixXd::Zero(K, K);
            band.std_dev = Eigen::MatrixXd::Zero(K, K);

            for (int i = 0; i < K; ++i) {
                for (int j = 0; j < K; ++j) {
                    values.clear();
                    BandAccumulatorType acc;
                    for (const auto& slot : slots) {
                        if (slot.status != SlotStatus::Succeeded) continue;
                        const double v = slot.probabilities[s](i, j);
                        values.push_back(v);
                        acc(v);
                    }
                    std::sort(values.begin(), values.end());
                    band.lower(i, j) = quantile(values, p_lower);
                    band.median(i, j) = quantile(values, 0.5);
                    band.upper(i, j) = quantile(values, p_upper);
                    band.mean(i, j) = ba::mean(acc);
                    band.std_dev(i, j) = std::sqrt(std::max(0.0, ba::variance(acc)));
                }
            }
            summary.bands.push_back(std::move(band));
        }

        const double elapsed = elapsedSeconds();
        logger.info(LOG_SOURCE, "Bootstrap completed: " + std::to_string(summary.successful) + "/" +
                                std::to_string(summary.attempted) + " replicates succeeded in " +
                                std::to_string(elapsed) + " s");
        return summary;
    }

} // namespace nettrans
