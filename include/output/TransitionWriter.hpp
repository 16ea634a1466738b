#ifndef TRANSITION_WRITER_HPP
#define TRANSITION_WRITER_HPP

#include "bootstrap/BootstrapTypes.hpp"
#include "prevalence/CategoryCounts.hpp"
#include "prevalence/SmoothModel.hpp"
#include "transitions/TransitionTypes.hpp"

#include <string>

namespace nettrans {

/**
 * @brief Writes estimation results as CSV files.
 *
 * All writers throw DataFormatException (after logging an error) when the
 * target file cannot be opened.
 */
class TransitionWriter {
public:
    /**
     * @brief Smoothed prevalence table: "age,<label_1>,...,<label_K>".
     */
    void writePrevalence(const std::string& filepath, const TransitionEstimate& estimate) const;

    /**
     * @brief Observed proportions next to the fitted curves:
     *        "age,total,<label>_observed...,<label>_fitted...".
     */
    void writeObservedVsFitted(const std::string& filepath,
                               const CountTable& table,
                               const SmoothModel& model) const;

    /**
     * @brief Long-form transitions, one row per age step and category pair:
     *        "age_from,age_to,from,to,flow,probability" followed by
     *        "lower,median,upper,mean,std_dev" when @p bands is given.
     * @throws InvalidConfigException if @p bands does not match the estimate's steps.
     */
    void writeTransitions(const std::string& filepath,
                          const TransitionEstimate& estimate,
                          const BootstrapSummary* bands = nullptr) const;

    /**
     * @brief Excluded replicates: "replicate,message".
     */
    void writeFailures(const std::string& filepath, const BootstrapSummary& summary) const;

    /**
     * @brief Writes prevalence.csv, transitions.csv and, with a summary,
     *        bootstrap_failures.csv into @p output_dir (created if missing).
     */
    void writeAll(const std::string& output_dir,
                  const TransitionEstimate& estimate,
                  const BootstrapSummary* summary = nullptr) const;

    static std::string csvEscape(const std::string& field);
};

} // namespace nettrans

#endif // TRANSITION_WRITER_HPP
