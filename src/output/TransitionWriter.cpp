#include "output/TransitionWriter.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>

namespace nettrans {

    static const std::string LOG_SOURCE = "TransitionWriter";

    namespace {

    std::ofstream openForWriting(const std::string& filepath, const std::string& source) {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            Logger::getInstance().error(LOG_SOURCE, "Failed to open: " + filepath);
            throw DataFormatException(source, "Failed to open output file: " + filepath);
        }
        return file;
    }

    } // namespace

    std::string TransitionWriter::csvEscape(const std::string& field) {
        if (field.find_first_of(",\"\n") == std::string::npos) return field;
        std::string escaped = "\"";
        for (char c : field) {
            if (c == '"') escaped += '"';
            escaped += c;
        }
        escaped += '"';
        return escaped;
    }

    void TransitionWriter::writePrevalence(const std::string& filepath, const TransitionEstimate& estimate) const {
        std::ofstream file = openForWriting(filepath, "TransitionWriter::writePrevalence");

        file << "age";
        for (const auto& label : estimate.categories) {
            file << "," << csvEscape(label);
        }
        file << "\n";

        for (size_t a = 0; a < estimate.ages.size(); ++a) {
            file << estimate.ages[a];
            for (Eigen::Index k = 0; k < estimate.prevalence.cols(); ++k) {
                file << "," << std::fixed << std::setprecision(8) << estimate.prevalence(static_cast<Eigen::Index>(a), k);
            }
            file << std::defaultfloat << "\n";
        }

        Logger::getInstance().info(LOG_SOURCE, "Prevalence table saved to: " + filepath);
    }

    void TransitionWriter::writeObservedVsFitted(const std::string& filepath,
                                                 const CountTable& table,
                                                 const SmoothModel& model) const {
        std::ofstream file = openForWriting(filepath, "TransitionWriter::writeObservedVsFitted");

        file << "age,total";
        for (const auto& label : table.categories) file << "," << csvEscape(label + "_observed");
        for (const auto& label : table.categories) file << "," << csvEscape(label + "_fitted");
        file << "\n";

        const Eigen::MatrixXd observed = table.observedProportions();
        const Eigen::VectorXd totals = table.rowTotals();
        const Eigen::MatrixXd fitted = model.prevalenceTable(table.ages);

        for (int a = 0; a < table.numAges(); ++a) {
            file << table.ages[static_cast<size_t>(a)] << "," << totals(a);
            file << std::fixed << std::setprecision(8);
            for (int k = 0; k < table.numCategories(); ++k) {
                if (totals(a) > 0.0) file << "," << observed(a, k);
                else file << ",";
            }
            for (int k = 0; k < table.numCategories(); ++k) {
                file << "," << fitted(a, k);
            }
            file << std::defaultfloat << "\n";
        }

        Logger::getInstance().info(LOG_SOURCE, "Observed vs fitted prevalence saved to: " + filepath);
    }

    void TransitionWriter::writeTransitions(const std::string& filepath,
                                            const TransitionEstimate& estimate,
                                            const BootstrapSummary* bands) const {
        const std::string source = "TransitionWriter::writeTransitions";
        if (bands && bands->bands.size() != estimate.steps.size()) {
            THROW_INVALID_CONFIG(source, "Bootstrap bands cover " + std::to_string(bands->bands.size()) +
                                         " age steps but the estimate has " + std::to_string(estimate.steps.size()));
        }

        std::ofstream file = openForWriting(filepath, source);
        file << "age_from,age_to,from,to,flow,probability";
        if (bands) file << ",lower,median,upper,mean,std_dev";
        file << "\n";

        const int K = static_cast<int>(estimate.categories.size());
        for (size_t s = 0; s < estimate.steps.size(); ++s) {
            const AgeStepTransition& step = estimate.steps[s];
            for (int i = 0; i < K; ++i) {
                for (int j = 0; j < K; ++j) {
                    file << step.age_from << "," << step.age_to << ","
                         << csvEscape(estimate.categories[static_cast<size_t>(i)]) << ","
                         << csvEscape(estimate.categories[static_cast<size_t>(j)]);
                    file << std::fixed << std::setprecision(8)
                         << "," << step.flow(i, j) << "," << step.probabilities(i, j);
                    if (bands) {
                        const TransitionBand& band = bands->bands[s];
                        file << "," << band.lower(i, j) << "," << band.median(i, j) << "," << band.upper(i, j)
                             << "," << band.mean(i, j) << "," << band.std_dev(i, j);
                    }
                    file << std::defaultfloat << "\n";
                }
            }
        }

        Logger::getInstance().info(LOG_SOURCE, "Transitions saved to: " + filepath);
    }

    void TransitionWriter::writeFailures(const std::string& filepath, const BootstrapSummary& summary) const {
        std::ofstream file = openForWriting(filepath, "TransitionWriter::writeFailures");
        file << "replicate,message\n";
        for (const auto& failure : summary.failures) {
            file << failure.replicate << "," << csvEscape(failure.message) << "\n";
        }
        Logger::getInstance().info(LOG_SOURCE, std::to_string(summary.failures.size()) +
                                               " bootstrap failures saved to: " + filepath);
    }

    void TransitionWriter::writeAll(const std::string& output_dir,
                                    const TransitionEstimate& estimate,
                                    const BootstrapSummary* summary) const {
        if (!FileUtils::ensureDirectoryExists(output_dir)) {
            Logger::getInstance().error(LOG_SOURCE, "Could not create output directory: " + output_dir);
            throw DataFormatException("TransitionWriter::writeAll", "Could not create output directory: " + output_dir);
        }

        writePrevalence(FileUtils::joinPaths(output_dir, "prevalence.csv"), estimate);
        writeTransitions(FileUtils::joinPaths(output_dir, "transitions.csv"), estimate, summary);
        if (summary) {
            writeFailures(FileUtils::joinPaths(output_dir, "bootstrap_failures.csv"), *summary);
        }
    }

} // namespace nettrans
