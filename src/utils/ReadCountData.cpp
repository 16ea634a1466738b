#include "utils/ReadCountData.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace nettrans {

    static const std::string LOG_SOURCE = "ReadCountData";

    namespace {

    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos) return std::string();
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    bool isBlank(char c) {
        return c == ' ' || c == '\t' || c == '\r';
    }

    // Comma-separated fields. A double-quoted field may hold commas, with "" standing for one quote.
    std::vector<std::string> splitLine(const std::string& line, const std::string& where) {
        std::vector<std::string> fields;
        std::string field;
        bool in_quotes = false;
        bool was_quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (in_quotes) {
                if (c != '"') {
                    field += c;
                } else if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else if (c == ',') {
                fields.push_back(was_quoted ? field : trim(field));
                field.clear();
                was_quoted = false;
            } else if (c == '"' && !was_quoted && trim(field).empty()) {
                field.clear();
                in_quotes = true;
                was_quoted = true;
            } else if (!(was_quoted && isBlank(c))) {
                field += c;
            }
        }
        if (in_quotes) {
            throw DataFormatException("readCountData", where + ": unterminated quoted field");
        }
        fields.push_back(was_quoted ? field : trim(field));
        return fields;
    }

    double parseNumber(const std::string& token, const std::string& column, const std::string& where) {
        const std::string message = where + ": " + column + " '" + token + "' is not a number";
        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(token, &consumed);
        } catch (const std::exception&) {
            throw DataFormatException("readCountData", message);
        }
        if (consumed != token.size()) {
            throw DataFormatException("readCountData", message);
        }
        return value;
    }

    } // namespace

    std::vector<std::string> splitCategoryList(const std::string& list) {
        std::vector<std::string> labels;
        for (const auto& label : splitLine(list, "category list")) {
            if (!label.empty()) labels.push_back(label);
        }
        return labels;
    }

    std::vector<CategoryCount> readCountData(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            Logger::getInstance().error(LOG_SOURCE, "Could not open count data file: " + filename);
            throw DataFormatException("readCountData", "Could not open count data file: " + filename);
        }

        std::string line;
        if (!std::getline(file, line)) {
            throw DataFormatException("readCountData", filename + ": file is empty, expected a header line");
        }

        int age_col = -1, category_col = -1, count_col = -1;
        const auto header = splitLine(line, filename + ":1");
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == "age") age_col = static_cast<int>(i);
            else if (header[i] == "category") category_col = static_cast<int>(i);
            else if (header[i] == "count") count_col = static_cast<int>(i);
        }
        if (age_col < 0 || category_col < 0 || count_col < 0) {
            throw DataFormatException("readCountData", filename + ":1: header must name the columns age, category and count");
        }
        const size_t needed = static_cast<size_t>(std::max(age_col, std::max(category_col, count_col))) + 1;

        std::vector<CategoryCount> records;
        int line_number = 1;
        while (std::getline(file, line)) {
            ++line_number;
            if (trim(line).empty()) continue;

            const std::string where = filename + ":" + std::to_string(line_number);
            const auto fields = splitLine(line, where);
            if (fields.size() < needed) {
                throw DataFormatException("readCountData", where + ": expected at least " + std::to_string(needed) +
                                                           " fields, found " + std::to_string(fields.size()));
            }

            CategoryCount record;
            record.age = parseNumber(fields[static_cast<size_t>(age_col)], "age", where);
            record.category = fields[static_cast<size_t>(category_col)];
            record.count = parseNumber(fields[static_cast<size_t>(count_col)], "count", where);
            if (record.category.empty()) {
                throw DataFormatException("readCountData", where + ": empty category label");
            }
            records.push_back(std::move(record));
        }

        Logger::getInstance().info(LOG_SOURCE, "Read " + std::to_string(records.size()) +
                                               " count records from " + filename);
        return records;
    }

} // namespace nettrans
