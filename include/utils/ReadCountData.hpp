#ifndef READ_COUNT_DATA_HPP
#define READ_COUNT_DATA_HPP

#include "prevalence/CategoryCounts.hpp"

#include <string>
#include <vector>

namespace nettrans {

/**
 * @brief Reads long-format survey counts from a CSV file.
 *
 * The first line is a header naming the columns "age", "category" and
 * "count" (any order, extra columns ignored). Each further non-blank line
 * holds one observation cell.
 *
 * Fields may be enclosed in double quotes to carry commas; inside quotes a
 * doubled quote ("") stands for one quote character.
 *
 * @param filename Path to the CSV file.
 * @return Records in file order.
 * @throws DataFormatException if the file cannot be opened, the header lacks a
 *         required column, a quoted field is unterminated, or a line has a
 *         missing field or a non-numeric age/count. Messages carry the file
 *         name and line number.
 */
std::vector<CategoryCount> readCountData(const std::string& filename);

/**
 * @brief Splits a comma-separated list ("normal,overweight,obese") into trimmed labels.
 */
std::vector<std::string> splitCategoryList(const std::string& list);

} // namespace nettrans

#endif // READ_COUNT_DATA_HPP
