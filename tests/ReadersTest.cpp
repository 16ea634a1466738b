#include <catch2/catch.hpp>

#include "TestData.hpp"
#include "exceptions/Exceptions.hpp"
#include "output/TransitionWriter.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadCountData.hpp"
#include "utils/ReadEstimationSettings.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace nettrans;

namespace {

class TempFiles {
public:
    TempFiles() : dir_(testdata::scratchDirectory("nettrans_readers")) {
        if (!FileUtils::ensureDirectoryExists(dir_)) {
            throw std::runtime_error("Cannot create scratch directory " + dir_);
        }
    }

    ~TempFiles() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

protected:
    std::string write(const std::string& name, const std::string& contents) {
        const std::string path = FileUtils::joinPaths(dir_, name);
        std::ofstream out(path);
        out << contents;
        return path;
    }

    std::string dir_;
};

} // namespace

const char* tag_readers = "[readers]";

TEST_CASE_METHOD(TempFiles, "Settings file skips comments and blank lines", tag_readers) {
    const std::string path = write("settings.txt",
                                   "# smoother\n"
                                   "basis_size 12\n"
                                   "\n"
                                   "   tolerance   1e-9   # tighter\n"
                                   "bootstrap_replicates 250\n");
    const auto settings = readSettingsFile(path);
    REQUIRE(settings.size() == 3u);
    CHECK(settings.at("basis_size") == Approx(12.0));
    CHECK(settings.at("tolerance") == Approx(1e-9));
    CHECK(settings.at("bootstrap_replicates") == Approx(250.0));

    const auto merged = mergeSettings(settings, {{"bootstrap_replicates", 10.0}, {"random_seed", 3.0}});
    CHECK(merged.at("bootstrap_replicates") == Approx(10.0));
    CHECK(merged.at("random_seed") == Approx(3.0));
    CHECK(merged.at("basis_size") == Approx(12.0));
}

TEST_CASE_METHOD(TempFiles, "Malformed settings name the offending line", tag_readers) {
    const std::string bad_value = write("bad_value.txt", "basis_size 12\n\ntolerance abc\n");
    CHECK_THROWS_AS(readSettingsFile(bad_value), DataFormatException);
    CHECK_THROWS_WITH(readSettingsFile(bad_value), Catch::Contains("bad_value.txt:3"));

    CHECK_THROWS_AS(readSettingsFile(write("missing.txt", "basis_size\n")), DataFormatException);
    CHECK_THROWS_AS(readSettingsFile(write("extra.txt", "basis_size 12 13\n")), DataFormatException);
    CHECK_THROWS_AS(readSettingsFile(write("dup.txt", "basis_size 12\nbasis_size 13\n")), DataFormatException);
    CHECK_THROWS_AS(readSettingsFile(FileUtils::joinPaths(dir_, "does_not_exist.txt")), DataFormatException);
}

TEST_CASE_METHOD(TempFiles, "Count data columns may come in any order", tag_readers) {
    const std::string path = write("counts.csv",
                                   "category,count,age,source\n"
                                   "normal,120,2,survey\n"
                                   "\"overweight\",30.5,2,survey\n"
                                   "\n"
                                   "obese, 4 ,3,survey\r\n");
    const auto records = readCountData(path);
    REQUIRE(records.size() == 3u);
    CHECK(records[1].category == "overweight");
    CHECK(records[1].count == Approx(30.5));
    CHECK(records[2].age == Approx(3.0));
    CHECK(records[2].count == Approx(4.0));
}

TEST_CASE_METHOD(TempFiles, "Quoted labels may contain commas and quotes", tag_readers) {
    const std::string comma_label = "overweight, severe";
    const std::string quote_label = "so-called \"normal\"";
    const std::string path = write("quoted.csv",
                                   "age,category,count\n"
                                   "1," + TransitionWriter::csvEscape(comma_label) + ",12\n"
                                   "1, " + TransitionWriter::csvEscape(quote_label) + " ,8\n"
                                   "2,\"obese\",3\r\n");
    const auto records = readCountData(path);
    REQUIRE(records.size() == 3u);
    CHECK(records[0].category == comma_label);
    CHECK(records[0].count == Approx(12.0));
    CHECK(records[1].category == quote_label);
    CHECK(records[1].count == Approx(8.0));
    CHECK(records[2].category == "obese");

    const std::string open_quote = write("open_quote.csv", "age,category,count\n1,\"normal,5\n");
    CHECK_THROWS_AS(readCountData(open_quote), DataFormatException);
    CHECK_THROWS_WITH(readCountData(open_quote), Catch::Contains("open_quote.csv:2"));

    CHECK(splitCategoryList("normal,\"over, weight\"") == std::vector<std::string>{"normal", "over, weight"});
}

TEST_CASE_METHOD(TempFiles, "Malformed count data names the offending line", tag_readers) {
    const std::string path = write("bad.csv", "age,category,count\n1,normal,10\n2,obese,many\n");
    CHECK_THROWS_AS(readCountData(path), DataFormatException);
    CHECK_THROWS_WITH(readCountData(path), Catch::Contains("bad.csv:3"));

    CHECK_THROWS_AS(readCountData(write("no_count.csv", "age,category\n1,normal\n")), DataFormatException);
    CHECK_THROWS_AS(readCountData(write("short.csv", "age,category,count\n1,normal\n")), DataFormatException);
    CHECK_THROWS_AS(readCountData(write("empty.csv", "")), DataFormatException);
    CHECK_THROWS_AS(readCountData(FileUtils::joinPaths(dir_, "nope.csv")), DataFormatException);
}

TEST_CASE("Category lists are split and trimmed", tag_readers) {
    CHECK(splitCategoryList("normal, overweight ,obese") ==
          std::vector<std::string>{"normal", "overweight", "obese"});
    CHECK(splitCategoryList("").empty());
}

TEST_CASE("Log level names map to levels", "[logger]") {
    CHECK(Logger::levelFromString("debug") == LogLevel::DEBUG);
    CHECK(Logger::levelFromString("WARN") == LogLevel::WARNING);
    CHECK(Logger::levelToString(LogLevel::ERROR) == "ERROR");
    CHECK_THROWS_AS(Logger::levelFromString("verbose"), InvalidConfigException);
}
