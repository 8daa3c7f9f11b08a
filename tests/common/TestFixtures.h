#pragma once

#include "ColumnTypes.h"
#include "DataFrame.h"
#include "StatisticsSnapshot.h"

#include <chrono>
#include <filesystem>
#include <ostream>
#include <sstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace SieveTests {

inline DataFrame ageCityFrame() {
    return DataFrame({
        makeNumericColumn("age", {31.0, std::nullopt, 45.0, 27.0}),
        makeTextColumn("city", {std::string("Lyon"), std::string("Oslo"), std::string("Lima"), std::nullopt}),
    });
}

inline ColumnTypeMap ageCityTypes() {
    return {{"age", ColumnType::NUMBER}, {"city", ColumnType::TEXT}};
}

/**
 * @brief Statistics where no built-in rule finds anything for `columns`.
 */
inline StatisticsSnapshot quietStatistics(const std::vector<std::string>& columns) {
    StatisticsSnapshot stats;
    for (const auto& c : columns) {
        stats.set(StatisticsSnapshot::columnKey(c, "null_value_rate"), 0.0);
        stats.set(StatisticsSnapshot::columnKey(c, "count_distinct"), 10.0);
    }
    return stats;
}

inline std::filesystem::path createUniqueTempDir(const std::string& prefix) {
    const auto nowNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    const std::filesystem::path root =
        std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(nowNs));
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

class TempDir {
public:
    explicit TempDir(const std::string& prefix) : path_(createUniqueTempDir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Redirects a standard stream into a buffer for the lifetime of the object.
 */
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(previous_); }
    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string text() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

inline const std::vector<double>& numbers(const DataFrame& frame, const std::string& column) {
    return std::get<std::vector<double>>(frame.column(column).values);
}

inline const std::vector<std::string>& texts(const DataFrame& frame, const std::string& column) {
    return std::get<std::vector<std::string>>(frame.column(column).values);
}

} // namespace SieveTests
