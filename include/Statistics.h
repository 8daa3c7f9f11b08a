#pragma once

#include <cstddef>
#include <optional>
#include <vector>

struct ColumnStats {
    size_t count;
    double mean;
    double median;
    double variance;
    double stddev;
    double min;
    double max;
};

namespace Statistics {
/**
 * @brief Summary of the finite values in `col`; non-finite entries are ignored.
 * @post count == 0 and every field zero for an input without finite values.
 */
ColumnStats calculateStats(const std::vector<double>& col);

/**
 * @brief Pearson correlation of two aligned vectors.
 * @post std::nullopt when either side has zero variance or fewer than two rows.
 */
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);
}
