#include "Statistics.h"

#include <algorithm>
#include <cmath>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats{0, 0, 0, 0, 0, 0, 0};

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) finite.push_back(value);
    }
    if (finite.empty()) return stats;

    const size_t n = finite.size();
    stats.count = n;

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);

    const auto minMax = std::minmax_element(finite.begin(), finite.end());
    stats.min = *minMax.first;
    stats.max = *minMax.second;

    size_t mid = n / 2;
    std::nth_element(finite.begin(), finite.begin() + mid, finite.end());
    double upper = finite[mid];
    if (n % 2 == 0) {
        std::nth_element(finite.begin(), finite.begin() + (mid - 1), finite.begin() + mid);
        stats.median = (finite[mid - 1] + upper) / 2.0;
    } else {
        stats.median = upper;
    }

    return stats;
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return std::nullopt;

    double meanX = 0.0;
    double meanY = 0.0;
    for (size_t i = 0; i < n; ++i) {
        meanX += x[i];
        meanY += y[i];
    }
    meanX /= static_cast<double>(n);
    meanY /= static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - meanX;
        const double dy = y[i] - meanY;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 1e-12 || syy <= 1e-12) return std::nullopt;
    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}
