#include "CleaningRules.h"

#include "CommonUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using Matrix = std::vector<std::vector<double>>;

constexpr double kRidge = 1e-9;

/**
 * @brief Gauss-Jordan inverse with full pivoting.
 * @post std::nullopt when the matrix is numerically singular.
 */
std::optional<Matrix> invert(Matrix work) {
    const size_t n = work.size();
    Matrix inv(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) inv[i][i] = 1.0;
    std::vector<size_t> colPerm(n);
    for (size_t i = 0; i < n; ++i) colPerm[i] = i;

    const double tolerance = std::numeric_limits<double>::epsilon() * static_cast<double>(n);
    for (size_t i = 0; i < n; ++i) {
        size_t pivotRow = i;
        size_t pivotCol = i;
        double pivotAbs = 0.0;
        for (size_t r = i; r < n; ++r) {
            for (size_t c = i; c < n; ++c) {
                if (std::abs(work[r][c]) > pivotAbs) {
                    pivotAbs = std::abs(work[r][c]);
                    pivotRow = r;
                    pivotCol = c;
                }
            }
        }
        if (pivotAbs <= tolerance) return std::nullopt;

        std::swap(work[i], work[pivotRow]);
        std::swap(inv[i], inv[pivotRow]);
        if (pivotCol != i) {
            for (size_t r = 0; r < n; ++r) std::swap(work[r][i], work[r][pivotCol]);
            std::swap(colPerm[i], colPerm[pivotCol]);
        }

        const double pivot = work[i][i];
        for (size_t j = 0; j < n; ++j) {
            work[i][j] /= pivot;
            inv[i][j] /= pivot;
        }
        for (size_t r = 0; r < n; ++r) {
            if (r == i) continue;
            const double factor = work[r][i];
            if (factor == 0.0) continue;
            for (size_t j = 0; j < n; ++j) {
                work[r][j] -= factor * work[i][j];
                inv[r][j] -= factor * inv[i][j];
            }
        }
    }

    // Undo the column swaps: they permute the rows of the inverse.
    Matrix result(n);
    for (size_t i = 0; i < n; ++i) result[colPerm[i]] = std::move(inv[i]);
    return result;
}

Matrix correlationMatrix(const std::vector<const std::vector<double>*>& columns) {
    const size_t n = columns.size();
    Matrix corr(n, std::vector<double>(n, 0.0));

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < n; ++i) {
        corr[i][i] = 1.0;
        for (size_t j = i + 1; j < n; ++j) {
            const double r = Statistics::pearson(*columns[i], *columns[j]).value_or(0.0);
            corr[i][j] = r;
            corr[j][i] = r;
        }
    }
    return corr;
}

/**
 * @brief VIF of each active column: diagonal of the inverse correlation matrix.
 */
std::vector<double> varianceInflation(const Matrix& corr, const std::vector<size_t>& active) {
    const size_t n = active.size();
    Matrix sub(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) sub[i][j] = corr[active[i]][active[j]];
        sub[i][i] += kRidge;
    }

    std::vector<double> vif(n, std::numeric_limits<double>::infinity());
    if (auto inv = invert(std::move(sub))) {
        for (size_t i = 0; i < n; ++i) vif[i] = (*inv)[i][i];
    }
    return vif;
}
} // namespace

std::vector<Suggestion> RemoveCollinearColumns::evaluate() const {
    const NumericProjection projection = filterNumericTypes();
    if (projection.frame.rowCount() < 2) return {};

    std::vector<std::string> names;
    std::vector<const std::vector<double>*> columns;
    for (const auto& name : projection.numericColumns) {
        const auto& values = std::get<std::vector<double>>(projection.frame.column(name).values);
        if (!(Statistics::calculateStats(values).variance > 0.0)) continue;
        names.push_back(name);
        columns.push_back(&values);
    }
    if (columns.size() < 2) return {};

    const Matrix corr = correlationMatrix(columns);
    std::vector<size_t> active(columns.size());
    for (size_t i = 0; i < active.size(); ++i) active[i] = i;

    std::vector<uint8_t> removed(columns.size(), static_cast<uint8_t>(0));
    while (active.size() >= 2) {
        const std::vector<double> vif = varianceInflation(corr, active);
        const auto worst = std::max_element(vif.begin(), vif.end());
        if (!(*worst > tuning_.collinearityVifThreshold)) break;

        const size_t pos = static_cast<size_t>(std::distance(vif.begin(), worst));
        removed[active[pos]] = static_cast<uint8_t>(1);
        active.erase(active.begin() + static_cast<std::ptrdiff_t>(pos));
    }

    std::vector<std::string> collinear;
    for (size_t i = 0; i < names.size(); ++i) {
        if (removed[i]) collinear.push_back(names[i]);
    }
    if (collinear.empty()) return {};

    return {buildTransformerActionSuggestion(
        "Remove collinear columns",
        "The following columns are strongly correlated with other columns in the dataset: " +
            CommonUtils::join(collinear, ", ") +
            ". Removing these columns may increase data quality by removing redundant data.",
        "remove",
        collinear,
        std::nullopt,
        {},
        buildActionVariables(collinear))};
}
