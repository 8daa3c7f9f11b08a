#include "NumericProjection.h"

#include "CommonUtils.h"
#include "SieveExceptions.h"

#include <cmath>
#include <cstdlib>

namespace {
TypedColumn castToDouble(const TypedColumn& col) {
    if (col.isNumeric()) return col;

    const auto& text = std::get<std::vector<std::string>>(col.values);
    std::vector<double> values(text.size(), 0.0);
    for (size_t r = 0; r < text.size(); ++r) {
        if (col.missing[r]) continue;
        const std::string s = CommonUtils::trim(text[r]);
        char* end = nullptr;
        values[r] = std::strtod(s.c_str(), &end);
        if (s.empty() || end != s.c_str() + s.size()) {
            throw Sieve::DataContractException(col.name, "Value '" + text[r] + "' in numeric column '" + col.name +
                                                             "' cannot be cast to a number");
        }
    }

    TypedColumn out;
    out.name = col.name;
    out.values = std::move(values);
    out.missing = col.missing;
    return out;
}
} // namespace

NumericProjection projectNumeric(const DataFrame& data, const ColumnTypeMap& columnTypes) {
    NumericProjection result;
    for (const auto& col : data.columns()) {
        if (!isNumericType(requireColumnType(columnTypes, col.name))) continue;
        result.frame.addColumn(castToDouble(col));
        result.numericColumns.push_back(col.name);
    }

    const size_t rows = result.frame.rowCount();
    MissingMask keep(rows, static_cast<uint8_t>(1));
    for (const auto& col : result.frame.columns()) {
        const auto& values = std::get<std::vector<double>>(col.values);
        for (size_t r = 0; r < rows; ++r) {
            if (col.missing[r] || !std::isfinite(values[r])) keep[r] = static_cast<uint8_t>(0);
        }
    }
    result.frame.removeRows(keep);
    return result;
}
