#include "DataFrame.h"
#include "CommonUtils.h"
#include "SieveExceptions.h"

#include <algorithm>

namespace {
template <typename T>
std::vector<T> filterRows(const std::vector<T>& values, const MissingMask& keepMask, size_t kept) {
    std::vector<T> next;
    next.reserve(kept);
    for (size_t i = 0; i < values.size(); ++i) {
        if (keepMask[i]) next.push_back(values[i]);
    }
    return next;
}
} // namespace

std::string TypedColumn::cellText(size_t row) const {
    if (missing[row]) return "";
    if (isNumeric()) return CommonUtils::numberToString(std::get<std::vector<double>>(values)[row]);
    return std::get<std::vector<std::string>>(values)[row];
}

bool TypedColumn::operator==(const TypedColumn& other) const {
    if (name != other.name || isNumeric() != other.isNumeric() || missing != other.missing) return false;
    for (size_t r = 0; r < missing.size(); ++r) {
        if (missing[r]) continue;
        if (isNumeric()) {
            if (std::get<std::vector<double>>(values)[r] != std::get<std::vector<double>>(other.values)[r]) return false;
        } else if (std::get<std::vector<std::string>>(values)[r] != std::get<std::vector<std::string>>(other.values)[r]) {
            return false;
        }
    }
    return true;
}

TypedColumn makeNumericColumn(std::string name, const std::vector<std::optional<double>>& cells) {
    TypedColumn col;
    col.name = std::move(name);
    std::vector<double> values(cells.size(), 0.0);
    col.missing.assign(cells.size(), static_cast<uint8_t>(0));
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i]) values[i] = *cells[i];
        else col.missing[i] = static_cast<uint8_t>(1);
    }
    col.values = std::move(values);
    return col;
}

TypedColumn makeTextColumn(std::string name, const std::vector<std::optional<std::string>>& cells) {
    TypedColumn col;
    col.name = std::move(name);
    std::vector<std::string> values(cells.size());
    col.missing.assign(cells.size(), static_cast<uint8_t>(0));
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i]) values[i] = *cells[i];
        else col.missing[i] = static_cast<uint8_t>(1);
    }
    col.values = std::move(values);
    return col;
}

DataFrame::DataFrame(std::vector<TypedColumn> columns) {
    for (auto& col : columns) addColumn(std::move(col));
}

std::vector<std::string> DataFrame::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}

int DataFrame::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

const TypedColumn& DataFrame::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Sieve::DatasetException("Unknown column '" + name + "'");
    return columns_[static_cast<size_t>(idx)];
}

TypedColumn& DataFrame::column(const std::string& name) {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Sieve::DatasetException("Unknown column '" + name + "'");
    return columns_[static_cast<size_t>(idx)];
}

void DataFrame::addColumn(TypedColumn column) {
    const size_t valueCount = std::visit([](const auto& v) { return v.size(); }, column.values);
    if (valueCount != column.missing.size()) {
        throw Sieve::DatasetException("Column '" + column.name + "' has misaligned missing mask");
    }
    if (hasColumn(column.name)) {
        throw Sieve::DatasetException("Duplicate column '" + column.name + "'");
    }
    if (columns_.empty()) {
        rowCount_ = column.size();
    } else if (column.size() != rowCount_) {
        throw Sieve::DatasetException("Column '" + column.name + "' has " + std::to_string(column.size()) +
                                      " rows, expected " + std::to_string(rowCount_));
    }
    columns_.push_back(std::move(column));
}

void DataFrame::dropColumn(const std::string& name) {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Sieve::DatasetException("Unknown column '" + name + "'");
    columns_.erase(columns_.begin() + idx);
    if (columns_.empty()) rowCount_ = 0;
}

void DataFrame::renameColumn(const std::string& from, const std::string& to) {
    if (from == to) return;
    if (hasColumn(to)) throw Sieve::DatasetException("Duplicate column '" + to + "'");
    column(from).name = to;
}

void DataFrame::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Sieve::DatasetException("Row mask size mismatch");

    const size_t kept = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }));
    for (auto& col : columns_) {
        std::visit([&](auto& values) { values = filterRows(values, keepMask, kept); }, col.values);
        col.missing = filterRows(col.missing, keepMask, kept);
    }
    rowCount_ = kept;
}

std::string DataFrame::rowKey(size_t row, const std::vector<size_t>& columnIndices) const {
    std::string key;
    for (size_t idx : columnIndices) {
        const auto& col = columns_[idx];
        // Unit separator keeps "a","bc" distinct from "ab","c"; \x01 marks a null cell.
        key += col.missing[row] ? std::string("\x01") : col.cellText(row);
        key += '\x1f';
    }
    return key;
}

size_t DataFrame::missingCellCount() const {
    size_t total = 0;
    for (const auto& col : columns_) {
        total += static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(1)));
    }
    return total;
}

bool DataFrame::operator==(const DataFrame& other) const {
    return rowCount_ == other.rowCount_ && columns_ == other.columns_;
}
