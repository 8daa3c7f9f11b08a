#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    bool isNumeric() const noexcept { return std::holds_alternative<std::vector<double>>(values); }
    size_t size() const noexcept { return missing.size(); }
    bool isMissing(size_t row) const { return missing[row] != 0; }

    /**
     * @brief Cell rendered as text; empty for a missing cell.
     * @details Numeric cells use the shortest round-tripping representation.
     */
    std::string cellText(size_t row) const;

    bool operator==(const TypedColumn& other) const;
    bool operator!=(const TypedColumn& other) const { return !(*this == other); }
};

TypedColumn makeNumericColumn(std::string name, const std::vector<std::optional<double>>& cells);
TypedColumn makeTextColumn(std::string name, const std::vector<std::optional<std::string>>& cells);

/**
 * @brief Column-major table snapshot with per-cell missing masks.
 * @details Value type: copying a DataFrame copies every column, so callers can
 *          hand out snapshots and keep their original untouched.
 */
class DataFrame {
public:
    DataFrame() = default;

    /**
     * @throws Sieve::DatasetException on duplicate names or misaligned columns.
     */
    explicit DataFrame(std::vector<TypedColumn> columns);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumnIndex(name) >= 0; }

    const TypedColumn& column(const std::string& name) const;
    TypedColumn& column(const std::string& name);

    void addColumn(TypedColumn column);
    void dropColumn(const std::string& name);
    void renameColumn(const std::string& from, const std::string& to);

    /**
     * @brief Removes rows where keepMask is false across all columns.
     * @throws Sieve::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    /**
     * @brief Text key identifying the row content of the given columns.
     */
    std::string rowKey(size_t row, const std::vector<size_t>& columnIndices) const;

    size_t missingCellCount() const;

    bool operator==(const DataFrame& other) const;
    bool operator!=(const DataFrame& other) const { return !(*this == other); }

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
