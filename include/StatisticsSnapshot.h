#pragma once

#include <map>
#include <string>
#include <variant>

using StatValue = std::variant<double, bool>;

/**
 * @brief Precomputed summary values handed to the cleaning rules.
 * @details Per-column keys are "<column>/<metric>", global keys are bare
 *          ("count"). Sieve never computes these values itself.
 */
class StatisticsSnapshot {
public:
    StatisticsSnapshot() = default;
    explicit StatisticsSnapshot(std::map<std::string, StatValue> values) : values_(std::move(values)) {}

    static std::string columnKey(const std::string& column, const std::string& metric) {
        return column + "/" + metric;
    }

    void set(const std::string& key, double value) { values_[key] = value; }
    void setFlag(const std::string& key, bool value) { values_[key] = value; }

    bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

    /**
     * @brief Numeric value of `key`; booleans read as 0/1.
     * @throws Sieve::DataContractException naming the key when it was not supplied.
     */
    double number(const std::string& key) const;
    double columnNumber(const std::string& column, const std::string& metric) const {
        return number(columnKey(column, metric));
    }

    /**
     * @throws Sieve::DataContractException naming the key when it was not supplied.
     */
    bool flag(const std::string& key) const;

    const std::map<std::string, StatValue>& values() const noexcept { return values_; }
    size_t size() const noexcept { return values_.size(); }

private:
    std::map<std::string, StatValue> values_;
};
