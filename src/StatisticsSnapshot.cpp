#include "StatisticsSnapshot.h"

#include "SieveExceptions.h"

namespace {
const StatValue& requireValue(const std::map<std::string, StatValue>& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) {
        throw Sieve::DataContractException(key, "Statistic '" + key + "' was not supplied");
    }
    return it->second;
}
} // namespace

double StatisticsSnapshot::number(const std::string& key) const {
    const StatValue& v = requireValue(values_, key);
    if (const bool* b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    return std::get<double>(v);
}

bool StatisticsSnapshot::flag(const std::string& key) const {
    const StatValue& v = requireValue(values_, key);
    if (const double* d = std::get_if<double>(&v)) return *d != 0.0;
    return std::get<bool>(v);
}
