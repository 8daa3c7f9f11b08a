#include "SieveConfig.h"

#include "CommonUtils.h"
#include "SieveExceptions.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Sieve::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Sieve::SieveException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Sieve::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Sieve::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

size_t parseSizeStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') throw Sieve::ConfigurationException("Value for " + key + " must be >= 0");
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Sieve::ConfigurationException("Value for " + key + " exceeds size range");
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Sieve::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Sieve::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    while (!out.empty() && out[0] == '-') out.erase(0, 1);
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

void assignKeyValue(SieveConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        if (value.size() != 1) throw Sieve::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "api_key") {
        if (!value.empty()) config.apiKey = value;
        return;
    }
    if (key == "version") {
        config.version = parseSizeStrict(value, key);
        return;
    }
    if (key == "sync_timeout_ms") {
        config.syncTimeoutMs = parseIntStrict(value, key, 1);
        return;
    }
    if (key == "outlier_min_rows") {
        config.tuning.outlierMinRows = parseSizeStrict(value, key);
        return;
    }

    static const std::unordered_map<std::string, std::string SieveConfig::*> stringFields = {
        {"data", &SieveConfig::dataPath},
        {"metadata", &SieveConfig::metadataPath},
        {"id", &SieveConfig::pipelineId},
        {"pipeline", &SieveConfig::pipelineId},
        {"pipeline_file", &SieveConfig::pipelineFile},
        {"remote_id", &SieveConfig::remoteId},
        {"actions", &SieveConfig::actionsPath},
        {"output", &SieveConfig::outputPath},
        {"store_dir", &SieveConfig::storeDir},
        {"sync_url", &SieveConfig::syncUrl}
    };
    static const std::unordered_map<std::string, bool SieveConfig::*> boolFields = {
        {"verbose", &SieveConfig::verbose},
        {"curated", &SieveConfig::curated}
    };
    static const std::unordered_map<std::string, double RuleTuning::*> tuningFields = {
        {"empty_rate_threshold", &RuleTuning::emptyRateThreshold},
        {"outlier_z_threshold", &RuleTuning::outlierZThreshold},
        {"collinearity_vif_threshold", &RuleTuning::collinearityVifThreshold}
    };

    if (key == "output_format" || key == "format") {
        config.outputFormat = CommonUtils::toLower(value);
        return;
    }
    if (auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = tuningFields.find(key); it != tuningFields.end()) {
        config.tuning.*(it->second) = parseDoubleStrict(value, key, 0.0);
        return;
    }
    throw Sieve::ConfigurationException("Unknown option '" + key + "'");
}

bool isFlagOnly(const std::string& key) {
    return key == "verbose" || key == "curated" || key == "help";
}

const std::vector<std::string>& knownCommands() {
    static const std::vector<std::string> commands = {
        "evaluate", "transform", "pipeline-put", "pipeline-get", "pipeline-list", "sync-all"
    };
    return commands;
}
} // namespace

SieveConfig SieveConfig::fromArgs(int argc, char* argv[]) {
    SieveConfig config;
    if (argc < 2) {
        throw Sieve::ConfigurationException(
            "Usage: sieve <evaluate|transform|pipeline-put|pipeline-get|pipeline-list|sync-all> [--config path] "
            "[--data csv] [--metadata json] [--pipeline id] [--pipeline-file json] [--remote-id id] [--actions json] [--id id] "
            "[--version N] [--curated] [--output path] [--format csv|parquet] [--store-dir dir] [--delimiter ,] "
            "[--api-key key] [--sync-url url] [--sync-timeout-ms N] [--empty-rate-threshold 0..1] "
            "[--outlier-z-threshold N] [--collinearity-vif-threshold N] [--outlier-min-rows N] [--verbose]");
    }

    const std::string first = argv[1];
    if (first == "--help" || first == "-h" || first == "help") {
        config.showHelp = true;
        return config;
    }

    std::vector<std::pair<std::string, std::string>> cliValues;
    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) throw Sieve::ConfigurationException("Unexpected argument '" + arg + "'");
        const std::string key = normalizeConfigKey(arg);
        if (key == "help") {
            config.showHelp = true;
            continue;
        }
        if (isFlagOnly(key)) {
            cliValues.emplace_back(key, "true");
            continue;
        }
        if (i + 1 >= argc) throw Sieve::ConfigurationException(arg + " expects a value");
        const std::string value = argv[++i];
        if (key == "config") configPath = value;
        else cliValues.emplace_back(key, value);
    }

    if (!configPath.empty()) config = fromFile(configPath, config);
    config.command = first;
    for (const auto& kv : cliValues) assignKeyValue(config, kv.first, kv.second);

    if (!config.apiKey) {
        if (const char* envKey = std::getenv("SIEVE_API_KEY"); envKey != nullptr && envKey[0] != '\0') {
            config.apiKey = std::string(envKey);
        }
    }

    if (!config.showHelp) config.validate();
    return config;
}

SieveConfig SieveConfig::fromFile(const std::string& configPath, const SieveConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Sieve::ConfigurationException("Could not open config file: " + configPath);

    SieveConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Sieve::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                ": expected 'key: value'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Sieve::SieveException& ex) {
            throw Sieve::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void SieveConfig::validate() const {
    const auto& commands = knownCommands();
    if (std::find(commands.begin(), commands.end(), command) == commands.end()) {
        throw Sieve::ConfigurationException("Unknown command '" + command + "'");
    }
    if (outputFormat != "csv" && outputFormat != "parquet") {
        throw Sieve::ConfigurationException("output_format must be csv or parquet");
    }
    if (storeDir.empty()) throw Sieve::ConfigurationException("store_dir must not be empty");
    if (tuning.emptyRateThreshold <= 0.0 || tuning.emptyRateThreshold > 1.0) {
        throw Sieve::ConfigurationException("empty_rate_threshold must be within (0,1]");
    }
    if (tuning.outlierZThreshold <= 0.0) throw Sieve::ConfigurationException("outlier_z_threshold must be > 0");
    if (tuning.collinearityVifThreshold <= 1.0) {
        throw Sieve::ConfigurationException("collinearity_vif_threshold must be > 1");
    }
    if (tuning.outlierMinRows < 2) throw Sieve::ConfigurationException("outlier_min_rows must be >= 2");
    if (syncTimeoutMs < 1) throw Sieve::ConfigurationException("sync_timeout_ms must be >= 1");

    if (command == "evaluate") {
        if (dataPath.empty() || metadataPath.empty()) {
            throw Sieve::ConfigurationException("evaluate requires --data and --metadata");
        }
    } else if (command == "transform") {
        if (dataPath.empty()) throw Sieve::ConfigurationException("transform requires --data");
        const int sources = (pipelineId.empty() ? 0 : 1) + (pipelineFile.empty() ? 0 : 1) + (remoteId.empty() ? 0 : 1);
        if (sources != 1) {
            throw Sieve::ConfigurationException(
                "transform requires exactly one of --pipeline, --pipeline-file or --remote-id");
        }
        if (!remoteId.empty() && (syncUrl.empty() || !apiKey)) {
            throw Sieve::ConfigurationException("transform --remote-id requires --sync-url and an api key");
        }
    } else if (command == "pipeline-put") {
        if (pipelineId.empty() || actionsPath.empty()) {
            throw Sieve::ConfigurationException("pipeline-put requires --id and --actions");
        }
    } else if (command == "pipeline-get") {
        if (pipelineId.empty()) throw Sieve::ConfigurationException("pipeline-get requires --id");
    }
}
