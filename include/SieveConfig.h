#pragma once

#include "CleaningRules.h"

#include <cstddef>
#include <optional>
#include <string>

struct SieveConfig {
    std::string command;
    bool showHelp = false;

    std::string dataPath;
    std::string metadataPath;
    std::string pipelineId;
    std::string pipelineFile;
    std::string remoteId;
    std::string actionsPath;
    std::optional<size_t> version;
    bool curated = false;

    std::string outputPath;
    std::string outputFormat = "csv";   // csv|parquet
    std::string storeDir = "sieve_pipelines";
    char delimiter = ',';
    bool verbose = false;

    std::optional<std::string> apiKey;
    std::string syncUrl;
    int syncTimeoutMs = 5000;

    RuleTuning tuning;

    /**
     * @brief Builds config from `sieve <command> [options]` plus optional --config file.
     * @post Returns a validated config; CLI flags override file values and
     *       SIEVE_API_KEY fills api_key when neither sets it.
     * @throws Sieve::ConfigurationException on invalid arguments or values.
     */
    static SieveConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (# comments, optional quotes) on top of `base`.
     * @throws Sieve::ConfigurationException on parse/validation failures.
     */
    static SieveConfig fromFile(const std::string& configPath, const SieveConfig& base);

    /**
     * @throws Sieve::ConfigurationException on invalid values or missing command options.
     */
    void validate() const;
};
