#pragma once

#include "Suggestion.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Directory-backed pipeline persistence with per-replacement history.
 * @details Layout: <root>/<id>/pipeline.json holds the current list and
 *          <root>/<id>/versions/<prev_version>.json the list each replacement
 *          superseded. Files are written to a temporary sibling and renamed.
 */
class PipelineStore {
public:
    explicit PipelineStore(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return root_; }

    bool exists(const std::string& id) const;

    /**
     * @throws Sieve::IOException when no pipeline is stored under `id`.
     */
    std::vector<Action> load(const std::string& id) const;

    /**
     * @brief Reads an action list from an arbitrary JSON file.
     * @throws Sieve::IOException when the file cannot be read.
     */
    static std::vector<Action> loadPath(const std::string& path);

    /**
     * @brief Stores `actions` as the current list of `id`.
     * @return Length of the list that was replaced (0 for a new pipeline).
     */
    size_t replace(const std::string& id, const std::vector<Action>& actions);

    /**
     * @throws Sieve::IOException when that version was never recorded.
     */
    std::vector<Action> loadVersion(const std::string& id, size_t version) const;

    std::vector<std::string> listIds() const;

private:
    std::filesystem::path pipelineDir(const std::string& id) const;
    std::vector<Action> loadUnlocked(const std::string& id) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};
