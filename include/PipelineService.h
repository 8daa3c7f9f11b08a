#pragma once

#include "DataFrame.h"
#include "PipelineStore.h"
#include "SyncClient.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Per-request collaborators; nothing here is process-wide.
 */
struct RequestContext {
    std::optional<std::string> apiKey;
    SyncClient* syncClient = nullptr;
    bool verbose = false;
};

struct PipelineUpdate {
    std::string id;
    size_t prevVersion = 0;
    std::vector<Action> actions;
    bool synced = false;
};

class PipelineService {
public:
    explicit PipelineService(PipelineStore& store) : store_(store) {}

    /**
     * @brief Titles, stores and then best-effort syncs a full replacement list.
     * @details A failed sync is logged and never undoes the stored replacement.
     */
    PipelineUpdate updatePipeline(const RequestContext& context, const std::string& id, std::vector<Action> actions);

    /**
     * @brief Pushes every stored pipeline to the remote service.
     * @details A stored pipeline that cannot be read is skipped with a warning.
     * @return Number of pipelines the remote accepted.
     */
    size_t syncAll(const RequestContext& context);

    /**
     * @brief Replays the stored list of `id` over a copy of `data`.
     */
    DataFrame transformWithPipeline(const RequestContext& context,
                                    const DataFrame& data,
                                    const std::string& id,
                                    bool autoApply) const;

    /**
     * @brief Downloads the action list stored remotely under `remoteId`.
     * @throws Sieve::ConfigurationException when the context has no credential or client.
     * @throws Sieve::IOException when the remote service fails.
     */
    std::vector<Action> fetchRemote(const RequestContext& context, const std::string& remoteId) const;

    DataFrame transformWithRemote(const RequestContext& context,
                                  const DataFrame& data,
                                  const std::string& remoteId,
                                  bool autoApply) const;

private:
    bool trySync(const RequestContext& context, const std::string& id, const std::vector<Action>& actions) const;

    PipelineStore& store_;
};
