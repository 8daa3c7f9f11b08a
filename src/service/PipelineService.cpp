#include "PipelineService.h"

#include "ActionPipeline.h"
#include "ActionTitles.h"
#include "SieveExceptions.h"

#include <exception>
#include <iostream>

bool PipelineService::trySync(const RequestContext& context,
                              const std::string& id,
                              const std::vector<Action>& actions) const {
    if (!context.apiKey || context.syncClient == nullptr) return false;

    SyncResult result;
    try {
        result = context.syncClient->sync(*context.apiKey, id, actions);
    } catch (const std::exception& ex) {
        result.ok = false;
        result.detail = ex.what();
    }

    if (!result.ok) {
        std::cerr << "[Sieve Warning] Sync of pipeline '" << id << "' failed: " << result.detail << "\n";
        return false;
    }
    if (context.verbose) std::clog << "[Sieve] Synced pipeline '" << id << "' (" << result.detail << ")\n";
    return true;
}

PipelineUpdate PipelineService::updatePipeline(const RequestContext& context,
                                               const std::string& id,
                                               std::vector<Action> actions) {
    PipelineUpdate update;
    update.id = id;
    update.actions = ActionTitles::fillTitles(std::move(actions));
    update.prevVersion = store_.replace(id, update.actions);
    if (context.verbose) {
        std::clog << "[Sieve] Pipeline '" << id << "' version " << update.prevVersion << " -> "
                  << update.actions.size() << "\n";
    }
    update.synced = trySync(context, id, update.actions);
    return update;
}

size_t PipelineService::syncAll(const RequestContext& context) {
    if (!context.apiKey || context.syncClient == nullptr) {
        std::cerr << "[Sieve Warning] No api_key or sync_url configured; nothing synced\n";
        return 0;
    }

    size_t synced = 0;
    for (const auto& id : store_.listIds()) {
        std::vector<Action> actions;
        try {
            actions = store_.load(id);
        } catch (const Sieve::SieveException& ex) {
            std::cerr << "[Sieve Warning] Skipping sync of pipeline '" << id << "': " << ex.what() << "\n";
            continue;
        }
        if (trySync(context, id, actions)) ++synced;
    }
    if (context.verbose) std::clog << "[Sieve] Synced " << synced << " pipeline(s)\n";
    return synced;
}

DataFrame PipelineService::transformWithPipeline(const RequestContext& context,
                                                 const DataFrame& data,
                                                 const std::string& id,
                                                 bool autoApply) const {
    ActionPipeline pipeline(store_.load(id));
    pipeline.setVerbose(context.verbose);
    return pipeline.transform(data, autoApply);
}

std::vector<Action> PipelineService::fetchRemote(const RequestContext& context, const std::string& remoteId) const {
    if (!context.apiKey || context.syncClient == nullptr) {
        throw Sieve::ConfigurationException("Loading remote pipeline '" + remoteId + "' requires api_key and sync_url");
    }
    if (context.verbose) std::clog << "[Sieve] Loading pipeline '" << remoteId << "' from the remote service\n";
    return context.syncClient->fetch(*context.apiKey, remoteId);
}

DataFrame PipelineService::transformWithRemote(const RequestContext& context,
                                               const DataFrame& data,
                                               const std::string& remoteId,
                                               bool autoApply) const {
    ActionPipeline pipeline(fetchRemote(context, remoteId));
    pipeline.setVerbose(context.verbose);
    return pipeline.transform(data, autoApply);
}
