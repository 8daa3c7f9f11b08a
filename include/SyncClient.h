#pragma once

#include "Suggestion.h"

#include <string>
#include <vector>

namespace httplib {
class Client;
}

struct SyncResult {
    bool ok = false;
    std::string detail;
};

/**
 * @brief Pushes a stored action list to a remote service.
 * @details Implementations report failure through SyncResult; callers treat
 *          a failed sync as non-fatal.
 */
class SyncClient {
public:
    virtual ~SyncClient() = default;

    virtual SyncResult sync(const std::string& credential,
                            const std::string& pipelineId,
                            const std::vector<Action>& actions) = 0;

    /**
     * @brief Downloads the action list the remote service stores under `remoteId`.
     * @throws Sieve::IOException when the remote cannot be reached or refuses.
     * @throws Sieve::ConfigurationException on a malformed action list.
     */
    virtual std::vector<Action> fetch(const std::string& credential, const std::string& remoteId) = 0;
};

/**
 * @brief JSON over cpp-httplib.
 * @details sync() POSTs {"api_key", "pipeline_id", "actions"} to the URL;
 *          fetch() POSTs {"api_key", "pipeline_id"} to "<url>/fetch" and reads
 *          back an action list.
 */
class HttpSyncClient : public SyncClient {
public:
    /**
     * @param url Endpoint such as "http://host:port/api/pipelines/sync".
     * @throws Sieve::ConfigurationException when `url` has no scheme or host.
     */
    explicit HttpSyncClient(const std::string& url, int timeoutMs = 5000);

    SyncResult sync(const std::string& credential,
                    const std::string& pipelineId,
                    const std::vector<Action>& actions) override;

    std::vector<Action> fetch(const std::string& credential, const std::string& remoteId) override;

private:
    void configure(httplib::Client& client) const;

    std::string origin_;
    std::string path_;
    int timeoutMs_;
};
