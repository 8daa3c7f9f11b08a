#include "PipelineService.h"
#include "SieveExceptions.h"

#include "common/TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace SieveTests;

namespace {
class RecordingSyncClient : public SyncClient {
public:
    explicit RecordingSyncClient(bool succeed, bool throwInstead = false)
        : succeed_(succeed), throwInstead_(throwInstead) {}

    SyncResult sync(const std::string& credential,
                    const std::string& pipelineId,
                    const std::vector<Action>& actions) override {
        calls.push_back({credential, pipelineId, actions.size()});
        if (throwInstead_) throw std::runtime_error("connection reset");
        SyncResult result;
        result.ok = succeed_;
        result.detail = succeed_ ? "status=200" : "status=503";
        return result;
    }

    std::vector<Action> fetch(const std::string& credential, const std::string& remoteId) override {
        fetches.push_back({credential, remoteId, remoteActions.size()});
        if (throwInstead_) throw Sieve::IOException("remote refused", remoteId);
        return remoteActions;
    }

    struct Call {
        std::string credential;
        std::string pipelineId;
        size_t actionCount;
    };
    std::vector<Call> calls;
    std::vector<Call> fetches;
    std::vector<Action> remoteActions;

private:
    bool succeed_;
    bool throwInstead_;
};

std::vector<Action> oneRemoval() {
    return {buildTransformerActionSuggestion("", "", "remove", {"city"})};
}
} // namespace

TEST_CASE("Update titles and stores the list, then syncs with the credential", "[pipeline][service]") {
    TempDir dir("sieve-service");
    PipelineStore store(dir.path());
    PipelineService service(store);
    RecordingSyncClient client(true);

    RequestContext context;
    context.apiKey = "secret";
    context.syncClient = &client;

    const PipelineUpdate update = service.updatePipeline(context, "p1", oneRemoval());
    REQUIRE(update.prevVersion == 0);
    REQUIRE(update.synced);
    REQUIRE(update.actions.front().title == "Remove column city");
    REQUIRE(store.load("p1") == update.actions);

    REQUIRE(client.calls.size() == 1);
    REQUIRE(client.calls[0].credential == "secret");
    REQUIRE(client.calls[0].pipelineId == "p1");
    REQUIRE(client.calls[0].actionCount == 1);
}

TEST_CASE("Sync failure never undoes the stored replacement", "[pipeline][service]") {
    TempDir dir("sieve-service-fail");
    PipelineStore store(dir.path());
    PipelineService service(store);

    RecordingSyncClient rejecting(false);
    RecordingSyncClient throwing(false, true);
    RequestContext context;
    context.apiKey = "secret";

    context.syncClient = &rejecting;
    const PipelineUpdate first = service.updatePipeline(context, "p1", oneRemoval());
    REQUIRE_FALSE(first.synced);

    context.syncClient = &throwing;
    const PipelineUpdate second = service.updatePipeline(context, "p1", {});
    REQUIRE_FALSE(second.synced);
    REQUIRE(second.prevVersion == 1);
    REQUIRE(store.load("p1").empty());
}

TEST_CASE("No credential means no sync", "[pipeline][service]") {
    TempDir dir("sieve-service-nokey");
    PipelineStore store(dir.path());
    PipelineService service(store);
    RecordingSyncClient client(true);

    RequestContext context;
    context.syncClient = &client;
    REQUIRE_FALSE(service.updatePipeline(context, "p1", oneRemoval()).synced);
    REQUIRE(service.syncAll(context) == 0);
    REQUIRE(client.calls.empty());
}

TEST_CASE("syncAll pushes every stored pipeline", "[pipeline][service]") {
    TempDir dir("sieve-service-all");
    PipelineStore store(dir.path());
    store.replace("a", oneRemoval());
    store.replace("b", {});

    PipelineService service(store);
    RecordingSyncClient client(true);
    RequestContext context;
    context.apiKey = "secret";
    context.syncClient = &client;

    REQUIRE(service.syncAll(context) == 2);
    REQUIRE(client.calls.size() == 2);
    REQUIRE(client.calls[0].pipelineId == "a");
    REQUIRE(client.calls[1].pipelineId == "b");
}

TEST_CASE("Stored pipelines replay through the service", "[pipeline][service]") {
    TempDir dir("sieve-service-replay");
    PipelineStore store(dir.path());
    store.replace("p1", oneRemoval());

    PipelineService service(store);
    const DataFrame data = ageCityFrame();
    const DataFrame result = service.transformWithPipeline(RequestContext{}, data, "p1", true);
    REQUIRE(result.columnNames() == std::vector<std::string>{"age"});
    REQUIRE(data.colCount() == 2);
}

TEST_CASE("A corrupt stored pipeline does not stop the others from syncing", "[pipeline][service]") {
    TempDir dir("sieve-service-corrupt");
    PipelineStore store(dir.path());
    store.replace("a", oneRemoval());
    store.replace("b", oneRemoval());
    store.replace("c", {});
    {
        std::ofstream broken(dir.path() / "b" / "pipeline.json", std::ios::trunc);
        broken << "{ not json";
    }

    PipelineService service(store);
    RecordingSyncClient client(true);
    RequestContext context;
    context.apiKey = "secret";
    context.syncClient = &client;

    StreamCapture warnings(std::cerr);
    REQUIRE(service.syncAll(context) == 2);
    REQUIRE(client.calls.size() == 2);
    REQUIRE(client.calls[0].pipelineId == "a");
    REQUIRE(client.calls[1].pipelineId == "c");
    REQUIRE(warnings.text().find("[Sieve Warning] Skipping sync of pipeline 'b'") != std::string::npos);
}

TEST_CASE("Remote pipelines are fetched with the request credential and replayed", "[pipeline][service]") {
    TempDir dir("sieve-service-remote");
    PipelineStore store(dir.path());
    PipelineService service(store);
    RecordingSyncClient client(true);
    client.remoteActions = oneRemoval();

    RequestContext context;
    context.apiKey = "remote-key";
    context.syncClient = &client;

    const DataFrame data = ageCityFrame();
    const DataFrame result = service.transformWithRemote(context, data, "rp-7", true);
    REQUIRE(result.columnNames() == std::vector<std::string>{"age"});
    REQUIRE(client.fetches.size() == 1);
    REQUIRE(client.fetches[0].credential == "remote-key");
    REQUIRE(client.fetches[0].pipelineId == "rp-7");
    REQUIRE(store.listIds().empty());
}

TEST_CASE("Remote loading needs a credential and surfaces remote failures", "[pipeline][service][errors]") {
    TempDir dir("sieve-service-remote-errors");
    PipelineStore store(dir.path());
    PipelineService service(store);

    RecordingSyncClient client(true);
    RequestContext noKey;
    noKey.syncClient = &client;
    REQUIRE_THROWS_AS(service.fetchRemote(noKey, "rp-7"), Sieve::ConfigurationException);
    REQUIRE(client.fetches.empty());

    RecordingSyncClient refusing(false, true);
    RequestContext context;
    context.apiKey = "secret";
    context.syncClient = &refusing;
    try {
        service.transformWithRemote(context, ageCityFrame(), "rp-7", true);
        FAIL("expected an I/O error");
    } catch (const Sieve::IOException& ex) {
        REQUIRE(ex.identifier() == "rp-7");
    }
}
