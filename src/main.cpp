#include "ActionPipeline.h"
#include "DataFrameIO.h"
#include "JsonValue.h"
#include "PipelineService.h"
#include "PipelineStore.h"
#include "RuleEngine.h"
#include "SieveConfig.h"
#include "SieveExceptions.h"
#include "SyncClient.h"
#include "WireFormat.h"

#include <iostream>
#include <memory>
#include <string>

namespace {
void printUsage() {
    std::cout << "Usage: sieve <command> [options]\n"
              << "Commands:\n"
              << "  evaluate --data <csv> --metadata <json>        Print cleaning suggestions as JSON\n"
              << "  transform --data <csv> (--pipeline <id> | --pipeline-file <json> | --remote-id <id>)\n"
              << "            [--curated] [--output <path>] [--format csv|parquet]\n"
              << "                                                 Replay a pipeline over a dataset\n"
              << "  pipeline-put --id <id> --actions <json>        Replace the stored action list\n"
              << "  pipeline-get --id <id> [--version <n>]         Print a stored action list\n"
              << "  pipeline-list                                  List stored pipeline ids\n"
              << "  sync-all                                       Push every stored pipeline to --sync-url\n"
              << "Options:\n"
              << "  --config <file>                  key: value file, overridden by flags\n"
              << "  --store-dir <dir>                Pipeline store root (default: sieve_pipelines)\n"
              << "  --delimiter <char>               CSV delimiter (default: ,)\n"
              << "  --api-key <key>                  Sync credential (default: $SIEVE_API_KEY)\n"
              << "  --sync-url <url>                 Remote sync endpoint\n"
              << "  --sync-timeout-ms <n>            Sync timeout (default: 5000)\n"
              << "  --empty-rate-threshold <0..1>    Null rate for column removal (default: 0.8)\n"
              << "  --outlier-z-threshold <n>        Outlier z-score (default: 3)\n"
              << "  --collinearity-vif-threshold <n> VIF limit (default: 5)\n"
              << "  --outlier-min-rows <n>           Minimum rows for outlier search (default: 3)\n"
              << "  --verbose                        Enable detailed logs\n";
}

void printError(const std::string& kind,
                const std::string& identifier,
                const std::string& message,
                const std::string& actionType = "") {
    JsonValue detail = JsonValue::object();
    if (!actionType.empty()) detail.set("action_type", JsonValue::string(actionType));
    detail.set("kind", JsonValue::string(kind));
    detail.set("identifier", JsonValue::string(identifier));
    detail.set("message", JsonValue::string(message));
    JsonValue doc = JsonValue::object();
    doc.set("error", std::move(detail));
    std::cerr << doc.dump() << "\n";
}

int runEvaluate(const SieveConfig& config) {
    const DataFrame data = DataFrameIO::loadCsv(config.dataPath, config.delimiter);
    const EvaluationMetadata metadata = WireFormat::metadataFromJson(loadJsonFile(config.metadataPath));
    if (config.verbose) {
        std::clog << "[Sieve] Loaded " << data.rowCount() << " rows x " << data.colCount() << " cols from "
                  << config.dataPath << "\n";
    }

    RuleEngine engine(defaultRuleRegistry(), config.tuning);
    engine.setVerbose(config.verbose);
    const std::vector<Suggestion> suggestions = engine.evaluate(data, metadata.columnTypes, metadata.statistics);
    std::cout << WireFormat::toJson(suggestions).dump(2) << "\n";
    return 0;
}

int runTransform(const SieveConfig& config, const RequestContext& context, PipelineStore& store) {
    const DataFrame data = DataFrameIO::loadCsv(config.dataPath, config.delimiter);
    const bool autoApply = !config.curated;

    DataFrame result;
    if (!config.pipelineFile.empty()) {
        ActionPipeline pipeline(PipelineStore::loadPath(config.pipelineFile));
        pipeline.setVerbose(config.verbose);
        result = pipeline.transform(data, autoApply);
    } else if (!config.remoteId.empty()) {
        PipelineService service(store);
        result = service.transformWithRemote(context, data, config.remoteId, autoApply);
    } else {
        PipelineService service(store);
        result = service.transformWithPipeline(context, data, config.pipelineId, autoApply);
    }

    if (config.outputPath.empty()) {
        DataFrameIO::writeCsv(result, std::cout, config.delimiter);
        return 0;
    }
    if (config.outputFormat == "parquet") {
        DataFrameIO::saveParquet(result, config.outputPath);
    } else {
        DataFrameIO::saveCsv(result, config.outputPath, config.delimiter);
    }
    if (config.verbose) {
        std::clog << "[Sieve] Wrote " << result.rowCount() << " rows x " << result.colCount() << " cols to "
                  << config.outputPath << "\n";
    }
    return 0;
}

int runPipelinePut(const SieveConfig& config, const RequestContext& context, PipelineStore& store) {
    PipelineService service(store);
    const PipelineUpdate update =
        service.updatePipeline(context, config.pipelineId, PipelineStore::loadPath(config.actionsPath));

    JsonValue out = JsonValue::object();
    out.set("id", JsonValue::string(update.id));
    out.set("prev_version", JsonValue::number(static_cast<double>(update.prevVersion)));
    out.set("version", JsonValue::number(static_cast<double>(update.actions.size())));
    out.set("actions", WireFormat::toJson(update.actions));
    std::cout << out.dump(2) << "\n";
    return 0;
}

int runPipelineGet(const SieveConfig& config, const PipelineStore& store) {
    const std::vector<Action> actions =
        config.version ? store.loadVersion(config.pipelineId, *config.version) : store.load(config.pipelineId);
    JsonValue out = ActionPipeline(actions).toJson();
    out.set("id", JsonValue::string(config.pipelineId));
    std::cout << out.dump(2) << "\n";
    return 0;
}

int runPipelineList(const PipelineStore& store) {
    std::vector<JsonValue> ids;
    for (const auto& id : store.listIds()) ids.push_back(JsonValue::string(id));
    std::cout << JsonValue::array(std::move(ids)).dump(2) << "\n";
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    try {
        const SieveConfig config = SieveConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            printUsage();
            return 0;
        }

        std::unique_ptr<SyncClient> syncClient;
        if (!config.syncUrl.empty()) syncClient = std::make_unique<HttpSyncClient>(config.syncUrl, config.syncTimeoutMs);

        RequestContext context;
        context.apiKey = config.apiKey;
        context.syncClient = syncClient.get();
        context.verbose = config.verbose;

        PipelineStore store(config.storeDir);

        if (config.command == "evaluate") return runEvaluate(config);
        if (config.command == "transform") return runTransform(config, context, store);
        if (config.command == "pipeline-put") return runPipelinePut(config, context, store);
        if (config.command == "pipeline-get") return runPipelineGet(config, store);
        if (config.command == "pipeline-list") return runPipelineList(store);

        PipelineService service(store);
        const size_t synced = service.syncAll(context);
        std::cout << "[Sieve] Synced " << synced << " pipeline(s)\n";
        return 0;
    } catch (const Sieve::ResolutionException& e) {
        printError(Sieve::errorKindName(e.kind()), e.identifier(), e.what(), e.actionType());
        return 1;
    } catch (const Sieve::SieveException& e) {
        printError(Sieve::errorKindName(e.kind()), e.identifier(), e.what());
        return 1;
    } catch (const std::exception& e) {
        printError(Sieve::errorKindName(Sieve::ErrorKind::GENERIC), "", e.what());
        return 1;
    }
}
