#include "PipelineStore.h"

#include "JsonValue.h"
#include "SieveExceptions.h"
#include "WireFormat.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

namespace {
constexpr const char* kPipelineFile = "pipeline.json";
constexpr const char* kVersionsDir = "versions";

void validateId(const std::string& id) {
    const bool safe = !id.empty() && id != "." && id != ".." &&
                      std::all_of(id.begin(), id.end(), [](unsigned char c) {
                          return std::isalnum(c) != 0 || c == '_' || c == '-' || c == '.';
                      });
    if (!safe) throw Sieve::ConfigurationException("Invalid pipeline id '" + id + "'");
}

void writeAtomically(const fs::path& target, const std::string& content) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw Sieve::IOException("Cannot create directory: " + ec.message(), target.parent_path().string());

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) throw Sieve::IOException("Cannot open '" + temp.string() + "' for writing", temp.string());
        out << content << '\n';
        if (!out.good()) throw Sieve::IOException("Failed while writing '" + temp.string() + "'", temp.string());
    }
    fs::rename(temp, target, ec);
    if (ec) throw Sieve::IOException("Cannot move pipeline into place: " + ec.message(), target.string());
}

std::string serialize(const std::vector<Action>& actions) {
    JsonValue doc = JsonValue::object();
    doc.set("actions", WireFormat::toJson(actions));
    doc.set("version", JsonValue::number(static_cast<double>(actions.size())));
    return doc.dump(2);
}
} // namespace

PipelineStore::PipelineStore(fs::path root) : root_(std::move(root)) {}

fs::path PipelineStore::pipelineDir(const std::string& id) const {
    validateId(id);
    return root_ / id;
}

bool PipelineStore::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fs::is_regular_file(pipelineDir(id) / kPipelineFile);
}

std::vector<Action> PipelineStore::loadUnlocked(const std::string& id) const {
    const fs::path file = pipelineDir(id) / kPipelineFile;
    if (!fs::is_regular_file(file)) throw Sieve::IOException("No pipeline stored under id '" + id + "'", file.string());
    return WireFormat::actionsFromJson(loadJsonFile(file.string()));
}

std::vector<Action> PipelineStore::load(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadUnlocked(id);
}

std::vector<Action> PipelineStore::loadPath(const std::string& path) {
    return WireFormat::actionsFromJson(loadJsonFile(path));
}

size_t PipelineStore::replace(const std::string& id, const std::vector<Action>& actions) {
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path dir = pipelineDir(id);

    std::vector<Action> previous;
    if (fs::is_regular_file(dir / kPipelineFile)) previous = loadUnlocked(id);
    const size_t prevVersion = previous.size();

    writeAtomically(dir / kVersionsDir / (std::to_string(prevVersion) + ".json"), serialize(previous));
    writeAtomically(dir / kPipelineFile, serialize(actions));
    return prevVersion;
}

std::vector<Action> PipelineStore::loadVersion(const std::string& id, size_t version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path file = pipelineDir(id) / kVersionsDir / (std::to_string(version) + ".json");
    if (!fs::is_regular_file(file)) {
        throw Sieve::IOException("Pipeline '" + id + "' has no version " + std::to_string(version), file.string());
    }
    return WireFormat::actionsFromJson(loadJsonFile(file.string()));
}

std::vector<std::string> PipelineStore::listIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return ids;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (entry.is_directory() && fs::is_regular_file(entry.path() / kPipelineFile)) {
            ids.push_back(entry.path().filename().string());
        }
    }
    if (ec) throw Sieve::IOException("Cannot list pipelines: " + ec.message(), root_.string());
    std::sort(ids.begin(), ids.end());
    return ids;
}
