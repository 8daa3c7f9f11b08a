#include "SyncClient.h"

#include "JsonValue.h"
#include "SieveExceptions.h"
#include "WireFormat.h"

#include <httplib.h>

HttpSyncClient::HttpSyncClient(const std::string& url, int timeoutMs) : timeoutMs_(timeoutMs) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd + 3 >= url.size()) {
        throw Sieve::ConfigurationException("sync_url must look like http://host[:port]/path, got '" + url + "'");
    }
    const size_t pathStart = url.find('/', schemeEnd + 3);
    origin_ = url.substr(0, pathStart);
    path_ = (pathStart == std::string::npos) ? "/" : url.substr(pathStart);
}

void HttpSyncClient::configure(httplib::Client& client) const {
    const time_t seconds = static_cast<time_t>(timeoutMs_ / 1000);
    const time_t micros = static_cast<time_t>((timeoutMs_ % 1000) * 1000);
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    client.set_write_timeout(seconds, micros);
}

SyncResult HttpSyncClient::sync(const std::string& credential,
                                const std::string& pipelineId,
                                const std::vector<Action>& actions) {
    JsonValue body = JsonValue::object();
    body.set("api_key", JsonValue::string(credential));
    body.set("pipeline_id", JsonValue::string(pipelineId));
    body.set("actions", WireFormat::toJson(actions));

    httplib::Client client(origin_);
    configure(client);

    SyncResult result;
    auto response = client.Post(path_, body.dump(), "application/json");
    if (!response) {
        result.detail = "transport error: " + httplib::to_string(response.error());
        return result;
    }
    result.ok = response->status >= 200 && response->status < 300;
    result.detail = "status=" + std::to_string(response->status);
    return result;
}

std::vector<Action> HttpSyncClient::fetch(const std::string& credential, const std::string& remoteId) {
    JsonValue body = JsonValue::object();
    body.set("api_key", JsonValue::string(credential));
    body.set("pipeline_id", JsonValue::string(remoteId));

    httplib::Client client(origin_);
    configure(client);

    const std::string path = (path_.back() == '/' ? path_ : path_ + "/") + "fetch";
    auto response = client.Post(path, body.dump(), "application/json");
    if (!response) {
        throw Sieve::IOException("Cannot reach pipeline service: " + httplib::to_string(response.error()), remoteId);
    }
    if (response->status < 200 || response->status >= 300) {
        throw Sieve::IOException("Pipeline service refused remote pipeline '" + remoteId + "' with status " +
                                     std::to_string(response->status),
                                 remoteId);
    }
    return WireFormat::actionsFromJson(parseJson(response->body));
}
