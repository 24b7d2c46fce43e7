/**
 * @file http_action_runner.cpp
 * @brief Webhook-backed corrective actions over cpp-httplib
 */

#include <actions/http_action_runner.hpp>
#include <core/errors.hpp>
#include <httplib.h>

namespace Driftwatch {

using json = nlohmann::json;

HttpActionRunner::HttpActionRunner(ActionEndpoints endpoints) : endpoints_(std::move(endpoints)) {}

std::pair<std::string, std::string> HttpActionRunner::split_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ActionExecutionError("Webhook URL needs an http:// or https:// scheme: " + url);
    }

    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

json HttpActionRunner::post(const char* action, const std::string& url, const ActionContext& ctx) {
    if (url.empty()) {
        throw ActionExecutionError(std::string("No webhook URL configured for ") + action);
    }

    auto [base, path] = split_url(url);

    httplib::Client cli(base);
    cli.set_connection_timeout(endpoints_.timeout_seconds);
    cli.set_read_timeout(endpoints_.timeout_seconds);

    json payload = ctx;
    payload["action"] = action;

    auto res = cli.Post(path, payload.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    if (!res) {
        throw ActionExecutionError(std::string(action) + " webhook unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw ActionExecutionError(std::string(action) + " webhook returned HTTP " +
                                   std::to_string(res->status) + ": " + res->body);
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        throw ActionExecutionError(std::string(action) + " webhook returned invalid JSON: " + e.what());
    }
}

json HttpActionRunner::reindex(const ActionContext& ctx) {
    return post("reindex_documents", endpoints_.reindex_url, ctx);
}

json HttpActionRunner::trigger_fine_tune(const ActionContext& ctx) {
    return post("fine_tune_model", endpoints_.fine_tune_url, ctx);
}

json HttpActionRunner::update_safety_filters(const ActionContext& ctx) {
    return post("update_safety_filters", endpoints_.safety_filter_url, ctx);
}

} // namespace Driftwatch
