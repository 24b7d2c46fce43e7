/**
 * @file http_action_runner.hpp
 * @brief ActionRunner that triggers each action through a JSON webhook
 */

#pragma once

#include <actions/action_runner.hpp>
#include <config/drift_config.hpp>
#include <export.hpp>
#include <string>
#include <utility>

namespace Driftwatch {

/**
 * @brief POSTs the ActionContext as JSON to one URL per action.
 *
 * A non-2xx status, a transport error, an unparsable body or an
 * unconfigured URL raises ActionExecutionError. Nothing is retried.
 */
class DRIFTWATCH_API HttpActionRunner : public ActionRunner {
public:
    explicit HttpActionRunner(ActionEndpoints endpoints);

    nlohmann::json reindex(const ActionContext& ctx) override;
    nlohmann::json trigger_fine_tune(const ActionContext& ctx) override;
    nlohmann::json update_safety_filters(const ActionContext& ctx) override;

    /**
     * @brief Split "http://host:port/path" into {"http://host:port", "/path"}
     * @throws ActionExecutionError if the URL has no scheme
     */
    static std::pair<std::string, std::string> split_url(const std::string& url);

private:
    nlohmann::json post(const char* action, const std::string& url, const ActionContext& ctx);

    ActionEndpoints endpoints_;
};

} // namespace Driftwatch
