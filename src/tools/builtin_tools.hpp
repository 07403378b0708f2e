#pragma once

#include <functional>
#include <utility>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "logstore/log_renderer.hpp"
#include "logstore/log_store.hpp"
#include "protocol/tool_contract.hpp"
#include "wrappee/wrappee_controller.hpp"

namespace wrapmcp::tools {

inline const protocol::ToolName kShowLog{"show_log"};
inline const protocol::ToolName kClearLog{"clear_log"};
inline const protocol::ToolName kRestartWrappedServer{"restart_wrapped_server"};

// Tools answered by the proxy itself; they never reach the wrappee and never time out.
class BuiltinTools {
public:
    using RestartFn = std::function<core::errors::Result<wrappee::RestartOutcome>()>;

    BuiltinTools(std::shared_ptr<logstore::LogStore> store, RestartFn restart);

    std::vector<protocol::ToolDescriptor> descriptors() const;
    bool handles(const protocol::ToolName& name) const;

    core::errors::Result<nlohmann::json> call(const protocol::ToolName& name,
                                              const nlohmann::json& arguments) const;

private:
    core::errors::Result<nlohmann::json> show_log(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> clear_log() const;
    core::errors::Result<nlohmann::json> restart_wrapped_server() const;

    std::shared_ptr<logstore::LogStore> store_;
    RestartFn restart_;
};

// Translates show_log arguments into a filter plus output format.
core::errors::Result<std::pair<logstore::LogFilter, logstore::RenderFormat>> parse_show_log_arguments(
    const nlohmann::json& arguments);

}  // namespace wrapmcp::tools
