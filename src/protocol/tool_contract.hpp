#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/identifiers.hpp"

namespace wrapmcp::protocol {

    enum class ToolOrigin {
        Builtin,  // Handled by the proxy itself
        Wrappee   // Discovered from the wrapped server and forwarded
    };

    // One advertised tool, as returned by tools/list
    struct ToolDescriptor {
        ToolName name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
        ToolOrigin origin = ToolOrigin::Wrappee;

        // Fields of the wrappee's descriptor we do not model (annotations, outputSchema, ...)
        nlohmann::json extra = nlohmann::json::object();
    };

    inline nlohmann::json to_json(const ToolDescriptor& tool) {
        nlohmann::json out = tool.extra.is_object() ? tool.extra : nlohmann::json::object();
        out["name"] = tool.name.str();
        if (!tool.description.empty()) {
            out["description"] = tool.description;
        }
        out["inputSchema"] = tool.input_schema;
        return out;
    }

    // Tool results use the MCP CallToolResult shape: {"content": [{"type": "text", ...}]}
    inline nlohmann::json text_result(const std::string& text, bool is_error = false) {
        nlohmann::json result;
        result["content"] = nlohmann::json::array({{{"type", "text"}, {"text", text}}});
        if (is_error) {
            result["isError"] = true;
        }
        return result;
    }

} // namespace wrapmcp::protocol
