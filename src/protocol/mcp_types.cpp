#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/version.hpp"

namespace mcplink {

namespace {

template <typename T>
Json optional_to_json(const std::optional<T>& value) {
    if (value.has_value()) {
        return Json(*value);
    }
    return Json(nullptr);
}

}  // namespace

Implementation client_implementation() {
    return {kLibraryName, kLibraryVersion};
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

Json ToolDescriptor::to_json() const {
    Json j = {
        {"name", name},
        {"description", optional_to_json(description)}
    };
    if (input_schema.has_value()) {
        j["inputSchema"] = *input_schema;
    }
    return j;
}

std::vector<ToolDescriptor> parse_tools(const Json& result) {
    std::vector<ToolDescriptor> out;
    if (result.is_object() == false) {
        return out;
    }
    const auto tools_it = result.find("tools");
    if (tools_it == result.end() || tools_it->is_array() == false) {
        return out;
    }

    out.reserve(tools_it->size());
    for (const auto& entry : *tools_it) {
        if (entry.is_object() == false) {
            continue;
        }
        const auto name_it = entry.find("name");
        if (name_it == entry.end() || name_it->is_string() == false) {
            continue;
        }

        ToolDescriptor tool;
        tool.name = name_it->get<std::string>();

        const auto description_it = entry.find("description");
        if (description_it != entry.end() && description_it->is_string()) {
            tool.description = description_it->get<std::string>();
        }

        // camelCase wins when both spellings are present
        auto schema_it = entry.find("inputSchema");
        if (schema_it == entry.end()) {
            schema_it = entry.find("input_schema");
        }
        if (schema_it != entry.end() && schema_it->is_object()) {
            tool.input_schema = *schema_it;
        }

        out.push_back(std::move(tool));
    }
    return out;
}

std::string extract_text_content(const Json& result) {
    if (result.is_object() == false) {
        return {};
    }
    const auto content_it = result.find("content");
    if (content_it == result.end()) {
        return {};
    }
    if (content_it->is_string()) {
        return content_it->get<std::string>();
    }
    if (content_it->is_array() == false) {
        return {};
    }

    std::string out;
    for (const auto& block : *content_it) {
        if (block.is_object() == false) {
            continue;
        }
        const auto type_it = block.find("type");
        if (type_it == block.end() || type_it->is_string() == false || *type_it != "text") {
            continue;
        }
        const auto text_it = block.find("text");
        if (text_it == block.end() || text_it->is_string() == false) {
            continue;
        }
        if (out.empty() == false) {
            out.push_back('\n');
        }
        out += text_it->get_ref<const std::string&>();
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// CheckResult
// ─────────────────────────────────────────────────────────────────────────────

Json CheckResult::to_json() const {
    Json tools_json = nullptr;
    if (tools.has_value()) {
        tools_json = Json::array();
        for (const auto& tool : *tools) {
            tools_json.push_back(tool.to_json());
        }
    }
    return {
        {"ok", ok},
        {"tools_count", optional_to_json(tools_count)},
        {"tools", std::move(tools_json)},
        {"warning", optional_to_json(warning)},
        {"error", optional_to_json(error)}
    };
}

}  // namespace mcplink
