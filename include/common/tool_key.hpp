/*
 * File: include/common/tool_key.hpp
 * Project: Tool Sync
 * Purpose: Identity of one independently versioned state stream
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>

struct ToolKey
{
    std::string tool_id;
    std::optional<std::string> deployment_id;

    // '%' and '_' inside a component are escaped so the joined id is unambiguous.
    static std::string escape_component(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            if (c == '%')
                out += "%25";
            else if (c == '_')
                out += "%5F";
            else
                out.push_back(c);
        }
        return out;
    }

    // Document id in the snapshot collection: "tool" or "tool_deployment".
    std::string doc_id() const
    {
        std::string id = escape_component(tool_id);
        if (deployment_id)
            id += "_" + escape_component(*deployment_id);
        return id;
    }

    bool operator==(const ToolKey &o) const
    {
        return tool_id == o.tool_id && deployment_id == o.deployment_id;
    }
    bool operator!=(const ToolKey &o) const { return !(*this == o); }
};

// Empty strings from query strings and JSON bodies mean "absent".
inline std::optional<std::string> opt_string(const std::string &s)
{
    if (s.empty())
        return std::nullopt;
    return s;
}
