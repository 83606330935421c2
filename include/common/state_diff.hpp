/*
 * File: include/common/state_diff.hpp
 * Project: Tool Sync
 * Purpose: Top-level field diff and shallow merge over opaque state values
 * Notes:
 *  - Non-object values behave like an empty object
 *  - Merge is one level deep; nested objects are replaced, never combined
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

inline const nlohmann::json &object_or_empty(const nlohmann::json &v)
{
    static const nlohmann::json empty = nlohmann::json::object();
    return v.is_object() ? v : empty;
}

// Top-level keys whose values differ between the two states.
inline std::vector<std::string> changed_fields(const nlohmann::json &old_state, const nlohmann::json &new_state)
{
    const auto &a = object_or_empty(old_state);
    const auto &b = object_or_empty(new_state);
    std::vector<std::string> out;
    for (auto it = a.begin(); it != a.end(); ++it)
    {
        auto other = b.find(it.key());
        if (other == b.end() || *other != it.value())
            out.push_back(it.key());
    }
    for (auto it = b.begin(); it != b.end(); ++it)
        if (!a.contains(it.key()))
            out.push_back(it.key());
    return out;
}

// Field union; client fields win on key collision.
inline nlohmann::json shallow_merge(const nlohmann::json &server, const nlohmann::json &client)
{
    nlohmann::json out = object_or_empty(server);
    const auto &c = object_or_empty(client);
    for (auto it = c.begin(); it != c.end(); ++it)
        out[it.key()] = it.value();
    return out;
}
