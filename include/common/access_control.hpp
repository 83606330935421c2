/*
 * File: include/common/access_control.hpp
 * Project: Tool Sync
 * Purpose: Caller identity and per-tool permission checks
 * Notes:
 *  - Document-backed rules read tools, toolDeployments and spaceMembers
 *  - Lookup failures deny access and are logged
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/document_store.hpp"
#include "common/log.hpp"

using nlohmann::json;

class Authenticator
{
public:
    virtual ~Authenticator() = default;
    virtual std::optional<std::string> verify(const std::string &bearer_token) = 0;
};

class TokenAuthenticator : public Authenticator
{
    std::map<std::string, std::string> tokens_;

public:
    explicit TokenAuthenticator(std::map<std::string, std::string> tokens) : tokens_(std::move(tokens)) {}

    std::optional<std::string> verify(const std::string &bearer_token) override
    {
        auto it = tokens_.find(bearer_token);
        if (it == tokens_.end())
            return std::nullopt;
        return it->second;
    }
};

// Extracts <token> from "Bearer <token>"; empty when the header has another shape.
inline std::string bearer_token(const std::string &authorization)
{
    static const std::string prefix = "Bearer ";
    if (authorization.compare(0, prefix.size(), prefix) != 0)
        return {};
    return authorization.substr(prefix.size());
}

class AccessControl
{
public:
    virtual ~AccessControl() = default;
    virtual bool tool_exists(const std::string &tool_id) = 0;
    virtual std::string tool_name(const std::string &tool_id) = 0;
    virtual bool can_update(const std::string &user_id, const std::string &tool_id,
                            const std::optional<std::string> &deployment_id,
                            const std::optional<std::string> &space_id) = 0;
    // tool_id may be empty when only a deployment or space is addressed.
    virtual bool can_read(const std::string &user_id, const std::string &tool_id,
                          const std::optional<std::string> &deployment_id,
                          const std::optional<std::string> &space_id) = 0;
    virtual std::vector<std::string> tool_users(const std::string &tool_id,
                                                const std::optional<std::string> &deployment_id,
                                                const std::optional<std::string> &space_id) = 0;
};

class DocumentAccessControl : public AccessControl
{
    DocumentStore &store_;

    std::optional<json> member(const std::string &user_id, const std::string &space_id)
    {
        auto rows = store_.scan(collections::kSpaceMembers, [&](const json &d)
                                { return d.value("userId", std::string()) == user_id &&
                                         d.value("spaceId", std::string()) == space_id &&
                                         d.value("status", std::string()) == "active"; });
        if (rows.empty())
            return std::nullopt;
        return rows.front();
    }

    std::vector<std::string> space_members(const std::string &space_id)
    {
        std::vector<std::string> out;
        for (const auto &d : store_.scan(collections::kSpaceMembers, [&](const json &m)
                                         { return m.value("spaceId", std::string()) == space_id &&
                                                  m.value("status", std::string()) == "active"; }))
            out.push_back(d.value("userId", std::string()));
        return out;
    }

    std::optional<json> tool(const std::string &tool_id)
    {
        if (tool_id.empty())
            return std::nullopt;
        return store_.get(collections::kTools, tool_id);
    }

public:
    explicit DocumentAccessControl(DocumentStore &store) : store_(store) {}

    bool tool_exists(const std::string &tool_id) override { return tool(tool_id).has_value(); }

    std::string tool_name(const std::string &tool_id) override
    {
        auto t = tool(tool_id);
        return t ? t->value("name", std::string("Unknown Tool")) : std::string("Unknown Tool");
    }

    bool can_update(const std::string &user_id, const std::string &tool_id,
                    const std::optional<std::string> &deployment_id,
                    const std::optional<std::string> &space_id) override
    {
        try
        {
            auto t = tool(tool_id);
            if (!t)
                return false;
            if (t->value("authorId", std::string()) == user_id)
                return true;
            if (deployment_id)
            {
                auto d = store_.get(collections::kDeployments, *deployment_id);
                if (d && d->value("deployedBy", std::string()) == user_id)
                    return true;
            }
            if (space_id)
            {
                if (auto m = member(user_id, *space_id))
                {
                    static const std::set<std::string> roles{"builder", "moderator", "admin"};
                    return roles.count(m->value("role", std::string("member"))) > 0;
                }
            }
            return false;
        }
        catch (const std::exception &e)
        {
            log_error("access", std::string("update permission lookup failed: ") + e.what());
            return false;
        }
    }

    bool can_read(const std::string &user_id, const std::string &tool_id,
                  const std::optional<std::string> &deployment_id,
                  const std::optional<std::string> &space_id) override
    {
        try
        {
            auto t = tool(tool_id);
            if (t && t->value("authorId", std::string()) == user_id)
                return true;
            if (deployment_id)
            {
                auto d = store_.get(collections::kDeployments, *deployment_id);
                if (d)
                {
                    if (d->value("deployedBy", std::string()) == user_id)
                        return true;
                    auto dep_space = d->value("spaceId", std::string());
                    if (!dep_space.empty())
                        return member(user_id, dep_space).has_value();
                }
            }
            if (space_id)
                return member(user_id, *space_id).has_value();
            return false;
        }
        catch (const std::exception &e)
        {
            log_error("access", std::string("read permission lookup failed: ") + e.what());
            return false;
        }
    }

    std::vector<std::string> tool_users(const std::string &tool_id,
                                        const std::optional<std::string> &deployment_id,
                                        const std::optional<std::string> &space_id) override
    {
        std::vector<std::string> users;
        auto add = [&](const std::string &u)
        {
            if (!u.empty() && std::find(users.begin(), users.end(), u) == users.end())
                users.push_back(u);
        };
        try
        {
            if (auto t = tool(tool_id))
                add(t->value("authorId", std::string()));
            if (deployment_id)
            {
                if (auto d = store_.get(collections::kDeployments, *deployment_id))
                {
                    add(d->value("deployedBy", std::string()));
                    auto dep_space = d->value("spaceId", std::string());
                    if (!dep_space.empty())
                        for (const auto &u : space_members(dep_space))
                            add(u);
                }
            }
            if (space_id)
                for (const auto &u : space_members(*space_id))
                    add(u);
        }
        catch (const std::exception &e)
        {
            log_error("access", std::string("tool user lookup failed: ") + e.what());
        }
        return users;
    }
};
