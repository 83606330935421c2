/*
 * File: include/common/errors.hpp
 * Project: Tool Sync
 * Purpose: Error taxonomy shared by the engine and the HTTP layer
 * Last updated: 2026-10-19
 */

#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode
{
    Unauthorized,
    Forbidden,
    InvalidInput,
    NotFound,
    RateLimited,
    InternalError,
};

inline const char *error_code_name(ErrorCode c)
{
    switch (c)
    {
    case ErrorCode::Unauthorized:
        return "UNAUTHORIZED";
    case ErrorCode::Forbidden:
        return "FORBIDDEN";
    case ErrorCode::InvalidInput:
        return "INVALID_INPUT";
    case ErrorCode::NotFound:
        return "RESOURCE_NOT_FOUND";
    case ErrorCode::RateLimited:
        return "RATE_LIMITED";
    case ErrorCode::InternalError:
        break;
    }
    return "INTERNAL_ERROR";
}

inline unsigned error_http_status(ErrorCode c)
{
    switch (c)
    {
    case ErrorCode::Unauthorized:
        return 401;
    case ErrorCode::Forbidden:
        return 403;
    case ErrorCode::InvalidInput:
        return 400;
    case ErrorCode::NotFound:
        return 404;
    case ErrorCode::RateLimited:
        return 429;
    case ErrorCode::InternalError:
        break;
    }
    return 500;
}

// Raised by engine operations; what() is safe to show to the caller.
class SyncError : public std::runtime_error
{
public:
    SyncError(ErrorCode code, const std::string &msg) : std::runtime_error(msg), code_(code) {}
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Raised by document stores. Never shown to the caller.
class StoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
