// SPDX-License-Identifier: Apache-2.0
#include "Failure.hpp"

#include <core/JsonUtils.hpp>

#include <array>
#include <format>
#include <utility>

namespace mimic
{

namespace
{
    constexpr auto FailureTypeNames = std::array<std::pair<FailureKind, std::string_view>, 7> { {
        { FailureKind::NetworkUnreachable, "network_unreachable" },
        { FailureKind::ConnectionTimeout, "connection_timeout" },
        { FailureKind::AuthError, "auth_error" },
        { FailureKind::RateLimit, "rate_limit" },
        { FailureKind::OutOfCredits, "out_of_credits" },
        { FailureKind::PartialResponse, "partial_response" },
        { FailureKind::MalformedJson, "malformed_json" },
    } };
} // namespace

auto failureTypeName(FailureKind kind) -> std::string_view
{
    for (auto const& [k, name]: FailureTypeNames)
        if (k == kind)
            return name;
    return "unknown";
}

auto parseFailure(nlohmann::json const& obj) -> Result<FailureSpec>
{
    if (!obj.is_object())
        return makeError(ErrorCode::ScenarioError, "failure must be an object");

    auto type = json::getString(obj, "type");
    if (!type)
        return makeError(ErrorCode::ScenarioError, "failure is missing its \"type\"");

    auto failure = FailureSpec {};
    auto known = false;
    for (auto const& [kind, name]: FailureTypeNames)
        if (name == *type)
        {
            failure.kind = kind;
            known = true;
        }
    if (!known)
        return makeError(ErrorCode::ScenarioError, std::format("Unknown failure type '{}'", *type));

    switch (failure.kind)
    {
        case FailureKind::ConnectionTimeout: {
            auto const after = json::getUInt64Or(obj, "after_ms", 5000);
            if (!after)
                return std::unexpected(after.error());
            failure.afterMs = *after;
            break;
        }
        case FailureKind::RateLimit: {
            auto const retryAfter = json::getUInt64Or(obj, "retry_after", 60);
            if (!retryAfter)
                return std::unexpected(retryAfter.error());
            failure.retryAfter = *retryAfter;
            break;
        }
        case FailureKind::AuthError: failure.detail = json::getStringOr(obj, "message", "Invalid API key"); break;
        case FailureKind::PartialResponse:
            failure.detail = json::getStringOr(obj, "partial_text", "I was going to say...");
            break;
        case FailureKind::MalformedJson:
            failure.detail = json::getStringOr(obj, "raw", R"({"type":"message","content":[{)");
            break;
        case FailureKind::NetworkUnreachable:
        case FailureKind::OutOfCredits: break;
    }
    return failure;
}

auto conversationText(FailureSpec const& failure) -> std::string
{
    switch (failure.kind)
    {
        case FailureKind::NetworkUnreachable: return "Error: Network is unreachable";
        case FailureKind::ConnectionTimeout:
            return std::format("Error: Connection timed out after {}ms", failure.afterMs);
        case FailureKind::AuthError: return std::format("Error: {}", failure.detail);
        case FailureKind::RateLimit:
            return std::format("Error: Rate limited. Retry after {} seconds.", failure.retryAfter);
        case FailureKind::OutOfCredits: return "Error: No credits remaining";
        case FailureKind::PartialResponse: return std::format("Partial response: {}", failure.detail);
        case FailureKind::MalformedJson: return std::format("Malformed response: {}", failure.detail);
    }
    return "Error";
}

auto printText(FailureSpec const& failure) -> std::string
{
    switch (failure.kind)
    {
        case FailureKind::NetworkUnreachable: return "Network error: Connection refused";
        case FailureKind::ConnectionTimeout:
            return std::format("Network error: Connection timed out after {}ms", failure.afterMs);
        case FailureKind::AuthError: return failure.detail;
        case FailureKind::RateLimit: return std::format("Rate limited. Retry after {} seconds.", failure.retryAfter);
        case FailureKind::OutOfCredits: return "Billing error: No credits remaining";
        case FailureKind::PartialResponse:
        case FailureKind::MalformedJson: return failure.detail;
    }
    return {};
}

auto exitCodeFor(FailureSpec const& failure) noexcept -> int
{
    switch (failure.kind)
    {
        case FailureKind::PartialResponse: return exit_code::Partial;
        case FailureKind::MalformedJson: return exit_code::Success;
        default: return exit_code::Error;
    }
}

auto isErrorResult(FailureSpec const& failure) noexcept -> bool
{
    return failure.kind != FailureKind::MalformedJson;
}

} // namespace mimic
