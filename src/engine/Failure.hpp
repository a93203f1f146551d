// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mimic
{

/// @brief Process exit codes matching the behavior of the real CLI.
namespace exit_code
{
    constexpr auto Success = 0;
    constexpr auto Error = 1;
    constexpr auto Partial = 2;
    constexpr auto Interrupted = 130;
} // namespace exit_code

/// @brief Kind of simulated backend failure.
enum class FailureKind : std::uint8_t
{
    NetworkUnreachable,
    ConnectionTimeout,
    AuthError,
    RateLimit,
    OutOfCredits,
    PartialResponse,
    MalformedJson,
};

/// @brief An injected failure. A rule carrying one never produces response text.
struct FailureSpec
{
    FailureKind kind = FailureKind::NetworkUnreachable;
    std::uint64_t afterMs = 0;    ///< ConnectionTimeout only.
    std::uint64_t retryAfter = 0; ///< RateLimit only, in seconds.
    std::string detail;           ///< Auth message, partial text or raw payload.

    auto operator==(FailureSpec const&) const -> bool = default;
};

/// @brief Parses a failure object such as {"type": "rate_limit", "retry_after": 30}.
[[nodiscard]] auto parseFailure(nlohmann::json const& obj) -> Result<FailureSpec>;

/// @brief Returns the scenario-file type tag for a failure kind.
[[nodiscard]] auto failureTypeName(FailureKind kind) -> std::string_view;

/// @brief Text shown in the conversation's error entry.
[[nodiscard]] auto conversationText(FailureSpec const& failure) -> std::string;

/// @brief Message written by print mode (stderr for errors, stdout for partial and malformed output).
[[nodiscard]] auto printText(FailureSpec const& failure) -> std::string;

/// @brief Exit status print mode terminates with.
[[nodiscard]] auto exitCodeFor(FailureSpec const& failure) noexcept -> int;

/// @brief Whether the failure is reported as an error (everything but malformed output).
[[nodiscard]] auto isErrorResult(FailureSpec const& failure) noexcept -> bool;

} // namespace mimic
