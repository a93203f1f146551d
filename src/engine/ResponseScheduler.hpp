// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <engine/Scenario.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <variant>

namespace mimic
{

/// @brief A simulated tool invocation becomes visible.
struct ToolCallEvent
{
    std::size_t index = 0;
    ToolCallSpec call;
};

/// @brief A piece of streamed response text.
struct ChunkEvent
{
    std::string text;
};

/// @brief The response finished; carries the full text.
struct CompletedEvent
{
    std::string text;
};

/// @brief The response ended in an injected failure.
struct FailedEvent
{
    FailureSpec failure;
};

using ResponseEvent = std::variant<ToolCallEvent, ChunkEvent, CompletedEvent, FailedEvent>;

/// @brief Turns a matched response into a timed event sequence on a virtual clock.
///
/// A schedule delays by the response's delay (or the scenario default), then
/// emits its tool calls, its chunks spaced by the chunk interval, and finally
/// one completion. A failing response emits a single failure event instead.
/// Events are released strictly in (due time, sequence) order and the
/// scheduler never sleeps: callers pass the current time to next().
///
/// At most one schedule is active at a time.
class ResponseScheduler
{
  public:
    explicit ResponseScheduler(Millis defaultDelay = Millis { 0 }): _defaultDelay(defaultDelay) {}

    /// @brief Starts a schedule for @p response at time @p now.
    /// @return InvalidArgument if a schedule is still active.
    [[nodiscard]] auto schedule(ResponseSpec const& response, Millis now) -> VoidResult;

    /// @brief Pops the next event that is due at @p now, if any.
    [[nodiscard]] auto next(Millis now) -> std::optional<ResponseEvent>;

    /// @brief Due time of the next pending event.
    [[nodiscard]] auto nextDue() const -> std::optional<Millis>;

    /// @brief Whether events are still pending.
    [[nodiscard]] auto active() const noexcept -> bool { return !_pending.empty(); }

    /// @brief Drops every pending event.
    void cancel();

    /// @brief Pauses delivery, for example while a permission dialog is open.
    void hold(Millis now);

    /// @brief Resumes delivery, shifting remaining events by the time spent on hold.
    void release(Millis now);

    [[nodiscard]] auto held() const noexcept -> bool { return _heldSince.has_value(); }

  private:
    struct Pending
    {
        Millis due;
        std::uint64_t sequence;
        ResponseEvent event;
    };

    void push(Millis due, ResponseEvent event);

    Millis _defaultDelay;
    std::deque<Pending> _pending;
    std::uint64_t _nextSequence = 0;
    std::optional<Millis> _heldSince;
};

} // namespace mimic
