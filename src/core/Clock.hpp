// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>

namespace mimic
{

/// @brief Milliseconds on the session's virtual timeline.
using Millis = std::chrono::milliseconds;

/// @brief Source of "now" for everything time-dependent in a session.
///
/// Scheduling and exit-hint expiry never read the wall clock directly, which
/// keeps a run reproducible: the interactive loop drives a SteadyClock, while
/// tests and print mode drive a ManualClock.
class Clock
{
  public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> Millis = 0;
};

/// @brief Clock backed by std::chrono::steady_clock, measured from construction.
class SteadyClock final: public Clock
{
  public:
    SteadyClock(): _origin(std::chrono::steady_clock::now()) {}

    [[nodiscard]] auto now() const -> Millis override
    {
        return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - _origin);
    }

  private:
    std::chrono::steady_clock::time_point _origin;
};

/// @brief Clock that only moves when told to.
class ManualClock final: public Clock
{
  public:
    explicit ManualClock(Millis start = Millis { 0 }): _now(start) {}

    [[nodiscard]] auto now() const -> Millis override { return _now; }

    void advance(Millis delta) noexcept { _now += delta; }
    void set(Millis value) noexcept { _now = value; }

  private:
    Millis _now;
};

} // namespace mimic
