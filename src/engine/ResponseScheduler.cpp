// SPDX-License-Identifier: Apache-2.0
#include "ResponseScheduler.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace mimic
{

void ResponseScheduler::push(Millis due, ResponseEvent event)
{
    auto entry = Pending { .due = due, .sequence = _nextSequence++, .event = std::move(event) };
    auto const position = std::ranges::upper_bound(_pending, entry, [](Pending const& a, Pending const& b) {
        return a.due < b.due || (a.due == b.due && a.sequence < b.sequence);
    });
    _pending.insert(position, std::move(entry));
}

auto ResponseScheduler::schedule(ResponseSpec const& response, Millis now) -> VoidResult
{
    if (active())
        return makeError(ErrorCode::InvalidArgument, "a response is already scheduled");

    _heldSince.reset();
    auto const start = now + response.delay.value_or(_defaultDelay);

    if (response.failure)
    {
        log::info("Injecting {} failure at {}ms", failureTypeName(response.failure->kind), start.count());
        push(start, FailedEvent { *response.failure });
        return {};
    }

    for (auto index = std::size_t { 0 }; index < response.toolCalls.size(); ++index)
        push(start, ToolCallEvent { .index = index, .call = response.toolCalls[index] });

    auto text = response.text;
    if (text.empty() && response.toolCalls.empty())
        text = std::string(FallbackResponseText);

    auto due = start;
    if (!response.chunks.empty())
    {
        for (auto index = std::size_t { 0 }; index < response.chunks.size(); ++index)
        {
            if (index > 0)
                due += response.chunkInterval;
            push(due, ChunkEvent { response.chunks[index] });
        }
    }
    else if (!text.empty())
    {
        push(due, ChunkEvent { text });
    }

    push(due, CompletedEvent { std::move(text) });
    log::trace("Scheduled {} event(s), completing at {}ms", _pending.size(), due.count());
    return {};
}

auto ResponseScheduler::next(Millis now) -> std::optional<ResponseEvent>
{
    if (_heldSince || _pending.empty() || _pending.front().due > now)
        return std::nullopt;

    auto event = std::move(_pending.front().event);
    _pending.pop_front();
    return event;
}

auto ResponseScheduler::nextDue() const -> std::optional<Millis>
{
    if (_heldSince || _pending.empty())
        return std::nullopt;
    return _pending.front().due;
}

void ResponseScheduler::cancel()
{
    if (!_pending.empty())
        log::debug("Cancelling {} pending response event(s)", _pending.size());
    _pending.clear();
    _heldSince.reset();
}

void ResponseScheduler::hold(Millis now)
{
    if (!_heldSince)
        _heldSince = now;
}

void ResponseScheduler::release(Millis now)
{
    if (!_heldSince)
        return;

    auto const pausedFor = now > *_heldSince ? now - *_heldSince : Millis { 0 };
    for (auto& entry: _pending)
        entry.due += pausedFor;
    _heldSince.reset();
}

} // namespace mimic
