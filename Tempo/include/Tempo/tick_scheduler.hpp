#pragma once

#include "indexed_heap.hpp"
#include "timer.hpp"
#include <cstddef>
#include <vector>

namespace Tempo {

/**
 * Fires Timers in due-time order once per tick.
 *
 * Timers live in a heap keyed by their next due time. The backing container
 * keeps an id->slot table so cancel() is O(log n) from anywhere, including
 * from inside a handler that is currently firing.
 *
 * Each timer fires at most once per advance(). A repeating timer that is still
 * overdue after firing is pushed back after the pass and catches up on the
 * following ticks. Timers scheduled from inside a handler join the heap
 * once the pass ends, so the earliest they can fire is the next advance().
 *
 * Example:
 *     TickScheduler scheduler;
 *     TimerId id = scheduler.schedule(Handler([] { fmt::print("tick\n"); }), now, 1.0, false);
 *     scheduler.advance(now + 1.0); // prints "tick"
 *     scheduler.cancel(id);
 */
class TickScheduler {
public:
    using TimerHeap = Heap<IndexedContainer<Timer, TimerId, TimerKey, TimerLess>>;

    TickScheduler() = default;

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    TimerId schedule(Handler handler, double startTime, double interval, bool once);

    // Returns false when the timer already finished or was cancelled.
    bool cancel(TimerId id);

    void cancelAll();

    // Fires every timer due at or before `now`. Returns how many handlers ran.
    std::size_t advance(double now);

    bool contains(TimerId id) const;

    // Looked-up timers are valid until the scheduler is next modified.
    const Timer* find(TimerId id) const;

    std::size_t size() const { return m_timers.size() + m_pending.size(); }
    bool empty() const { return size() == 0; }

private:
    void finishPass();

    TimerHeap m_timers;
    // Re-armed and newly scheduled timers held back until the pass ends.
    std::vector<Timer> m_pending;

    bool m_advancing = false;
    TimerId m_firingId = 0;
    bool m_firingCancelled = false;
};

} // namespace Tempo
