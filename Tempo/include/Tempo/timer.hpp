#pragma once

#include "handler.hpp"
#include <cstdint>

namespace Tempo {

using TimerId = std::uint64_t;

/**
 * One schedulable unit owned by the TickScheduler.
 *
 * The n-th firing is due at begin + interval * n, so a late tick never shifts
 * later firings.
 */
class Timer {
public:
    Timer(Handler handler, double begin, double interval, bool once);

    TimerId getId() const { return m_id; }
    double getBegin() const { return m_begin; }
    double getInterval() const { return m_interval; }
    bool isOnce() const { return m_once; }
    std::uint32_t getTimesFired() const { return m_timesFired; }
    double next() const { return m_next; }

    // Invokes the handler and advances the due time. Returns true if the timer is finished.
    bool call();

private:
    Handler m_handler;
    TimerId m_id;
    double m_begin;
    double m_interval;
    bool m_once;
    std::uint32_t m_timesFired = 0;
    double m_next;
};

// Earlier due time first; equal due times fire in scheduling order.
struct TimerLess {
    bool operator()(const Timer& a, const Timer& b) const {
        if (a.next() != b.next()) {
            return a.next() < b.next();
        }
        return a.getId() < b.getId();
    }
};

struct TimerKey {
    TimerId operator()(const Timer& timer) const { return timer.getId(); }
};

} // namespace Tempo
