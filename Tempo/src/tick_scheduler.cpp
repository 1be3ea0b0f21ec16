#include "Tempo/tick_scheduler.hpp"
#include "Tempo/log.hpp"
#include <algorithm>
#include <exception>
#include <tracy/Tracy.hpp>

namespace Tempo {

TimerId TickScheduler::schedule(Handler handler, double startTime, double interval, bool once) {
    if (interval < 0.0) {
        log::warn("TickScheduler::schedule(): negative interval {} clamped to 0", interval);
        interval = 0.0;
    }

    Timer timer(std::move(handler), startTime, interval, once);
    TimerId id = timer.getId();
    if (m_advancing) {
        // Joins the heap after the pass so it cannot fire in the pass that created it.
        m_pending.push_back(std::move(timer));
    } else {
        m_timers.push(std::move(timer));
    }

    log::trace("TickScheduler: scheduled timer {} (interval {}, once {})", id, interval, once);
    return id;
}

bool TickScheduler::cancel(TimerId id) {
    if (auto index = m_timers.container().indexOf(id)) {
        m_timers.removeAt(*index);
        return true;
    }

    // Cancelled from inside its own handler
    if (m_advancing && id == m_firingId) {
        m_firingCancelled = true;
        return true;
    }

    auto it = std::find_if(m_pending.begin(), m_pending.end(),
                           [id](const Timer& timer) { return timer.getId() == id; });
    if (it != m_pending.end()) {
        m_pending.erase(it);
        return true;
    }

    return false;
}

void TickScheduler::cancelAll() {
    m_timers.container().clear();
    m_pending.clear();
    if (m_advancing) {
        m_firingCancelled = true;
    }
}

std::size_t TickScheduler::advance(double now) {
    ZoneScoped;

    if (m_advancing) {
        log::warn("TickScheduler::advance() called from inside a timer handler, ignored");
        return 0;
    }

    // Ends the pass on every exit, including an exception escaping a handler.
    struct PassScope {
        TickScheduler& scheduler;
        ~PassScope() { scheduler.finishPass(); }
    };

    m_advancing = true;
    PassScope scope{ *this };
    std::size_t fired = 0;

    while (!m_timers.empty() && m_timers.top().next() <= now) {
        Timer timer = m_timers.pop();
        m_firingId = timer.getId();
        m_firingCancelled = false;

        bool finished = true;
        try {
            finished = timer.call();
        } catch (const std::exception& e) {
            log::error("TickScheduler: timer {} handler threw: {}", timer.getId(), e.what());
            finished = timer.isOnce();
        } catch (...) {
            log::error("TickScheduler: timer {} handler threw a non-standard exception", timer.getId());
            if (!timer.isOnce() && !m_firingCancelled) {
                m_pending.push_back(std::move(timer));
            }
            throw;
        }
        fired++;

        if (!finished && !m_firingCancelled) {
            m_pending.push_back(std::move(timer));
        }
    }

    return fired;
}

void TickScheduler::finishPass() {
    m_firingId = 0;
    m_firingCancelled = false;
    m_advancing = false;

    for (auto& timer : m_pending) {
        m_timers.push(std::move(timer));
    }
    m_pending.clear();
}

bool TickScheduler::contains(TimerId id) const {
    return find(id) != nullptr;
}

const Timer* TickScheduler::find(TimerId id) const {
    if (auto index = m_timers.container().indexOf(id)) {
        return &m_timers.container().get(*index);
    }
    for (const auto& timer : m_pending) {
        if (timer.getId() == id) {
            return &timer;
        }
    }
    return nullptr;
}

} // namespace Tempo
