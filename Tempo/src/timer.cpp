#include "Tempo/timer.hpp"
#include <atomic>

namespace Tempo {

namespace {
    std::atomic<TimerId> s_nextTimerId{ 0 };
}

Timer::Timer(Handler handler, double begin, double interval, bool once)
    : m_handler(std::move(handler)),
      m_id(++s_nextTimerId),
      m_begin(begin),
      m_interval(interval),
      m_once(once),
      m_next(begin + interval) {}

bool Timer::call() {
    // Bookkeeping first: the handler may throw and the timer must still move on.
    m_timesFired++;
    m_next = m_begin + m_interval * (m_timesFired + 1);
    m_handler();
    return m_once;
}

} // namespace Tempo
