#pragma once

#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Tempo {

/**
 * A deferred call: a callable plus the arguments bound to it at creation.
 *
 * Example:
 *     Handler h(&Game::spawnWave, &game, 3);
 *     h(); // game.spawnWave(3)
 */
class Handler {
public:
    Handler() = default;

    template<typename Fn, typename... Args,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Fn>, Handler>>>
    explicit Handler(Fn&& fn, Args&&... args)
        : m_call([fn = std::forward<Fn>(fn), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
              std::apply([&fn](auto&... a) { std::invoke(fn, a...); }, bound);
          }) {}

    void operator()() const {
        if (m_call) {
            m_call();
        }
    }

    explicit operator bool() const { return static_cast<bool>(m_call); }

private:
    std::function<void()> m_call;
};

} // namespace Tempo
