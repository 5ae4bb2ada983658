#ifndef OPBRIDGE_UTIL_SCOPE_H
#define OPBRIDGE_UTIL_SCOPE_H

#include <type_traits>
#include <utility>

namespace opbridge {

    /**
     * Runs a callable when the enclosing scope ends, unless released first.
     * Used to restore state flags on every exit path, including exceptions.
     */
    template<class F>
    class scope_exit {
    public:
        template<class Fn>
        explicit scope_exit(Fn &&fn) noexcept(std::is_nothrow_constructible_v<F, Fn>) : _on_exit(std::forward<Fn>(fn)) {}

        scope_exit(scope_exit &&other) noexcept(std::is_nothrow_move_constructible_v<F>)
            : _on_exit(std::move(other._on_exit)), _armed(std::exchange(other._armed, false)) {}

        scope_exit(const scope_exit &) = delete;
        scope_exit &operator=(const scope_exit &) = delete;
        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (_armed) _on_exit();
        }

        void release() noexcept { _armed = false; }

    private:
        F _on_exit;
        bool _armed{true};
    };

    template<class F>
    [[nodiscard]] scope_exit<std::decay_t<F>> make_scope_exit(F &&fn) {
        return scope_exit<std::decay_t<F>>(std::forward<F>(fn));
    }

}  // namespace opbridge

#endif  // OPBRIDGE_UTIL_SCOPE_H
