#ifndef STATEX_UTIL_SCOPE_H
#define STATEX_UTIL_SCOPE_H

#include <exception>
#include <utility>

namespace statex {
    /**
     * Runs the supplied callable when the enclosing scope is left by an exception, unless release() was
     * called first. Used to undo partial state (call stack pushes, cache insertions, drained queues).
     */
    template<class F>
    class scope_fail {
    public:
        explicit scope_fail(F &&f) noexcept : fn_(std::move(f)), exceptions_(std::uncaught_exceptions()) {}

        scope_fail(scope_fail &&other) noexcept
            : fn_(std::move(other.fn_)), exceptions_(other.exceptions_), active_(other.active_) {
            other.release();
        }

        scope_fail(const scope_fail &) = delete;

        scope_fail &operator=(const scope_fail &) = delete;

        scope_fail &operator=(scope_fail &&) = delete;

        ~scope_fail() {
            if (active_ && std::uncaught_exceptions() > exceptions_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        int exceptions_;
        bool active_{true};
    };

    template<class F>
    scope_fail<F> make_scope_fail(F &&f) { return scope_fail<F>(std::forward<F>(f)); }
} // namespace statex
#endif  // STATEX_UTIL_SCOPE_H
