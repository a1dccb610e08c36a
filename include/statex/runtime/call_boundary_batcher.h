#ifndef STATEX_RUNTIME_CALL_BOUNDARY_BATCHER_H
#define STATEX_RUNTIME_CALL_BOUNDARY_BATCHER_H

#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/util/scope.h>

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace statex {

    /**
     * Delimits the outermost instrumented call on a wrapped-object graph.
     *
     * Every wrapper of one graph shares a single batcher. Each calling thread has its own stack of
     * instrumented-call names: the begin hook fires when a thread's stack goes from empty to one entry,
     * the end hook when it returns to empty. Nested calls only push and pop, so mutations made inside
     * them still notify individually while the hooks bracket the whole outer call exactly once.
     *
     * Only the thread-to-stack table is locked; the hooks and the wrapped state itself are not protected.
     */
    class STATEX_EXPORT CallBoundaryBatcher {
    public:
        using Hook = std::function<void()>;

        CallBoundaryBatcher() = default;

        CallBoundaryBatcher(const CallBoundaryBatcher &) = delete;
        CallBoundaryBatcher &operator=(const CallBoundaryBatcher &) = delete;

        void set_begin_call_hook(Hook hook);

        void set_end_call_hook(Hook hook);

        [[nodiscard]] bool has_begin_call_hook() const { return static_cast<bool>(_begin_call); }

        [[nodiscard]] bool has_end_call_hook() const { return static_cast<bool>(_end_call); }

        /**
         * Run fn as the instrumented call called name. If fn throws, the call is still popped (and the end
         * hook fired if it was the outermost call) before the exception continues.
         */
        template<typename Fn>
        decltype(auto) invoke(std::string_view name, Fn &&fn) {
            enter(name);
            auto unwind = make_scope_fail([this] { leave_unwinding(); });
            if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
                std::forward<Fn>(fn)();
                unwind.release();
                leave();
            } else {
                std::invoke_result_t<Fn> result = std::forward<Fn>(fn)();
                unwind.release();
                leave();
                return result;
            }
        }

        /// Number of instrumented calls in progress on the calling thread.
        [[nodiscard]] std::size_t depth() const;

        /// Names of the instrumented calls in progress on the calling thread, outermost first.
        [[nodiscard]] std::vector<std::string> call_stack() const;

    private:
        using call_stack_t = std::vector<std::string>;

        void enter(std::string_view name);

        void leave();

        void leave_unwinding() noexcept;

        // Pops the current call; true when the stack is now empty
        bool pop();

        call_stack_t &stack_for_current_thread();

        mutable std::mutex _stacks_mutex;
        std::unordered_map<std::thread::id, call_stack_t> _stacks;
        Hook _begin_call;
        Hook _end_call;
    };

} // namespace statex

#endif // STATEX_RUNTIME_CALL_BOUNDARY_BATCHER_H
