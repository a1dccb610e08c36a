#include <statex/runtime/call_boundary_batcher.h>

#include <fmt/format.h>

#include <cstdio>
#include <exception>

namespace statex {

    void CallBoundaryBatcher::set_begin_call_hook(Hook hook) { _begin_call = std::move(hook); }

    void CallBoundaryBatcher::set_end_call_hook(Hook hook) { _end_call = std::move(hook); }

    std::size_t CallBoundaryBatcher::depth() const {
        std::lock_guard lock{_stacks_mutex};
        auto it = _stacks.find(std::this_thread::get_id());
        return it == _stacks.end() ? 0 : it->second.size();
    }

    std::vector<std::string> CallBoundaryBatcher::call_stack() const {
        std::lock_guard lock{_stacks_mutex};
        auto it = _stacks.find(std::this_thread::get_id());
        return it == _stacks.end() ? std::vector<std::string>{} : it->second;
    }

    CallBoundaryBatcher::call_stack_t &CallBoundaryBatcher::stack_for_current_thread() {
        // Node based map: the reference stays valid while other threads add or drop their own stacks
        std::lock_guard lock{_stacks_mutex};
        return _stacks[std::this_thread::get_id()];
    }

    void CallBoundaryBatcher::enter(std::string_view name) {
        auto &stack = stack_for_current_thread();
        if (stack.empty() && _begin_call) {
            // A failing begin hook leaves the stack untouched
            auto discard = make_scope_fail([this] {
                std::lock_guard lock{_stacks_mutex};
                auto it = _stacks.find(std::this_thread::get_id());
                if (it != _stacks.end() && it->second.empty()) { _stacks.erase(it); }
            });
            _begin_call();
        }
        stack.emplace_back(name);
    }

    bool CallBoundaryBatcher::pop() {
        std::lock_guard lock{_stacks_mutex};
        auto it = _stacks.find(std::this_thread::get_id());
        if (it == _stacks.end()) { return true; }
        if (!it->second.empty()) { it->second.pop_back(); }
        if (it->second.empty()) {
            _stacks.erase(it);
            return true;
        }
        return false;
    }

    void CallBoundaryBatcher::leave() {
        if (pop() && _end_call) { _end_call(); }
    }

    void CallBoundaryBatcher::leave_unwinding() noexcept {
        if (!pop() || !_end_call) { return; }
        try {
            _end_call();
        } catch (const std::exception &e) {
            // The call's own exception is already in flight and takes precedence
            fmt::print(stderr, "[statex] end-call hook failed while unwinding: {}\n", e.what());
        } catch (...) {
            fmt::print(stderr, "[statex] end-call hook failed while unwinding with a non-standard exception\n");
        }
    }

} // namespace statex
