#include <statex/runtime/field_clearing_coordinator.h>
#include <statex/types/field.h>
#include <statex/util/scope.h>

#include <algorithm>
#include <cstddef>

namespace statex {

    void FieldClearingCoordinator::add_observer(PropagationObserver *observer) {
        if (observer && std::find(_observers.begin(), _observers.end(), observer) == _observers.end()) {
            _observers.push_back(observer);
        }
    }

    void FieldClearingCoordinator::remove_observer(PropagationObserver *observer) {
        std::erase(_observers, observer);
    }

    void FieldClearingCoordinator::notify_dirty(const Field &field) {
        for (auto *observer : _observers) { observer->on_dirty(field, field.dirty_source()); }
    }

    void FieldClearingCoordinator::flush_field(Field &field) {
        for (auto *observer : _observers) { observer->on_before_flush(field); }
        field.flush();
        for (auto *observer : _observers) { observer->on_after_flush(field); }
    }

    void ImmediateFlushCoordinator::add_dirty(Field &field) {
        notify_dirty(field);
        flush_field(field);
    }

    void DeferredFlushCoordinator::add_dirty(Field &field) {
        notify_dirty(field);
        auto handle = field.weak_from_this();
        if (handle.expired()) {
            flush_field(field);
            return;
        }
        _pending.push_back(std::move(handle));
    }

    void DeferredFlushCoordinator::flush_pending() {
        // Listeners may dirty further fields while we flush, keep draining until the queue stays empty
        while (!_pending.empty()) {
            std::vector<std::weak_ptr<Field>> batch;
            batch.swap(_pending);
            for (std::size_t i = 0; i < batch.size(); ++i) {
                auto field = batch[i].lock();
                if (!field) { continue; }
                // A throwing listener leaves the rest of the batch queued for the next flush
                auto requeue = make_scope_fail([&] {
                    _pending.insert(_pending.begin(), batch.begin() + static_cast<std::ptrdiff_t>(i + 1), batch.end());
                });
                flush_field(*field);
            }
        }
    }

    FieldClearingCoordinator &default_coordinator() {
        static ImmediateFlushCoordinator coordinator;
        return coordinator;
    }

} // namespace statex
