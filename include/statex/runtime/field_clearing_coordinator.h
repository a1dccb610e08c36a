#ifndef STATEX_RUNTIME_FIELD_CLEARING_COORDINATOR_H
#define STATEX_RUNTIME_FIELD_CLEARING_COORDINATOR_H

#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>

#include <memory>
#include <vector>

namespace statex {

    // PropagationObserver - externally managed, the coordinator only keeps a raw pointer
    struct PropagationObserver {
        virtual ~PropagationObserver() = default;

        virtual void on_dirty(const Field &, Provenance) {
        };

        virtual void on_before_flush(const Field &) {
        };

        virtual void on_after_flush(const Field &) {
        };
    };

    /**
     * Receives every field that has just been marked dirty and decides when it is flushed.
     *
     * A field registers with its coordinator each time it is marked dirty, including repeated marks of an
     * already dirty field, so an implementation sees every propagation step.
     */
    struct STATEX_EXPORT FieldClearingCoordinator {
        virtual ~FieldClearingCoordinator() = default;

        virtual void add_dirty(Field &field) = 0;

        void add_observer(PropagationObserver *observer);

        void remove_observer(PropagationObserver *observer);

        [[nodiscard]] const std::vector<PropagationObserver *> &observers() const { return _observers; }

    protected:
        void notify_dirty(const Field &field);

        // Flushes the field, bracketed by the observer callbacks
        void flush_field(Field &field);

    private:
        std::vector<PropagationObserver *> _observers;
    };

    /// Flushes each field synchronously as it is registered. The default policy.
    struct STATEX_EXPORT ImmediateFlushCoordinator : FieldClearingCoordinator {
        void add_dirty(Field &field) override;
    };

    /**
     * Queues dirty fields until flush_pending() is called, then flushes them in arrival order.
     *
     * A field queued several times is flushed once per entry; entries after the first find the field
     * clean and do nothing. Fields released before the flush are skipped. Fields not owned by a shared_ptr
     * cannot be held safely and are flushed immediately instead.
     */
    struct STATEX_EXPORT DeferredFlushCoordinator : FieldClearingCoordinator {
        void add_dirty(Field &field) override;

        void flush_pending();

        [[nodiscard]] std::size_t pending_count() const { return _pending.size(); }

    private:
        std::vector<std::weak_ptr<Field>> _pending;
    };

    /// Process-wide immediate coordinator used when none is supplied.
    STATEX_EXPORT FieldClearingCoordinator &default_coordinator();

} // namespace statex

#endif // STATEX_RUNTIME_FIELD_CLEARING_COORDINATOR_H
