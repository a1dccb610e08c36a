#ifndef STATEX_TYPES_OBSERVABLE_H
#define STATEX_TYPES_OBSERVABLE_H

#include <statex/runtime/call_boundary_batcher.h>
#include <statex/runtime/field_clearing_coordinator.h>
#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/types/event_bus.h>
#include <statex/types/record_type.h>
#include <statex/types/value.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace statex {

    enum class ObservableKind : uint8_t { RECORD, SEQUENCE, ASSOCIATIVE };

    /**
     * Observable - base of the wrapped composites.
     *
     * A wrapped composite exclusively owns its underlying data and intercepts every in-place mutation:
     * after mutating it wraps any newly inserted plain composite and emits a keyed event on its private
     * event bus. Nested wrappers forward their whole-value event into the parent's bus under the slot
     * they occupy, so a change anywhere in the tree bubbles up to the root.
     *
     * All wrappers of one tree share the call-boundary batcher and the field-clearing coordinator of the
     * root. The root itself is only referenced weakly.
     */
    class STATEX_EXPORT Observable : public std::enable_shared_from_this<Observable> {
    public:
        /// Notification key meaning "the value as a whole changed".
        static constexpr std::string_view WHOLE_VALUE_KEY{"."};

        virtual ~Observable() = default;

        Observable(const Observable &) = delete;
        Observable &operator=(const Observable &) = delete;

        [[nodiscard]] virtual ObservableKind kind() const = 0;

        /// Subscribe to the events emitted under key.
        SubscriptionId on_event(std::string_view key, EventBus::Callback callback);

        void unsubscribe(std::string_view key, SubscriptionId id);

        /**
         * Emit the event for key. A member key is followed by the whole-value event, so that parents
         * observing this composite as a whole are informed of member changes too.
         */
        void notify(std::string_view key);

        [[nodiscard]] const EventBus &event_bus() const { return _event_bus; }

        /// The topmost wrapped ancestor, empty once the root has been released.
        [[nodiscard]] observable_s_ptr root() const { return _root.lock(); }

        [[nodiscard]] bool is_root() const { return _root.lock().get() == this; }

        [[nodiscard]] CallBoundaryBatcher &batcher() const { return *_batcher; }

        [[nodiscard]] FieldClearingCoordinator &coordinator() const { return *_coordinator; }

        [[nodiscard]] virtual bool equals(const Observable &other) const = 0;

        [[nodiscard]] virtual std::string to_string() const = 0;

    protected:
        Observable(call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator);

        /**
         * Prepare a value for storage in this composite under slot_key: plain composites are wrapped as
         * children of this composite, everything else (none, primitives, already wrapped values) passes
         * through unchanged.
         */
        Value adopt(Value value, std::string_view slot_key);

        // Called once the wrapper is owned by a shared_ptr; wraps the initial content
        virtual void adopt_contents() = 0;

        static void make_root(const observable_s_ptr &observable);

    private:
        EventBus _event_bus;
        std::weak_ptr<Observable> _root;
        call_boundary_batcher_s_ptr _batcher;
        FieldClearingCoordinator *_coordinator;
    };

    /**
     * ObservableRecord - a wrapped record.
     *
     * Data members emit an event keyed by the member name on assignment. Computed members and methods run
     * with this wrapper as the receiver, bracketed by the call-boundary batcher. Members whose name starts
     * with '_' are private: stored as given, never wrapped, never notified.
     */
    class STATEX_EXPORT ObservableRecord final : public Observable {
    public:
        /// Wrap record as the root of a new wrapped-object graph.
        static observable_record_s_ptr wrap(Record record, FieldClearingCoordinator *coordinator = nullptr);

        ~ObservableRecord() override;

        [[nodiscard]] ObservableKind kind() const override { return ObservableKind::RECORD; }

        [[nodiscard]] const record_type_s_ptr &type() const { return _record.type; }

        [[nodiscard]] std::string_view type_name() const { return _record.type_name(); }

        [[nodiscard]] bool has_member(std::string_view name) const;

        /// Names of the data members currently held, in name order.
        [[nodiscard]] std::vector<std::string> member_names() const;

        /**
         * Read a data member, or evaluate a computed member.
         * @throws ConfigurationError when name is a method
         * @throws LookupError when no such member exists
         */
        [[nodiscard]] Value get(std::string_view name);

        /// Evaluate a computed member with arguments.
        [[nodiscard]] Value compute(std::string_view name, const Arguments &arguments);

        /**
         * Assign a data member (declared or new) and notify under its name.
         * @throws ConfigurationError when name is a computed member or method
         */
        void set(std::string_view name, Value value);

        /// Invoke a method with this record as the receiver.
        Value call(std::string_view name, const Arguments &arguments = {});

        /// The lazily created field factory of this record.
        [[nodiscard]] FieldFactory &fields();

        [[nodiscard]] bool equals(const Observable &other) const override;

        [[nodiscard]] std::string to_string() const override;

    private:
        friend class Observable;

        ObservableRecord(Record record, call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator);

        void adopt_contents() override;

        static bool is_private(std::string_view name) { return name.starts_with('_'); }

        Record _record;
        std::unique_ptr<FieldFactory> _fields;
    };

    /**
     * ObservableList - a wrapped sequence. Every mutation emits the whole-value event; individual indices
     * are not tracked. Indices may be negative, counting from the end.
     */
    class STATEX_EXPORT ObservableList final : public Observable {
    public:
        [[nodiscard]] ObservableKind kind() const override { return ObservableKind::SEQUENCE; }

        [[nodiscard]] std::size_t size() const { return _items.size(); }

        [[nodiscard]] bool empty() const { return _items.empty(); }

        [[nodiscard]] const Value &at(int64_t index) const;

        [[nodiscard]] const List &items() const { return _items; }

        [[nodiscard]] List::const_iterator begin() const { return _items.begin(); }

        [[nodiscard]] List::const_iterator end() const { return _items.end(); }

        void set(int64_t index, Value value);

        /// Insert before index; an index at or past the end appends.
        void insert(int64_t index, Value value);

        void append(Value value);

        void erase(int64_t index);

        Value pop(int64_t index = -1);

        /// Remove the first element equal to value.
        /// @throws LookupError when there is none
        void remove(const Value &value);

        void clear();

        [[nodiscard]] bool equals(const Observable &other) const override;

        [[nodiscard]] std::string to_string() const override;

    private:
        friend class Observable;

        ObservableList(List items, call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator);

        void adopt_contents() override;

        [[nodiscard]] std::size_t resolve(int64_t index) const;

        List _items;
    };

    /**
     * ObservableDict - a wrapped associative container with text keys. Every mutation emits the
     * whole-value event; individual keys are not tracked.
     */
    class STATEX_EXPORT ObservableDict final : public Observable {
    public:
        [[nodiscard]] ObservableKind kind() const override { return ObservableKind::ASSOCIATIVE; }

        [[nodiscard]] std::size_t size() const { return _items.size(); }

        [[nodiscard]] bool empty() const { return _items.empty(); }

        [[nodiscard]] bool contains(std::string_view key) const { return _items.find(key) != _items.end(); }

        [[nodiscard]] const Value &at(std::string_view key) const;

        [[nodiscard]] Value get(std::string_view key, Value fallback = {}) const;

        [[nodiscard]] std::vector<std::string> keys() const;

        [[nodiscard]] const Dict &items() const { return _items; }

        void set(std::string_view key, Value value);

        void erase(std::string_view key);

        Value pop(std::string_view key);

        void clear();

        [[nodiscard]] bool equals(const Observable &other) const override;

        [[nodiscard]] std::string to_string() const override;

    private:
        friend class Observable;

        ObservableDict(Dict items, call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator);

        void adopt_contents() override;

        Dict _items;
    };

} // namespace statex

#endif // STATEX_TYPES_OBSERVABLE_H
