#ifndef STATEX_TYPES_FIELD_H
#define STATEX_TYPES_FIELD_H

#include <statex/runtime/field_clearing_coordinator.h>
#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/types/value.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace statex {

    /**
     * Field - a reactive unit of observable state.
     *
     * A field reads its value through an accessor and optionally writes through a mutator; it never caches
     * the value, so get() is always current. The dirty flag only gates notification: mark_dirty() records
     * the provenance, propagates to every dependent field and registers with the coordinator, which decides
     * when flush() informs the listeners.
     *
     * Edges are non-owning in both directions and are removed by whichever end is destroyed first.
     * Derived fields (map, transform, eq, bind) hold their source alive, so they require the source to be
     * owned by a shared_ptr.
     */
    class STATEX_EXPORT Field : public std::enable_shared_from_this<Field> {
    public:
        using Accessor = std::function<Value(const Arguments &)>;
        using Mutator = std::function<void(const Arguments &, const Value &)>;
        using Listener = std::function<void(Provenance)>;
        using Unsubscribe = std::function<void()>;
        using Dependencies = std::vector<field_s_ptr>;

        Field(std::string key, Accessor accessor, Mutator mutator = {}, Dependencies dependencies = {},
              std::optional<std::string> annotation = std::nullopt,
              FieldClearingCoordinator *coordinator = nullptr);

        ~Field();

        Field(const Field &) = delete;
        Field &operator=(const Field &) = delete;
        Field(Field &&) = delete;
        Field &operator=(Field &&) = delete;

        /// Diagnostic key, not required to be unique.
        [[nodiscard]] const std::string &key() const { return _key; }

        /// Declared value type of the field, diagnostic only.
        [[nodiscard]] const std::optional<std::string> &annotation() const { return _annotation; }

        [[nodiscard]] Value get() const;

        /// @throws UnsupportedOperation when the field has no mutator
        void set(const Value &value);

        [[nodiscard]] bool has_mutator() const { return static_cast<bool>(_mutator); }

        /**
         * Make this field a dependent of other: marking other dirty marks this field dirty.
         * @throws ConfigurationError when the edge would close a cycle
         */
        void add_dependency(Field &other);

        void remove_dependency(Field &other);

        /// Direct dependency test.
        [[nodiscard]] bool depends_on(const Field &other) const;

        [[nodiscard]] std::size_t dependent_count() const { return _dependents.size(); }

        /**
         * Marks the field dirty with source and propagates to every dependent. An already dirty field is
         * propagated (and registered with the coordinator) again, so in diamond shaped graphs a field can be
         * reached more than once.
         */
        void mark_dirty(Provenance source = nullptr);

        [[nodiscard]] bool is_dirty() const { return _dirty; }

        [[nodiscard]] Provenance dirty_source() const { return _dirty_source; }

        /// Subscribe to flushes, the returned callable removes exactly this subscription.
        [[nodiscard]] Unsubscribe on_change(Listener listener);

        [[nodiscard]] std::size_t listener_count() const;

        /// Informs every listener with the dirty source, then clears the dirty state. No-op when clean.
        void flush();

        [[nodiscard]] FieldClearingCoordinator &coordinator() const { return *_coordinator; }

        // ========== Derived fields ==========

        /// Element-wise projection of a sequence valued field, fn receives (element, index).
        [[nodiscard]] field_s_ptr map(std::function<Value(const Value &, int64_t)> fn);

        [[nodiscard]] field_s_ptr transform(std::function<Value(const Value &)> fn);

        [[nodiscard]] field_s_ptr eq(Value value);

        /// Re-invocation with leading arguments bound, keeps the mutator if this field has one.
        [[nodiscard]] field_s_ptr bind(Arguments arguments);

        [[nodiscard]] field_s_ptr operator()(Arguments arguments) { return bind(std::move(arguments)); }

    private:
        struct ListenerList {
            std::vector<std::pair<std::size_t, Listener>> entries;
            std::size_t next_id{0};
        };

        [[nodiscard]] bool reaches(const Field &target) const;

        std::string _key;
        Accessor _accessor;
        Mutator _mutator;
        std::optional<std::string> _annotation;
        FieldClearingCoordinator *_coordinator;
        bool _dirty{false};
        Provenance _dirty_source{nullptr};
        std::unordered_set<Field *> _dependents;
        std::unordered_set<Field *> _dependencies;
        std::shared_ptr<ListenerList> _listeners;  // Allocated on first subscription
    };

} // namespace statex

#endif // STATEX_TYPES_FIELD_H
