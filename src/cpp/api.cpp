#include <statex/statex.h>

#include <fmt/format.h>

#include <atomic>

namespace statex {

    observable_record_s_ptr use_state(const std::function<Record()> &factory, FieldClearingCoordinator *coordinator) {
        return ObservableRecord::wrap(factory(), coordinator);
    }

    observable_record_s_ptr use_state(const record_type_s_ptr &type, FieldClearingCoordinator *coordinator) {
        if (!type) { throw_error<ConfigurationError>("use_state requires a record type"); }
        return ObservableRecord::wrap(type->instantiate(), coordinator);
    }

    FieldFactory &fields(const observable_s_ptr &observable) {
        if (!observable || observable->kind() != ObservableKind::RECORD) {
            throw_error<ConfigurationError>("fields() requires a wrapped record");
        }
        return static_cast<ObservableRecord &>(*observable).fields();
    }

    FieldFactory &fields(const observable_record_s_ptr &record) {
        if (!record) { throw_error<ConfigurationError>("fields() requires a wrapped record"); }
        return record->fields();
    }

    FieldFactory &fields(const Value &value) {
        if (!value.is_observable()) {
            throw_error<ConfigurationError>("fields() requires a wrapped record, got {}", value.kind_name());
        }
        return fields(value.as_observable());
    }

    field_s_ptr use_calc(std::function<Value()> compute, Field::Dependencies dependencies,
                         FieldClearingCoordinator *coordinator) {
        static std::atomic<std::size_t> next_id{0};
        return std::make_shared<Field>(
            fmt::format("use_calc({})", next_id++),
            [compute = std::move(compute)](const Arguments &) { return compute(); }, Field::Mutator{},
            std::move(dependencies), std::nullopt, coordinator);
    }

    field_s_ptr use_field(const std::string &name, Value initial, Field::Dependencies dependencies,
                          std::optional<std::string> annotation, FieldClearingCoordinator *coordinator) {
        if (!annotation) { annotation = std::string{initial.kind_name()}; }
        auto holder = std::make_shared<Value>(std::move(initial));
        // The mutator marks its own field dirty, but must not keep it alive
        auto self = std::make_shared<std::weak_ptr<Field>>();
        auto field = std::make_shared<Field>(
            fmt::format("use_field({})", name), [holder](const Arguments &) { return *holder; },
            [holder, self](const Arguments &, const Value &value) {
                *holder = value;
                if (auto target = self->lock()) { target->mark_dirty(); }
            },
            std::move(dependencies), std::move(annotation), coordinator);
        *self = field;
        return field;
    }

    void set_field(Field &field, const Value &value, Provenance source) {
        field.set(value);
        field.mark_dirty(source);
    }

} // namespace statex
