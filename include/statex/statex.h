#ifndef STATEX_STATEX_H
#define STATEX_STATEX_H

#include <statex/runtime/call_boundary_batcher.h>
#include <statex/runtime/field_clearing_coordinator.h>
#include <statex/runtime/observers/propagation_trace.h>
#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/types/event_bus.h>
#include <statex/types/field.h>
#include <statex/types/field_factory.h>
#include <statex/types/observable.h>
#include <statex/types/record_type.h>
#include <statex/types/value.h>
#include <statex/util/errors.h>

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace statex {

    /// Wrap the record produced by factory as the root of a new wrapped-object graph.
    STATEX_EXPORT observable_record_s_ptr use_state(const std::function<Record()> &factory,
                                                    FieldClearingCoordinator *coordinator = nullptr);

    /// Wrap a fresh instance of type.
    STATEX_EXPORT observable_record_s_ptr use_state(const record_type_s_ptr &type,
                                                    FieldClearingCoordinator *coordinator = nullptr);

    /**
     * The field factory of a wrapped record.
     * @throws ConfigurationError when the argument is not a wrapped record
     */
    STATEX_EXPORT FieldFactory &fields(const observable_s_ptr &observable);

    STATEX_EXPORT FieldFactory &fields(const observable_record_s_ptr &record);

    STATEX_EXPORT FieldFactory &fields(const Value &value);

    /// Any other wrapper handle, list and dict wrappers raise ConfigurationError.
    template<typename T>
        requires std::derived_from<T, Observable>
    FieldFactory &fields(const std::shared_ptr<T> &observable) {
        return fields(observable_s_ptr{observable});
    }

    /// A standalone computed field over dependencies.
    STATEX_EXPORT field_s_ptr use_calc(std::function<Value()> compute, Field::Dependencies dependencies = {},
                                       FieldClearingCoordinator *coordinator = nullptr);

    /**
     * A standalone mutable field holding its own value. Setting it stores the value and marks the field
     * dirty. The annotation defaults to the kind of the initial value.
     */
    STATEX_EXPORT field_s_ptr use_field(const std::string &name, Value initial = {},
                                        Field::Dependencies dependencies = {},
                                        std::optional<std::string> annotation = std::nullopt,
                                        FieldClearingCoordinator *coordinator = nullptr);

    /// Set the field's value, then mark it dirty with an explicit provenance.
    STATEX_EXPORT void set_field(Field &field, const Value &value, Provenance source = nullptr);

} // namespace statex

#endif // STATEX_STATEX_H
