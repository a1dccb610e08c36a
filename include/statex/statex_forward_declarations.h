#ifndef STATEX_FORWARD_DECLARATIONS_H
#define STATEX_FORWARD_DECLARATIONS_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace statex {
    class Value;
    using Arguments = std::vector<Value>;

    struct Record;
    class RecordType;
    using record_type_s_ptr = std::shared_ptr<const RecordType>;

    // Wrapped composites - always shared, parents and fields hold them weakly
    class Observable;
    using observable_ptr = Observable*;
    using observable_s_ptr = std::shared_ptr<Observable>;

    class ObservableRecord;
    using observable_record_s_ptr = std::shared_ptr<ObservableRecord>;

    class ObservableList;
    using observable_list_s_ptr = std::shared_ptr<ObservableList>;

    class ObservableDict;
    using observable_dict_s_ptr = std::shared_ptr<ObservableDict>;

    class EventBus;
    using SubscriptionId = std::size_t;

    // Reactive field nodes
    class Field;
    using field_ptr = Field*;
    using field_s_ptr = std::shared_ptr<Field>;

    class FieldFactory;

    // Runtime
    class CallBoundaryBatcher;
    using call_boundary_batcher_s_ptr = std::shared_ptr<CallBoundaryBatcher>;

    struct FieldClearingCoordinator;
    using field_clearing_coordinator_ptr = FieldClearingCoordinator*;

    struct PropagationObserver;

    /// Opaque, caller supplied change-origin token. Compared by identity only.
    using Provenance = const void*;
} // namespace statex

#endif //STATEX_FORWARD_DECLARATIONS_H
