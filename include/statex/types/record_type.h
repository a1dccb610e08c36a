#ifndef STATEX_TYPES_RECORD_TYPE_H
#define STATEX_TYPES_RECORD_TYPE_H

#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/types/value.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace statex {

    using ComputeFn = std::function<Value(ObservableRecord &, const Arguments &)>;
    using MethodFn = std::function<Value(ObservableRecord &, const Arguments &)>;

    struct DataMember {
        std::string name;
        std::function<Value()> initial;
        std::optional<std::string> annotation;
    };

    /// A callable member registered as a reactive field, refreshed when any of its dependencies change.
    struct ComputedMember {
        std::string name;
        ComputeFn compute;
        std::vector<std::string> dependencies;
        std::optional<std::string> annotation;
    };

    /// A callable member that is instrumented but cannot be requested as a field.
    struct MethodMember {
        std::string name;
        MethodFn body;
    };

    /**
     * The declaration of a record kind: data members with defaults, computed members with their
     * dependency names, and methods. Immutable once built and shared by every instance.
     */
    class STATEX_EXPORT RecordType : public std::enable_shared_from_this<RecordType> {
    public:
        [[nodiscard]] const std::string &name() const { return _name; }

        [[nodiscard]] const std::vector<DataMember> &data_members() const { return _data_members; }

        [[nodiscard]] const std::vector<ComputedMember> &computed_members() const { return _computed_members; }

        [[nodiscard]] const std::vector<MethodMember> &methods() const { return _methods; }

        [[nodiscard]] const DataMember *find_data_member(std::string_view name) const;

        [[nodiscard]] const ComputedMember *find_computed(std::string_view name) const;

        [[nodiscard]] const MethodMember *find_method(std::string_view name) const;

        /// True for computed members and methods.
        [[nodiscard]] bool is_callable(std::string_view name) const {
            return find_computed(name) != nullptr || find_method(name) != nullptr;
        }

        /// Declared type of a data or computed member, if any.
        [[nodiscard]] std::optional<std::string> annotation(std::string_view name) const;

        /// A fresh, unwrapped instance holding a private copy of every default.
        [[nodiscard]] Record instantiate() const;

    private:
        friend class RecordTypeBuilder;

        explicit RecordType(std::string name) : _name{std::move(name)} {}

        std::string _name;
        std::vector<DataMember> _data_members;
        std::vector<ComputedMember> _computed_members;
        std::vector<MethodMember> _methods;
    };

    /**
     * Builds the registration table of a record kind.
     *
     * @code
     * auto counter = RecordTypeBuilder("Counter")
     *     .field("count", 1, "int")
     *     .computed("doubled", [](ObservableRecord &self) { return self.get("count").as_int() * 2; }, {"count"})
     *     .method("increment", [](ObservableRecord &self, const Arguments &) {
     *         self.set("count", self.get("count").as_int() + 1);
     *         return Value{};
     *     })
     *     .build();
     * @endcode
     */
    class STATEX_EXPORT RecordTypeBuilder {
    public:
        explicit RecordTypeBuilder(std::string name);

        /// Data member whose default is deep-copied into each instance.
        RecordTypeBuilder &field(std::string name, Value initial = {}, std::optional<std::string> annotation = std::nullopt);

        /// Data member whose default is produced per instance by factory.
        RecordTypeBuilder &field_factory(std::string name, std::function<Value()> factory,
                                         std::optional<std::string> annotation = std::nullopt);

        RecordTypeBuilder &computed(std::string name, std::function<Value(ObservableRecord &)> compute,
                                    std::vector<std::string> dependencies = {},
                                    std::optional<std::string> annotation = std::nullopt);

        RecordTypeBuilder &computed_with_arguments(std::string name, ComputeFn compute,
                                                   std::vector<std::string> dependencies = {},
                                                   std::optional<std::string> annotation = std::nullopt);

        RecordTypeBuilder &method(std::string name, MethodFn body);

        /**
         * @throws ConfigurationError on duplicate member names, members named with the reserved
         *         whole-value key, dependencies that name no data or computed member, or computed members
         *         whose dependencies form a cycle
         */
        [[nodiscard]] record_type_s_ptr build();

    private:
        std::string _name;
        std::vector<DataMember> _data_members;
        std::vector<ComputedMember> _computed_members;
        std::vector<MethodMember> _methods;
    };

} // namespace statex

#endif // STATEX_TYPES_RECORD_TYPE_H
