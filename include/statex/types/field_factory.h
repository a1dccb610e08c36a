#ifndef STATEX_TYPES_FIELD_FACTORY_H
#define STATEX_TYPES_FIELD_FACTORY_H

#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/types/field.h>

#include <ankerl/unordered_dense.h>

#include <string>
#include <string_view>
#include <vector>

namespace statex {

    /**
     * FieldFactory - lazily materializes one Field per member of a wrapped record.
     *
     * Data members produce a field reading and writing the member, marked dirty whenever the record emits
     * the member's event. Computed members produce a field evaluating the computation, registered as a
     * dependent of the fields of its declared dependencies. Fields are cached for the lifetime of the
     * record, so repeated requests return the identical field.
     *
     * The fields hold the record weakly; reading a field after its record was released raises LookupError.
     * A lookup that fails part way caches none of the fields it created.
     */
    class STATEX_EXPORT FieldFactory {
    public:
        explicit FieldFactory(ObservableRecord &source);

        FieldFactory(const FieldFactory &) = delete;
        FieldFactory &operator=(const FieldFactory &) = delete;

        /**
         * @throws ConfigurationError when name is a method not registered as a computed member, or when a
         *         computed member's dependencies form a cycle
         * @throws LookupError when the record has no member called name
         */
        [[nodiscard]] field_s_ptr get(std::string_view name);

        [[nodiscard]] field_s_ptr operator[](std::string_view name) { return get(name); }

        /// True when the field for name has already been materialized.
        [[nodiscard]] bool contains(std::string_view name) const { return _fields.contains(name); }

        [[nodiscard]] std::size_t size() const { return _fields.size(); }

    private:
        field_s_ptr make_data_field(const std::string &name);

        field_s_ptr make_computed_field(const std::string &name);

        struct string_hash {
            using is_transparent = void;
            using is_avalanching = void;

            [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
                return ankerl::unordered_dense::hash<std::string_view>{}(str);
            }
        };

        ObservableRecord &_source;
        ankerl::unordered_dense::map<std::string, field_s_ptr, string_hash, std::equal_to<>> _fields;
        // Names cached by the computed-field resolution in progress, in creation order
        std::vector<std::string> _created;
    };

} // namespace statex

#endif // STATEX_TYPES_FIELD_FACTORY_H
