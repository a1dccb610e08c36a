#ifndef STATEX_TYPES_VALUE_H
#define STATEX_TYPES_VALUE_H

#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>
#include <statex/util/date_time.h>

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace statex {

    using Bytes = std::vector<std::uint8_t>;

    /// A class-like marker value (the "type" objects of the wrapped state). Never wrapped.
    struct TypeMarker {
        std::string name;

        bool operator==(const TypeMarker &) const = default;
    };

    /// A member of an enumeration. Never wrapped.
    struct EnumConstant {
        std::string type;
        std::string name;
        int64_t ordinal{0};

        bool operator==(const EnumConstant &) const = default;
    };

    enum class ValueKind : uint8_t {
        NONE,
        BOOL,
        INT,
        DOUBLE,
        STRING,
        BYTES,
        DATE_TIME,
        DATE,
        TYPE_MARKER,
        ENUM,
        LIST,
        DICT,
        RECORD,
        OBSERVABLE,
    };

    STATEX_EXPORT std::string_view to_string(ValueKind kind);

    using List = std::vector<Value>;
    using Dict = std::map<std::string, Value, std::less<>>;

    /**
     * Dynamically typed value stored in (and read out of) wrapped state.
     *
     * Primitive kinds (none .. enum) are held by value and pass through the observing layer untouched.
     * Plain composites (list, dict, record) are held by shared pointer, so copies alias the same container,
     * and are converted into wrapped composites when they are assigned into a wrapped slot.
     */
    class STATEX_EXPORT Value {
    public:
        using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Bytes, date_time_t, date_t,
                                     TypeMarker, EnumConstant, std::shared_ptr<List>, std::shared_ptr<Dict>,
                                     std::shared_ptr<Record>, observable_s_ptr>;

        Value() = default;

        Value(std::nullptr_t) {}

        Value(bool value) : _storage{value} {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T value) : _storage{static_cast<int64_t>(value)} {}

        template<std::floating_point T>
        Value(T value) : _storage{static_cast<double>(value)} {}

        Value(const char *value) : _storage{std::string{value}} {}

        Value(std::string value) : _storage{std::move(value)} {}

        Value(std::string_view value) : _storage{std::string{value}} {}

        Value(Bytes value) : _storage{std::move(value)} {}

        Value(date_time_t value) : _storage{value} {}

        Value(date_t value) : _storage{value} {}

        Value(TypeMarker value) : _storage{std::move(value)} {}

        Value(EnumConstant value) : _storage{std::move(value)} {}

        Value(List value);

        Value(Dict value);

        Value(Record value);

        template<typename T>
            requires std::derived_from<T, Observable>
        Value(std::shared_ptr<T> value) : _storage{observable_s_ptr{std::move(value)}} {
            if (!std::get<observable_s_ptr>(_storage)) { _storage = std::monostate{}; }
        }

        static Value list(std::initializer_list<Value> items);

        static Value dict(std::initializer_list<std::pair<const std::string, Value>> items);

        [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(_storage.index()); }

        [[nodiscard]] std::string_view kind_name() const { return statex::to_string(kind()); }

        [[nodiscard]] bool is_none() const { return kind() == ValueKind::NONE; }

        /// Kinds that are never wrapped: text, numeric, boolean, binary, date/time, type markers, enums.
        [[nodiscard]] bool is_primitive() const;

        /// An unwrapped list, dict or record.
        [[nodiscard]] bool is_plain_composite() const;

        [[nodiscard]] bool is_observable() const { return kind() == ValueKind::OBSERVABLE; }

        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] int64_t as_int() const;

        /// Numeric value, integers are widened.
        [[nodiscard]] double as_double() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] const Bytes &as_bytes() const;

        [[nodiscard]] date_time_t as_date_time() const;

        [[nodiscard]] date_t as_date() const;

        [[nodiscard]] const TypeMarker &as_type_marker() const;

        [[nodiscard]] const EnumConstant &as_enum() const;

        // Plain composites, shared with every copy of this value
        [[nodiscard]] List &plain_list() const;

        [[nodiscard]] Dict &plain_dict() const;

        [[nodiscard]] Record &plain_record() const;

        // Wrapped composites
        [[nodiscard]] const observable_s_ptr &as_observable() const;

        [[nodiscard]] observable_record_s_ptr as_record() const;

        [[nodiscard]] observable_list_s_ptr as_list() const;

        [[nodiscard]] observable_dict_s_ptr as_dict() const;

        /// Elements of a plain or wrapped sequence, nullptr for any other kind.
        [[nodiscard]] const List *sequence_items() const;

        /// Entries of a plain or wrapped associative container, nullptr for any other kind.
        [[nodiscard]] const Dict *mapping_items() const;

        /// Deep copy of plain composites; primitives and wrapped values are returned as is.
        [[nodiscard]] Value clone() const;

        [[nodiscard]] const Storage &storage() const { return _storage; }

        [[nodiscard]] std::string to_string() const;

        bool operator==(const Value &other) const;

    private:
        Storage _storage;
    };

    /**
     * An unwrapped record: the member table of one instance, plus the record type that declares its
     * defaults, computed members and methods. A record without a type is an ad hoc bag of data members.
     */
    struct STATEX_EXPORT Record {
        Record() = default;

        Record(std::initializer_list<std::pair<const std::string, Value>> members);

        explicit Record(record_type_s_ptr type, Dict members = {});

        [[nodiscard]] std::string_view type_name() const;

        bool operator==(const Record &other) const;

        record_type_s_ptr type;
        Dict members;
    };

} // namespace statex

template<>
struct fmt::formatter<statex::Value> : fmt::formatter<std::string> {
    template<typename FormatContext>
    auto format(const statex::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string>::format(value.to_string(), ctx);
    }
};

#endif // STATEX_TYPES_VALUE_H
