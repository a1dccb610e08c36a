#include <statex/types/observable.h>
#include <statex/types/record_type.h>
#include <statex/types/value.h>
#include <statex/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>

namespace statex {

    namespace {
        std::string format_date(date_t date) {
            return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                               static_cast<unsigned>(date.day()));
        }

        std::string format_date_time(date_time_t value) {
            auto days = std::chrono::floor<std::chrono::days>(value);
            std::chrono::hh_mm_ss<time_delta_t> time_of_day{value - days};
            return fmt::format("{} {:02}:{:02}:{:02}.{:06}", format_date(date_t{days}), time_of_day.hours().count(),
                               time_of_day.minutes().count(), time_of_day.seconds().count(),
                               time_of_day.subseconds().count());
        }

        bool is_numeric(ValueKind kind) { return kind == ValueKind::INT || kind == ValueKind::DOUBLE; }
    } // namespace

    std::string_view to_string(ValueKind kind) {
        switch (kind) {
            case ValueKind::NONE: return "none";
            case ValueKind::BOOL: return "bool";
            case ValueKind::INT: return "int";
            case ValueKind::DOUBLE: return "double";
            case ValueKind::STRING: return "string";
            case ValueKind::BYTES: return "bytes";
            case ValueKind::DATE_TIME: return "date_time";
            case ValueKind::DATE: return "date";
            case ValueKind::TYPE_MARKER: return "type";
            case ValueKind::ENUM: return "enum";
            case ValueKind::LIST: return "list";
            case ValueKind::DICT: return "dict";
            case ValueKind::RECORD: return "record";
            case ValueKind::OBSERVABLE: return "observable";
        }
        return "unknown";
    }

    Value::Value(List value) : _storage{std::make_shared<List>(std::move(value))} {}

    Value::Value(Dict value) : _storage{std::make_shared<Dict>(std::move(value))} {}

    Value::Value(Record value) : _storage{std::make_shared<Record>(std::move(value))} {}

    Value Value::list(std::initializer_list<Value> items) { return Value{List(items)}; }

    Value Value::dict(std::initializer_list<std::pair<const std::string, Value>> items) { return Value{Dict(items)}; }

    bool Value::is_primitive() const {
        auto k = kind();
        return k != ValueKind::NONE && k < ValueKind::LIST;
    }

    bool Value::is_plain_composite() const {
        auto k = kind();
        return k == ValueKind::LIST || k == ValueKind::DICT || k == ValueKind::RECORD;
    }

    bool Value::as_bool() const {
        if (auto *v = std::get_if<bool>(&_storage)) { return *v; }
        throw bad_expected_type<bool>(kind_name());
    }

    int64_t Value::as_int() const {
        if (auto *v = std::get_if<int64_t>(&_storage)) { return *v; }
        throw bad_expected_type<int64_t>(kind_name());
    }

    double Value::as_double() const {
        if (auto *v = std::get_if<double>(&_storage)) { return *v; }
        if (auto *v = std::get_if<int64_t>(&_storage)) { return static_cast<double>(*v); }
        throw bad_expected_type<double>(kind_name());
    }

    const std::string &Value::as_string() const {
        if (auto *v = std::get_if<std::string>(&_storage)) { return *v; }
        throw bad_expected_type<std::string>(kind_name());
    }

    const Bytes &Value::as_bytes() const {
        if (auto *v = std::get_if<Bytes>(&_storage)) { return *v; }
        throw bad_expected_type<Bytes>(kind_name());
    }

    date_time_t Value::as_date_time() const {
        if (auto *v = std::get_if<date_time_t>(&_storage)) { return *v; }
        throw bad_expected_type<date_time_t>(kind_name());
    }

    date_t Value::as_date() const {
        if (auto *v = std::get_if<date_t>(&_storage)) { return *v; }
        throw bad_expected_type<date_t>(kind_name());
    }

    const TypeMarker &Value::as_type_marker() const {
        if (auto *v = std::get_if<TypeMarker>(&_storage)) { return *v; }
        throw bad_expected_type<TypeMarker>(kind_name());
    }

    const EnumConstant &Value::as_enum() const {
        if (auto *v = std::get_if<EnumConstant>(&_storage)) { return *v; }
        throw bad_expected_type<EnumConstant>(kind_name());
    }

    List &Value::plain_list() const {
        if (auto *v = std::get_if<std::shared_ptr<List>>(&_storage)) { return **v; }
        throw bad_expected_type<List>(kind_name());
    }

    Dict &Value::plain_dict() const {
        if (auto *v = std::get_if<std::shared_ptr<Dict>>(&_storage)) { return **v; }
        throw bad_expected_type<Dict>(kind_name());
    }

    Record &Value::plain_record() const {
        if (auto *v = std::get_if<std::shared_ptr<Record>>(&_storage)) { return **v; }
        throw bad_expected_type<Record>(kind_name());
    }

    const observable_s_ptr &Value::as_observable() const {
        if (auto *v = std::get_if<observable_s_ptr>(&_storage)) { return *v; }
        throw bad_expected_type<Observable>(kind_name());
    }

    observable_record_s_ptr Value::as_record() const {
        if (auto *v = std::get_if<observable_s_ptr>(&_storage); v && (*v)->kind() == ObservableKind::RECORD) {
            return std::static_pointer_cast<ObservableRecord>(*v);
        }
        throw bad_expected_type<ObservableRecord>(kind_name());
    }

    observable_list_s_ptr Value::as_list() const {
        if (auto *v = std::get_if<observable_s_ptr>(&_storage); v && (*v)->kind() == ObservableKind::SEQUENCE) {
            return std::static_pointer_cast<ObservableList>(*v);
        }
        throw bad_expected_type<ObservableList>(kind_name());
    }

    observable_dict_s_ptr Value::as_dict() const {
        if (auto *v = std::get_if<observable_s_ptr>(&_storage); v && (*v)->kind() == ObservableKind::ASSOCIATIVE) {
            return std::static_pointer_cast<ObservableDict>(*v);
        }
        throw bad_expected_type<ObservableDict>(kind_name());
    }

    const List *Value::sequence_items() const {
        if (auto *v = std::get_if<std::shared_ptr<List>>(&_storage)) { return v->get(); }
        if (auto *v = std::get_if<observable_s_ptr>(&_storage); v && (*v)->kind() == ObservableKind::SEQUENCE) {
            return &static_cast<const ObservableList &>(**v).items();
        }
        return nullptr;
    }

    const Dict *Value::mapping_items() const {
        if (auto *v = std::get_if<std::shared_ptr<Dict>>(&_storage)) { return v->get(); }
        if (auto *v = std::get_if<observable_s_ptr>(&_storage); v && (*v)->kind() == ObservableKind::ASSOCIATIVE) {
            return &static_cast<const ObservableDict &>(**v).items();
        }
        return nullptr;
    }

    Value Value::clone() const {
        switch (kind()) {
            case ValueKind::LIST: {
                List items;
                items.reserve(plain_list().size());
                for (const auto &item : plain_list()) { items.push_back(item.clone()); }
                return Value{std::move(items)};
            }
            case ValueKind::DICT: {
                Dict items;
                for (const auto &[key, item] : plain_dict()) { items.emplace(key, item.clone()); }
                return Value{std::move(items)};
            }
            case ValueKind::RECORD: {
                const auto &record = plain_record();
                Dict members;
                for (const auto &[name, member] : record.members) { members.emplace(name, member.clone()); }
                return Value{Record(record.type, std::move(members))};
            }
            default:
                return *this;
        }
    }

    std::string Value::to_string() const {
        switch (kind()) {
            case ValueKind::NONE: return "None";
            case ValueKind::BOOL: return as_bool() ? "true" : "false";
            case ValueKind::INT: return fmt::format("{}", as_int());
            case ValueKind::DOUBLE: return fmt::format("{}", std::get<double>(_storage));
            case ValueKind::STRING: return fmt::format("'{}'", as_string());
            case ValueKind::BYTES: return fmt::format("bytes[{}]", as_bytes().size());
            case ValueKind::DATE_TIME: return format_date_time(as_date_time());
            case ValueKind::DATE: return format_date(as_date());
            case ValueKind::TYPE_MARKER: return fmt::format("<type {}>", as_type_marker().name);
            case ValueKind::ENUM: return fmt::format("{}.{}", as_enum().type, as_enum().name);
            case ValueKind::LIST: return fmt::format("[{}]", fmt::join(plain_list(), ", "));
            case ValueKind::DICT: {
                std::vector<std::string> entries;
                for (const auto &[key, item] : plain_dict()) { entries.push_back(fmt::format("'{}': {}", key, item)); }
                return fmt::format("{{{}}}", fmt::join(entries, ", "));
            }
            case ValueKind::RECORD: {
                const auto &record = plain_record();
                std::vector<std::string> members;
                for (const auto &[name, member] : record.members) { members.push_back(fmt::format("{}={}", name, member)); }
                return fmt::format("{}({})", record.type_name(), fmt::join(members, ", "));
            }
            case ValueKind::OBSERVABLE: return as_observable()->to_string();
        }
        return {};
    }

    bool Value::operator==(const Value &other) const {
        auto lhs = kind();
        auto rhs = other.kind();
        if (is_numeric(lhs) && is_numeric(rhs)) {
            if (lhs == ValueKind::INT && rhs == ValueKind::INT) { return as_int() == other.as_int(); }
            return as_double() == other.as_double();
        }
        if (auto *items = sequence_items()) {
            auto *other_items = other.sequence_items();
            return other_items && (items == other_items || *items == *other_items);
        }
        if (auto *items = mapping_items()) {
            auto *other_items = other.mapping_items();
            return other_items && (items == other_items || *items == *other_items);
        }
        if (lhs == ValueKind::RECORD && rhs == ValueKind::RECORD) { return plain_record() == other.plain_record(); }
        if (lhs == ValueKind::OBSERVABLE && rhs == ValueKind::OBSERVABLE) {
            return as_observable()->equals(*other.as_observable());
        }
        return _storage == other._storage;
    }

    Record::Record(std::initializer_list<std::pair<const std::string, Value>> members) : members(members) {}

    Record::Record(record_type_s_ptr type, Dict members) : type{std::move(type)}, members{std::move(members)} {}

    std::string_view Record::type_name() const { return type ? std::string_view{type->name()} : "Record"; }

    bool Record::operator==(const Record &other) const {
        if (this == &other) { return true; }
        return type == other.type && members == other.members;
    }

} // namespace statex
