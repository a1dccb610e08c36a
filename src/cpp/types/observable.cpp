#include <statex/types/field_factory.h>
#include <statex/types/observable.h>
#include <statex/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace statex {

    // ============================================================================
    // Observable
    // ============================================================================

    Observable::Observable(call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator)
        : _batcher{batcher ? std::move(batcher) : std::make_shared<CallBoundaryBatcher>()},
          _coordinator{coordinator ? coordinator : &default_coordinator()} {}

    SubscriptionId Observable::on_event(std::string_view key, EventBus::Callback callback) {
        return _event_bus.subscribe(key, std::move(callback));
    }

    void Observable::unsubscribe(std::string_view key, SubscriptionId id) { _event_bus.unsubscribe(key, id); }

    void Observable::notify(std::string_view key) {
        _event_bus.emit(key);
        if (key != WHOLE_VALUE_KEY) { _event_bus.emit(WHOLE_VALUE_KEY); }
    }

    void Observable::make_root(const observable_s_ptr &observable) { observable->_root = observable; }

    Value Observable::adopt(Value value, std::string_view slot_key) {
        observable_s_ptr child;
        switch (value.kind()) {
            case ValueKind::LIST:
                child.reset(new ObservableList(value.plain_list(), _batcher, _coordinator));
                break;
            case ValueKind::DICT:
                child.reset(new ObservableDict(value.plain_dict(), _batcher, _coordinator));
                break;
            case ValueKind::RECORD:
                child.reset(new ObservableRecord(value.plain_record(), _batcher, _coordinator));
                break;
            default:
                // None, primitives and already wrapped values are stored as given
                return value;
        }

        child->_root = _root;
        child->adopt_contents();
        child->on_event(WHOLE_VALUE_KEY, [parent = weak_from_this(), key = std::string{slot_key}] {
            if (auto owner = parent.lock()) { owner->notify(key); }
        });
        return Value{std::move(child)};
    }

    // ============================================================================
    // ObservableRecord
    // ============================================================================

    ObservableRecord::ObservableRecord(Record record, call_boundary_batcher_s_ptr batcher,
                                       FieldClearingCoordinator *coordinator)
        : Observable(std::move(batcher), coordinator), _record{std::move(record)} {}

    ObservableRecord::~ObservableRecord() = default;

    observable_record_s_ptr ObservableRecord::wrap(Record record, FieldClearingCoordinator *coordinator) {
        auto observable = observable_record_s_ptr(new ObservableRecord(std::move(record), nullptr, coordinator));
        make_root(observable);
        observable->adopt_contents();
        return observable;
    }

    void ObservableRecord::adopt_contents() {
        for (auto &[name, value] : _record.members) {
            if (is_private(name)) { continue; }
            value = adopt(value, name);
        }
    }

    bool ObservableRecord::has_member(std::string_view name) const {
        return _record.members.find(name) != _record.members.end();
    }

    std::vector<std::string> ObservableRecord::member_names() const {
        std::vector<std::string> names;
        names.reserve(_record.members.size());
        for (const auto &[name, _] : _record.members) { names.push_back(name); }
        return names;
    }

    Value ObservableRecord::get(std::string_view name) {
        if (auto it = _record.members.find(name); it != _record.members.end()) { return it->second; }
        if (const auto &type = _record.type) {
            if (type->find_computed(name)) { return compute(name, {}); }
            if (type->find_method(name)) {
                throw_error<ConfigurationError>("'{}.{}' is a method, use call()", type_name(), name);
            }
        }
        throw_error<LookupError>("'{}' has no member '{}'", type_name(), name);
    }

    Value ObservableRecord::compute(std::string_view name, const Arguments &arguments) {
        auto type = _record.type;
        const auto *computed = type ? type->find_computed(name) : nullptr;
        if (!computed) { throw_error<LookupError>("'{}' has no computed member '{}'", type_name(), name); }
        auto self = std::static_pointer_cast<ObservableRecord>(shared_from_this());
        return batcher().invoke(name, [&] { return computed->compute(*self, arguments); });
    }

    void ObservableRecord::set(std::string_view name, Value value) {
        if (name.empty() || name == WHOLE_VALUE_KEY) {
            throw_error<ConfigurationError>("'{}' is not a valid member name", name);
        }
        if (_record.type && _record.type->is_callable(name)) {
            throw_error<ConfigurationError>("Cannot assign to callable member '{}.{}'", type_name(), name);
        }
        if (is_private(name)) {
            _record.members.insert_or_assign(std::string{name}, std::move(value));
            return;
        }
        auto adopted = adopt(std::move(value), name);
        _record.members.insert_or_assign(std::string{name}, std::move(adopted));
        notify(name);
    }

    Value ObservableRecord::call(std::string_view name, const Arguments &arguments) {
        auto type = _record.type;
        const auto *method = type ? type->find_method(name) : nullptr;
        if (!method) {
            if (type && type->find_computed(name)) { return compute(name, arguments); }
            throw_error<LookupError>("'{}' has no method '{}'", type_name(), name);
        }
        auto self = std::static_pointer_cast<ObservableRecord>(shared_from_this());
        return batcher().invoke(name, [&] { return method->body(*self, arguments); });
    }

    FieldFactory &ObservableRecord::fields() {
        if (!_fields) { _fields = std::make_unique<FieldFactory>(*this); }
        return *_fields;
    }

    bool ObservableRecord::equals(const Observable &other) const { return this == &other; }

    std::string ObservableRecord::to_string() const {
        std::vector<std::string> members;
        members.reserve(_record.members.size());
        for (const auto &[name, value] : _record.members) { members.push_back(fmt::format("{}={}", name, value)); }
        return fmt::format("{}({})", type_name(), fmt::join(members, ", "));
    }

    // ============================================================================
    // ObservableList
    // ============================================================================

    ObservableList::ObservableList(List items, call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator)
        : Observable(std::move(batcher), coordinator), _items{std::move(items)} {}

    void ObservableList::adopt_contents() {
        for (auto &item : _items) { item = adopt(item, WHOLE_VALUE_KEY); }
    }

    std::size_t ObservableList::resolve(int64_t index) const {
        auto size = static_cast<int64_t>(_items.size());
        auto resolved = index < 0 ? index + size : index;
        if (resolved < 0 || resolved >= size) {
            throw_error<LookupError>("list index {} out of range for size {}", index, size);
        }
        return static_cast<std::size_t>(resolved);
    }

    const Value &ObservableList::at(int64_t index) const { return _items[resolve(index)]; }

    void ObservableList::set(int64_t index, Value value) {
        auto position = resolve(index);
        _items[position] = adopt(std::move(value), WHOLE_VALUE_KEY);
        notify(WHOLE_VALUE_KEY);
    }

    void ObservableList::insert(int64_t index, Value value) {
        auto size = static_cast<int64_t>(_items.size());
        auto position = index < 0 ? std::max<int64_t>(0, index + size) : std::min(index, size);
        _items.insert(_items.begin() + position, adopt(std::move(value), WHOLE_VALUE_KEY));
        notify(WHOLE_VALUE_KEY);
    }

    void ObservableList::append(Value value) {
        _items.push_back(adopt(std::move(value), WHOLE_VALUE_KEY));
        notify(WHOLE_VALUE_KEY);
    }

    void ObservableList::erase(int64_t index) {
        auto position = resolve(index);
        _items.erase(_items.begin() + static_cast<std::ptrdiff_t>(position));
        notify(WHOLE_VALUE_KEY);
    }

    Value ObservableList::pop(int64_t index) {
        if (_items.empty()) { throw_error<LookupError>("pop from empty list"); }
        auto position = resolve(index);
        Value value = std::move(_items[position]);
        _items.erase(_items.begin() + static_cast<std::ptrdiff_t>(position));
        notify(WHOLE_VALUE_KEY);
        return value;
    }

    void ObservableList::remove(const Value &value) {
        auto it = std::find(_items.begin(), _items.end(), value);
        if (it == _items.end()) { throw_error<LookupError>("{} is not in list", value); }
        _items.erase(it);
        notify(WHOLE_VALUE_KEY);
    }

    void ObservableList::clear() {
        _items.clear();
        notify(WHOLE_VALUE_KEY);
    }

    bool ObservableList::equals(const Observable &other) const {
        if (this == &other) { return true; }
        if (other.kind() != ObservableKind::SEQUENCE) { return false; }
        return _items == static_cast<const ObservableList &>(other)._items;
    }

    std::string ObservableList::to_string() const { return fmt::format("[{}]", fmt::join(_items, ", ")); }

    // ============================================================================
    // ObservableDict
    // ============================================================================

    ObservableDict::ObservableDict(Dict items, call_boundary_batcher_s_ptr batcher, FieldClearingCoordinator *coordinator)
        : Observable(std::move(batcher), coordinator), _items{std::move(items)} {}

    void ObservableDict::adopt_contents() {
        for (auto &[_, value] : _items) { value = adopt(value, WHOLE_VALUE_KEY); }
    }

    const Value &ObservableDict::at(std::string_view key) const {
        auto it = _items.find(key);
        if (it == _items.end()) { throw_error<LookupError>("key '{}' not found", key); }
        return it->second;
    }

    Value ObservableDict::get(std::string_view key, Value fallback) const {
        auto it = _items.find(key);
        return it == _items.end() ? std::move(fallback) : it->second;
    }

    std::vector<std::string> ObservableDict::keys() const {
        std::vector<std::string> keys;
        keys.reserve(_items.size());
        for (const auto &[key, _] : _items) { keys.push_back(key); }
        return keys;
    }

    void ObservableDict::set(std::string_view key, Value value) {
        _items.insert_or_assign(std::string{key}, adopt(std::move(value), WHOLE_VALUE_KEY));
        notify(WHOLE_VALUE_KEY);
    }

    void ObservableDict::erase(std::string_view key) {
        auto it = _items.find(key);
        if (it == _items.end()) { throw_error<LookupError>("key '{}' not found", key); }
        _items.erase(it);
        notify(WHOLE_VALUE_KEY);
    }

    Value ObservableDict::pop(std::string_view key) {
        auto it = _items.find(key);
        if (it == _items.end()) { throw_error<LookupError>("key '{}' not found", key); }
        Value value = std::move(it->second);
        _items.erase(it);
        notify(WHOLE_VALUE_KEY);
        return value;
    }

    void ObservableDict::clear() {
        _items.clear();
        notify(WHOLE_VALUE_KEY);
    }

    bool ObservableDict::equals(const Observable &other) const {
        if (this == &other) { return true; }
        if (other.kind() != ObservableKind::ASSOCIATIVE) { return false; }
        return _items == static_cast<const ObservableDict &>(other)._items;
    }

    std::string ObservableDict::to_string() const {
        std::vector<std::string> entries;
        entries.reserve(_items.size());
        for (const auto &[key, value] : _items) { entries.push_back(fmt::format("'{}': {}", key, value)); }
        return fmt::format("{{{}}}", fmt::join(entries, ", "));
    }

} // namespace statex
