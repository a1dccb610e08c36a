#include <statex/types/field.h>
#include <statex/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace statex {

    Field::Field(std::string key, Accessor accessor, Mutator mutator, Dependencies dependencies,
                 std::optional<std::string> annotation, FieldClearingCoordinator *coordinator)
        : _key{std::move(key)}, _accessor{std::move(accessor)}, _mutator{std::move(mutator)},
          _annotation{std::move(annotation)}, _coordinator{coordinator ? coordinator : &default_coordinator()} {
        for (const auto &dependency : dependencies) {
            if (dependency) { add_dependency(*dependency); }
        }
    }

    Field::~Field() {
        for (auto *dependency : _dependencies) { dependency->_dependents.erase(this); }
        for (auto *dependent : _dependents) { dependent->_dependencies.erase(this); }
    }

    Value Field::get() const { return _accessor(Arguments{}); }

    void Field::set(const Value &value) {
        if (!_mutator) { throw_error<UnsupportedOperation>("Field '{}' has no set method", _key); }
        _mutator(Arguments{}, value);
    }

    bool Field::reaches(const Field &target) const {
        std::vector<const Field *> pending{this};
        std::unordered_set<const Field *> visited;
        while (!pending.empty()) {
            auto *current = pending.back();
            pending.pop_back();
            if (current == &target) { return true; }
            if (!visited.insert(current).second) { continue; }
            for (auto *dependent : current->_dependents) { pending.push_back(dependent); }
        }
        return false;
    }

    void Field::add_dependency(Field &other) {
        if (&other == this || reaches(other)) {
            throw_error<ConfigurationError>("Dependency of '{}' on '{}' would create a cycle", _key, other._key);
        }
        other._dependents.insert(this);
        _dependencies.insert(&other);
    }

    void Field::remove_dependency(Field &other) {
        other._dependents.erase(this);
        _dependencies.erase(&other);
    }

    bool Field::depends_on(const Field &other) const { return _dependencies.contains(const_cast<Field *>(&other)); }

    void Field::mark_dirty(Provenance source) {
        auto keep_alive = weak_from_this().lock();
        _dirty = true;
        _dirty_source = source;
        // Snapshot, a flush triggered below may add or remove edges or release a dependent
        std::vector<Field *> dependents{_dependents.begin(), _dependents.end()};
        for (auto *dependent : dependents) {
            // A released dependent unlinks itself in its destructor
            if (!_dependents.contains(dependent)) { continue; }
            auto keep_dependent = dependent->weak_from_this().lock();
            dependent->mark_dirty(source);
        }
        _coordinator->add_dirty(*this);
    }

    Field::Unsubscribe Field::on_change(Listener listener) {
        if (!_listeners) { _listeners = std::make_shared<ListenerList>(); }
        auto id = _listeners->next_id++;
        _listeners->entries.emplace_back(id, std::move(listener));
        return [listeners = std::weak_ptr<ListenerList>{_listeners}, id] {
            if (auto list = listeners.lock()) {
                std::erase_if(list->entries, [id](const auto &entry) { return entry.first == id; });
            }
        };
    }

    std::size_t Field::listener_count() const { return _listeners ? _listeners->entries.size() : 0; }

    void Field::flush() {
        if (!_dirty) { return; }
        auto keep_alive = weak_from_this().lock();
        if (_listeners) {
            auto snapshot = _listeners->entries;
            for (const auto &[_, listener] : snapshot) { listener(_dirty_source); }
        }
        _dirty = false;
        _dirty_source = nullptr;
    }

    field_s_ptr Field::map(std::function<Value(const Value &, int64_t)> fn) {
        auto source = shared_from_this();
        return std::make_shared<Field>(
            fmt::format("{}.map", _key),
            [source, fn = std::move(fn)](const Arguments &) {
                auto value = source->get();
                const auto *items = value.sequence_items();
                if (!items) { throw bad_expected_type<List>(value.kind_name()); }
                List result;
                result.reserve(items->size());
                int64_t index = 0;
                for (const auto &item : *items) { result.push_back(fn(item, index++)); }
                return Value{std::move(result)};
            },
            Mutator{}, Dependencies{source}, std::nullopt, _coordinator);
    }

    field_s_ptr Field::transform(std::function<Value(const Value &)> fn) {
        auto source = shared_from_this();
        return std::make_shared<Field>(
            fmt::format("{}.transform", _key),
            [source, fn = std::move(fn)](const Arguments &) { return fn(source->get()); },
            Mutator{}, Dependencies{source}, std::nullopt, _coordinator);
    }

    field_s_ptr Field::eq(Value value) {
        auto source = shared_from_this();
        auto key = fmt::format("{}.eq({})", _key, value);
        return std::make_shared<Field>(
            std::move(key),
            [source, value = std::move(value)](const Arguments &) { return Value{source->get() == value}; },
            Mutator{}, Dependencies{source}, std::string{"bool"}, _coordinator);
    }

    field_s_ptr Field::bind(Arguments arguments) {
        auto source = shared_from_this();
        auto key = fmt::format("{}({})", _key, fmt::join(arguments, ", "));
        auto bound = std::make_shared<const Arguments>(std::move(arguments));
        auto with_bound = [bound](const Arguments &more) {
            Arguments all{*bound};
            all.insert(all.end(), more.begin(), more.end());
            return all;
        };

        Mutator mutator;
        if (_mutator) {
            mutator = [source, with_bound](const Arguments &more, const Value &value) {
                source->_mutator(with_bound(more), value);
            };
        }
        return std::make_shared<Field>(
            std::move(key),
            [source, with_bound](const Arguments &more) { return source->_accessor(with_bound(more)); },
            std::move(mutator), Dependencies{source}, _annotation, _coordinator);
    }

} // namespace statex
