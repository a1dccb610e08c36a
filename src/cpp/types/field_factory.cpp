#include <statex/types/field_factory.h>
#include <statex/types/observable.h>
#include <statex/util/errors.h>
#include <statex/util/scope.h>

namespace statex {

    namespace {
        observable_record_s_ptr lock_source(const std::weak_ptr<ObservableRecord> &source, std::string_view name) {
            auto record = source.lock();
            if (!record) { throw_error<LookupError>("Field '{}' outlived its record", name); }
            return record;
        }
    } // namespace

    FieldFactory::FieldFactory(ObservableRecord &source) : _source{source} {}

    field_s_ptr FieldFactory::get(std::string_view name) {
        if (auto it = _fields.find(name); it != _fields.end()) { return it->second; }

        std::string key{name};
        const auto &type = _source.type();
        if (type && type->find_computed(name)) { return make_computed_field(key); }
        if (type && type->find_method(name)) {
            throw_error<ConfigurationError>("{} method is not registered as a computed field", name);
        }
        if (!_source.has_member(name)) { throw_error<LookupError>("'{}' has no member '{}'", _source.type_name(), name); }
        return make_data_field(key);
    }

    field_s_ptr FieldFactory::make_data_field(const std::string &name) {
        std::weak_ptr<ObservableRecord> source = std::static_pointer_cast<ObservableRecord>(_source.shared_from_this());
        const auto &type = _source.type();
        auto field = std::make_shared<Field>(
            name, [source, name](const Arguments &) { return lock_source(source, name)->get(name); },
            [source, name](const Arguments &, const Value &value) { lock_source(source, name)->set(name, value); },
            Field::Dependencies{}, type ? type->annotation(name) : std::nullopt, &_source.coordinator());

        _source.on_event(name, [weak_field = std::weak_ptr<Field>{field}] {
            if (auto target = weak_field.lock()) { target->mark_dirty(); }
        });
        _fields.emplace(name, field);
        if (!_created.empty()) { _created.push_back(name); }
        return field;
    }

    field_s_ptr FieldFactory::make_computed_field(const std::string &name) {
        std::weak_ptr<ObservableRecord> source = std::static_pointer_cast<ObservableRecord>(_source.shared_from_this());
        const auto *computed = _source.type()->find_computed(name);
        auto field = std::make_shared<Field>(
            name,
            [source, name](const Arguments &arguments) { return lock_source(source, name)->compute(name, arguments); },
            Field::Mutator{}, Field::Dependencies{}, computed->annotation, &_source.coordinator());

        // Cached before the dependencies are resolved, so a dependency cycle hits the cycle check
        bool outermost = _created.empty();
        auto created_before = _created.size();
        _fields.emplace(name, field);
        _created.push_back(name);
        // Drops everything this resolution created, the released fields unlink their edges
        auto uncache = make_scope_fail([this, created_before] {
            for (auto i = created_before; i < _created.size(); ++i) { _fields.erase(_created[i]); }
            _created.resize(created_before);
        });
        for (const auto &dependency : computed->dependencies) { field->add_dependency(*get(dependency)); }
        if (outermost) { _created.clear(); }
        return field;
    }

} // namespace statex
