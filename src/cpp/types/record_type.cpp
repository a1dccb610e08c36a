#include <statex/types/observable.h>
#include <statex/types/record_type.h>
#include <statex/util/errors.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace statex {

    namespace {
        template<typename Member>
        const Member *find_member(const std::vector<Member> &members, std::string_view name) {
            auto it = std::find_if(members.begin(), members.end(), [name](const Member &m) { return m.name == name; });
            return it == members.end() ? nullptr : &*it;
        }

        enum class Visit { IN_PROGRESS, DONE };

        // Returns the member at which a cycle closes, or nullptr when the walk from member is acyclic
        const ComputedMember *find_cycle(const std::vector<ComputedMember> &computed, const ComputedMember &member,
                                         std::unordered_map<std::string_view, Visit> &visits) {
            if (auto it = visits.find(member.name); it != visits.end()) {
                return it->second == Visit::IN_PROGRESS ? &member : nullptr;
            }
            visits.emplace(member.name, Visit::IN_PROGRESS);
            for (const auto &dependency : member.dependencies) {
                // Data members are leaves
                if (const auto *next = find_member(computed, dependency)) {
                    if (const auto *closing = find_cycle(computed, *next, visits)) { return closing; }
                }
            }
            visits[member.name] = Visit::DONE;
            return nullptr;
        }
    } // namespace

    const DataMember *RecordType::find_data_member(std::string_view name) const { return find_member(_data_members, name); }

    const ComputedMember *RecordType::find_computed(std::string_view name) const {
        return find_member(_computed_members, name);
    }

    const MethodMember *RecordType::find_method(std::string_view name) const { return find_member(_methods, name); }

    std::optional<std::string> RecordType::annotation(std::string_view name) const {
        if (const auto *data = find_data_member(name)) { return data->annotation; }
        if (const auto *computed = find_computed(name)) { return computed->annotation; }
        return std::nullopt;
    }

    Record RecordType::instantiate() const {
        Record record(shared_from_this());
        for (const auto &member : _data_members) {
            record.members.insert_or_assign(member.name, member.initial ? member.initial() : Value{});
        }
        return record;
    }

    RecordTypeBuilder::RecordTypeBuilder(std::string name) : _name{std::move(name)} {}

    RecordTypeBuilder &RecordTypeBuilder::field(std::string name, Value initial, std::optional<std::string> annotation) {
        _data_members.push_back(
            {std::move(name), [initial = std::move(initial)] { return initial.clone(); }, std::move(annotation)});
        return *this;
    }

    RecordTypeBuilder &RecordTypeBuilder::field_factory(std::string name, std::function<Value()> factory,
                                                        std::optional<std::string> annotation) {
        _data_members.push_back({std::move(name), std::move(factory), std::move(annotation)});
        return *this;
    }

    RecordTypeBuilder &RecordTypeBuilder::computed(std::string name, std::function<Value(ObservableRecord &)> compute,
                                                   std::vector<std::string> dependencies,
                                                   std::optional<std::string> annotation) {
        return computed_with_arguments(
            std::move(name), [compute = std::move(compute)](ObservableRecord &self, const Arguments &) { return compute(self); },
            std::move(dependencies), std::move(annotation));
    }

    RecordTypeBuilder &RecordTypeBuilder::computed_with_arguments(std::string name, ComputeFn compute,
                                                                  std::vector<std::string> dependencies,
                                                                  std::optional<std::string> annotation) {
        _computed_members.push_back({std::move(name), std::move(compute), std::move(dependencies), std::move(annotation)});
        return *this;
    }

    RecordTypeBuilder &RecordTypeBuilder::method(std::string name, MethodFn body) {
        _methods.push_back({std::move(name), std::move(body)});
        return *this;
    }

    record_type_s_ptr RecordTypeBuilder::build() {
        std::unordered_set<std::string> names;
        auto declare = [&](const std::string &name) {
            if (name.empty() || name == Observable::WHOLE_VALUE_KEY) {
                throw_error<ConfigurationError>("Record type '{}' declares an invalid member name '{}'", _name, name);
            }
            if (!names.insert(name).second) {
                throw_error<ConfigurationError>("Record type '{}' declares member '{}' more than once", _name, name);
            }
        };
        for (const auto &member : _data_members) { declare(member.name); }
        for (const auto &member : _computed_members) { declare(member.name); }
        for (const auto &member : _methods) { declare(member.name); }

        for (const auto &member : _computed_members) {
            for (const auto &dependency : member.dependencies) {
                bool known = find_member(_data_members, dependency) != nullptr ||
                             find_member(_computed_members, dependency) != nullptr;
                if (!known) {
                    throw_error<ConfigurationError>("Computed member '{}.{}' depends on unknown member '{}'", _name,
                                                    member.name, dependency);
                }
            }
        }

        std::unordered_map<std::string_view, Visit> visits;
        for (const auto &member : _computed_members) {
            if (const auto *closing = find_cycle(_computed_members, member, visits)) {
                throw_error<ConfigurationError>("Computed members of '{}' form a dependency cycle through '{}'", _name,
                                                closing->name);
            }
        }

        auto type = std::shared_ptr<RecordType>(new RecordType(_name));
        type->_data_members = _data_members;
        type->_computed_members = _computed_members;
        type->_methods = _methods;
        return type;
    }

} // namespace statex
