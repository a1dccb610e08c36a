#ifndef STATEX_TESTS_CHANGE_TRACKER_H
#define STATEX_TESTS_CHANGE_TRACKER_H

#include <statex/types/field.h>

#include <map>
#include <string>
#include <vector>

namespace statex::testing {

    /**
     * Records, per tracking key, the value a field held and the provenance it was flushed with the last
     * time one of its listeners fired.
     */
    class ChangeTracker {
    public:
        struct Change {
            Value value;
            Provenance source{nullptr};
            int count{0};
        };

        void track(const std::string &key, const field_s_ptr &field) {
            _subscriptions.push_back(field->on_change([this, key, weak = std::weak_ptr<Field>{field}](Provenance source) {
                auto &change = _changes[key];
                if (auto target = weak.lock()) { change.value = target->get(); }
                change.source = source;
                ++change.count;
            }));
        }

        [[nodiscard]] bool changed(const std::string &key) const { return _changes.contains(key); }

        [[nodiscard]] int count(const std::string &key) const {
            auto it = _changes.find(key);
            return it == _changes.end() ? 0 : it->second.count;
        }

        [[nodiscard]] const Change &last(const std::string &key) const { return _changes.at(key); }

        /// Forget what was recorded for key, so the next check only sees later changes.
        void reset(const std::string &key) { _changes.erase(key); }

        void stop() {
            for (auto &unsubscribe : _subscriptions) { unsubscribe(); }
            _subscriptions.clear();
        }

    private:
        std::map<std::string, Change> _changes;
        std::vector<Field::Unsubscribe> _subscriptions;
    };

} // namespace statex::testing

#endif // STATEX_TESTS_CHANGE_TRACKER_H
