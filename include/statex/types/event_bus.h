#ifndef STATEX_TYPES_EVENT_BUS_H
#define STATEX_TYPES_EVENT_BUS_H

#include <statex/statex_export.h>
#include <statex/statex_forward_declarations.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace statex {

    /**
     * EventBus - per wrapped composite map of notification key to subscriber callbacks.
     *
     * Keys are member names for records, or the whole-value sentinel. Subscribers are called in
     * subscription order. Emission works on a snapshot, so a callback may subscribe or unsubscribe
     * (itself included) without invalidating the dispatch in progress.
     */
    class STATEX_EXPORT EventBus {
    public:
        using Callback = std::function<void()>;

        EventBus() = default;

        // Non-copyable, movable
        EventBus(const EventBus &) = delete;
        EventBus &operator=(const EventBus &) = delete;
        EventBus(EventBus &&) noexcept = default;
        EventBus &operator=(EventBus &&) noexcept = default;

        SubscriptionId subscribe(std::string_view key, Callback callback);

        /// Removes exactly one subscription, unknown ids are ignored.
        void unsubscribe(std::string_view key, SubscriptionId id);

        void emit(std::string_view key) const;

        [[nodiscard]] std::size_t subscriber_count(std::string_view key) const;

        [[nodiscard]] bool has_subscribers() const { return !_subscribers.empty(); }

    private:
        struct string_hash {
            using is_transparent = void;
            using is_avalanching = void;

            [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
                return ankerl::unordered_dense::hash<std::string_view>{}(str);
            }
        };

        using subscriber_list = std::vector<std::pair<SubscriptionId, Callback>>;

        ankerl::unordered_dense::map<std::string, subscriber_list, string_hash, std::equal_to<>> _subscribers;
        SubscriptionId _next_id{0};
    };

} // namespace statex

#endif // STATEX_TYPES_EVENT_BUS_H
