/**
 * @file test_api.cpp
 * @brief Tests for the entry points: use_state, fields, use_calc, use_field and set_field.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <statex/statex.h>

#include "change_tracker.h"

#include <vector>

using namespace statex;
using statex::testing::ChangeTracker;

namespace {

    const int editor_token = 0;

    record_type_s_ptr todo_type() {
        return RecordTypeBuilder("Todo")
            .field("title", "", "string")
            .field("items", Value::list({}))
            .computed("remaining", [](ObservableRecord &self) {
                return Value{static_cast<int64_t>(self.get("items").as_list()->size())};
            }, {"items"}, "int")
            .method("add", [](ObservableRecord &self, const Arguments &arguments) {
                self.get("items").as_list()->append(arguments.at(0));
                return Value{};
            })
            .build();
    }

} // namespace

TEST_CASE("use_state - wraps a fresh instance of a record type", "[api]") {
    auto type = todo_type();
    auto first = use_state(type);
    auto second = use_state(type);

    first->call("add", {"milk"});

    CHECK(first->get("remaining") == Value{1});
    CHECK(second->get("remaining") == Value{0});
    CHECK(first->type_name() == "Todo");
    CHECK(first->is_root());
}

TEST_CASE("use_state - wraps the record returned by a factory", "[api]") {
    auto state = use_state([] { return Record{{"nested", Record{{"flag", false}}}}; });
    CHECK(state->get("nested").is_observable());
    CHECK_THROWS_AS(use_state(record_type_s_ptr{}), ConfigurationError);
}

TEST_CASE("fields - requires a wrapped record", "[api]") {
    auto state = use_state(todo_type());
    CHECK(&fields(Value{state}) == &fields(state));

    CHECK_THROWS_AS(fields(Value{1}), ConfigurationError);
    CHECK_THROWS_AS(fields(state->get("items")), ConfigurationError);
    CHECK_THROWS_AS(fields(observable_s_ptr{}), ConfigurationError);
}

TEST_CASE("fields - typed wrapper handles resolve to the matching overload", "[api]") {
    auto state = use_state([] { return Record{{"tags", Value::list({"a"})}, {"scores", Value::dict({{"a", 1}})}}; });

    observable_list_s_ptr tags = state->get("tags").as_list();
    observable_dict_s_ptr scores = state->get("scores").as_dict();
    CHECK_THROWS_AS(fields(tags), ConfigurationError);
    CHECK_THROWS_AS(fields(scores), ConfigurationError);
    CHECK_THROWS_AS(fields(observable_list_s_ptr{}), ConfigurationError);

    observable_s_ptr erased = state;
    CHECK(&fields(erased) == &fields(state));
}

TEST_CASE("use_calc - computes over explicit dependencies", "[api]") {
    auto a = use_field("a", 2);
    auto b = use_field("b", 3);
    auto product = use_calc([&] { return Value{a->get().as_int() * b->get().as_int()}; }, {a, b});
    auto other = use_calc([] { return Value{}; });

    CHECK_THAT(product->key(), Catch::Matchers::StartsWith("use_calc("));
    CHECK(product->key() != other->key());
    CHECK(product->get() == Value{6});
    CHECK_FALSE(product->has_mutator());

    ChangeTracker tracker;
    tracker.track("product", product);
    b->set(4);
    CHECK(tracker.last("product").value == Value{8});
}

TEST_CASE("use_field - holds its own value", "[api]") {
    auto name = use_field("name", "ada");
    CHECK(name->key() == "use_field(name)");
    CHECK(name->annotation() == std::optional<std::string>{"string"});
    CHECK(name->get() == Value{"ada"});

    ChangeTracker tracker;
    tracker.track("name", name);
    name->set("grace");

    CHECK(tracker.last("name").value == Value{"grace"});
    CHECK(tracker.last("name").source == nullptr);

    auto typed = use_field("typed", Value{}, {}, std::string{"Optional[int]"});
    CHECK(typed->annotation() == std::optional<std::string>{"Optional[int]"});
}

TEST_CASE("use_field - dependencies propagate into it", "[api]") {
    auto upstream = use_field("upstream", 1);
    auto downstream = use_field("downstream", 0, {upstream});
    ChangeTracker tracker;
    tracker.track("downstream", downstream);

    upstream->set(2);

    CHECK(tracker.count("downstream") == 1);
    CHECK(downstream->get() == Value{0});
}

TEST_CASE("set_field - a record field sees the mutation, then the explicit source", "[api]") {
    auto state = use_state(todo_type());
    auto title = fields(state).get("title");
    std::vector<Provenance> sources;
    auto unsubscribe = title->on_change([&](Provenance source) { sources.push_back(source); });

    set_field(*title, "groceries", &editor_token);

    CHECK(state->get("title") == Value{"groceries"});
    CHECK(sources == std::vector<Provenance>{nullptr, &editor_token});
}

TEST_CASE("set_field - a standalone field", "[api]") {
    auto count = use_field("count", 0);
    auto doubled = count->transform([](const Value &value) { return Value{value.as_int() * 2}; });
    ChangeTracker tracker;
    tracker.track("doubled", doubled);

    set_field(*count, 4, &editor_token);

    CHECK(tracker.last("doubled").value == Value{8});
    CHECK(tracker.last("doubled").source == &editor_token);
}

TEST_CASE("set_field - without a mutator", "[api]") {
    auto constant = use_calc([] { return Value{1}; });
    CHECK_THROWS_AS(set_field(*constant, 2), UnsupportedOperation);
}

TEST_CASE("Reactive record - doubled follows count", "[api][example]") {
    auto type = RecordTypeBuilder("Counter")
                    .field("count", 1)
                    .computed("doubled", [](ObservableRecord &self) {
                        return Value{self.get("count").as_int() * 2};
                    }, {"count"})
                    .build();
    DeferredFlushCoordinator coordinator;
    auto state = use_state(type, &coordinator);
    auto doubled = fields(state)["doubled"];

    state->set("count", 5);

    CHECK(doubled->is_dirty());
    CHECK(doubled->get() == Value{10});
    CHECK(state->get("doubled") == Value{10});
}

TEST_CASE("Reactive record - remaining follows list mutations", "[api][example]") {
    auto state = use_state(todo_type());
    auto remaining = fields(state).get("remaining");
    ChangeTracker tracker;
    tracker.track("remaining", remaining);

    state->call("add", {"eggs"});
    CHECK(tracker.last("remaining").value == Value{1});

    state->get("items").as_list()->clear();
    CHECK(tracker.last("remaining").value == Value{0});
    CHECK(tracker.count("remaining") == 2);
}
