/**
 * @file test_observable.cpp
 * @brief Unit tests for the wrapped composites: mutation events, recursive wrapping and bubbling.
 */

#include <catch2/catch_test_macros.hpp>
#include <statex/statex.h>

#include <string>
#include <vector>

using namespace statex;

namespace {

    struct EventCounter {
        int count{0};

        void attach(Observable &observable, std::string_view key) {
            observable.on_event(key, [this] { ++count; });
        }
    };

    observable_record_s_ptr make_profile_state() {
        return ObservableRecord::wrap(Record{
            {"name", "ada"},
            {"profile", Record{{"tags", Value::list({"a"})}, {"scores", Value::dict({{"x", 1}})}}},
            {"matrix", Value::list({Value::list({1, 2}), Value::list({3})})},
        });
    }

} // namespace

// ============================================================================
// Records
// ============================================================================

TEST_CASE("ObservableRecord - set emits the member key then the whole value", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"count", 1}});
    std::vector<std::string> events;
    state->on_event("count", [&] { events.emplace_back("count"); });
    state->on_event(Observable::WHOLE_VALUE_KEY, [&] { events.emplace_back("."); });

    state->set("count", 2);

    CHECK(state->get("count") == Value{2});
    CHECK(events == std::vector<std::string>{"count", "."});
}

TEST_CASE("ObservableRecord - reads emit nothing", "[observable][record]") {
    auto state = make_profile_state();
    EventCounter counter;
    counter.attach(*state, Observable::WHOLE_VALUE_KEY);

    (void) state->get("name");
    (void) state->get("profile").as_record()->get("tags").as_list()->at(0);

    CHECK(counter.count == 0);
}

TEST_CASE("ObservableRecord - nested composites are wrapped on construction", "[observable][record]") {
    auto state = make_profile_state();

    auto profile = state->get("profile");
    REQUIRE(profile.is_observable());
    CHECK(profile.as_record()->get("tags").is_observable());
    CHECK(profile.as_record()->get("scores").is_observable());
    CHECK(state->get("matrix").as_list()->at(0).is_observable());
    CHECK(state->get("name").kind() == ValueKind::STRING);

    CHECK(state->is_root());
    CHECK_FALSE(profile.as_record()->is_root());
    CHECK(profile.as_record()->root() == state);
    CHECK(&profile.as_record()->batcher() == &state->batcher());
}

TEST_CASE("ObservableRecord - assigning a list then appending fires two events", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"items", Value{}}});
    EventCounter items;
    items.attach(*state, "items");

    state->set("items", Value::list({}));
    state->get("items").as_list()->append(1);

    CHECK(items.count == 2);
    CHECK(state->get("items") == Value::list({1}));
}

TEST_CASE("ObservableRecord - nested mutation bubbles to the root under the outer key", "[observable][record]") {
    auto state = make_profile_state();
    EventCounter profile_events;
    EventCounter whole_events;
    EventCounter name_events;
    profile_events.attach(*state, "profile");
    whole_events.attach(*state, Observable::WHOLE_VALUE_KEY);
    name_events.attach(*state, "name");

    auto profile = state->get("profile").as_record();
    EventCounter tags_events;
    tags_events.attach(*profile, "tags");

    profile->get("tags").as_list()->append("b");

    CHECK(tags_events.count == 1);
    CHECK(profile_events.count == 1);
    CHECK(whole_events.count == 1);
    CHECK(name_events.count == 0);

    profile->get("scores").as_dict()->set("y", 2);
    CHECK(profile_events.count == 2);
}

TEST_CASE("ObservableRecord - deeply nested sequences bubble through each level", "[observable][record]") {
    auto state = make_profile_state();
    EventCounter matrix_events;
    matrix_events.attach(*state, "matrix");
    auto matrix = state->get("matrix").as_list();
    EventCounter row_events;
    row_events.attach(*matrix, Observable::WHOLE_VALUE_KEY);

    matrix->at(1).as_list()->append(4);

    CHECK(row_events.count == 1);
    CHECK(matrix_events.count == 1);
}

TEST_CASE("ObservableRecord - assigned plain composites are wrapped and bubble", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"child", Value{}}});
    EventCounter child_events;
    child_events.attach(*state, "child");

    state->set("child", Record{{"inner", Value::dict({})}});
    state->get("child").as_record()->get("inner").as_dict()->set("k", "v");

    CHECK(child_events.count == 2);
}

TEST_CASE("ObservableRecord - already wrapped and primitive values pass through", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"a", Value::list({1})}, {"b", Value{}}});
    auto wrapped = state->get("a");

    state->set("b", wrapped);
    CHECK(state->get("b").as_observable() == wrapped.as_observable());

    state->set("b", Value{});
    CHECK(state->get("b").is_none());

    state->set("b", EnumConstant{"Colour", "RED", 0});
    CHECK(state->get("b").kind() == ValueKind::ENUM);
}

TEST_CASE("ObservableRecord - wrapping copies the plain value", "[observable][record]") {
    Value plain = Value::list({1});
    auto state = ObservableRecord::wrap(Record{{"items", plain}});

    state->get("items").as_list()->append(2);

    CHECK(plain.plain_list().size() == 1);
}

TEST_CASE("ObservableRecord - private members are stored raw and never notify", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"_cache", Value::list({1})}, {"visible", 1}});
    EventCounter whole_events;
    whole_events.attach(*state, Observable::WHOLE_VALUE_KEY);

    CHECK(state->get("_cache").kind() == ValueKind::LIST);
    state->set("_cache", Value::list({2}));
    CHECK(state->get("_cache").kind() == ValueKind::LIST);
    CHECK(whole_events.count == 0);
}

TEST_CASE("ObservableRecord - unknown members and invalid names", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"a", 1}});
    CHECK_THROWS_AS(state->get("missing"), LookupError);
    CHECK_THROWS_AS(state->set(".", 1), ConfigurationError);
    CHECK_FALSE(state->has_member("b"));

    state->set("b", 2);
    CHECK(state->has_member("b"));
    CHECK(state->member_names() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ObservableRecord - to_string", "[observable][record]") {
    auto state = ObservableRecord::wrap(Record{{"a", 1}, {"b", Value::list({"x"})}});
    CHECK(state->to_string() == "Record(a=1, b=['x'])");
}

// ============================================================================
// Lists
// ============================================================================

TEST_CASE("ObservableList - every mutator emits one whole value event", "[observable][list]") {
    auto state = ObservableRecord::wrap(Record{{"items", Value::list({1, 2, 3})}});
    auto items = state->get("items").as_list();
    EventCounter events;
    events.attach(*items, Observable::WHOLE_VALUE_KEY);

    items->append(4);
    items->insert(0, 0);
    items->set(-1, 40);
    items->erase(1);
    CHECK(items->pop() == Value{40});
    items->remove(2);
    CHECK(items->items() == List{0, 3});
    items->clear();

    CHECK(events.count == 7);
    CHECK(items->empty());
}

TEST_CASE("ObservableList - indices and bounds", "[observable][list]") {
    auto state = ObservableRecord::wrap(Record{{"items", Value::list({"a", "b", "c"})}});
    auto items = state->get("items").as_list();

    CHECK(items->at(-1) == Value{"c"});
    CHECK(items->at(0) == Value{"a"});
    CHECK_THROWS_AS(items->at(3), LookupError);
    CHECK_THROWS_AS(items->at(-4), LookupError);
    CHECK_THROWS_AS(items->remove("z"), LookupError);

    items->insert(100, "d");
    items->insert(-100, "start");
    CHECK(items->at(0) == Value{"start"});
    CHECK(items->at(-1) == Value{"d"});

    items->clear();
    CHECK_THROWS_AS(items->pop(), LookupError);
}

TEST_CASE("ObservableList - inserted composites are wrapped", "[observable][list]") {
    auto state = ObservableRecord::wrap(Record{{"items", Value::list({})}});
    auto items = state->get("items").as_list();
    EventCounter events;
    events.attach(*state, "items");

    items->append(Value::dict({{"k", 1}}));
    REQUIRE(items->at(0).is_observable());
    items->at(0).as_dict()->set("k", 2);

    CHECK(events.count == 2);
    CHECK(items->to_string() == "[{'k': 2}]");
}

// ============================================================================
// Dicts
// ============================================================================

TEST_CASE("ObservableDict - mutators and lookups", "[observable][dict]") {
    auto state = ObservableRecord::wrap(Record{{"scores", Value::dict({{"a", 1}})}});
    auto scores = state->get("scores").as_dict();
    EventCounter events;
    events.attach(*state, "scores");

    scores->set("b", 2);
    CHECK(scores->contains("b"));
    CHECK(scores->keys() == std::vector<std::string>{"a", "b"});
    CHECK(scores->get("missing", -1) == Value{-1});
    CHECK(scores->get("missing").is_none());
    CHECK_THROWS_AS(scores->at("missing"), LookupError);
    CHECK_THROWS_AS(scores->erase("missing"), LookupError);

    CHECK(scores->pop("a") == Value{1});
    scores->erase("b");
    scores->clear();

    CHECK(events.count == 4);
    CHECK(scores->empty());
}
