#include <catch2/catch_test_macros.hpp>
#include <statex/statex.h>

using namespace statex;

namespace {

    record_type_s_ptr counter_type() {
        return RecordTypeBuilder("Counter")
            .field("count", 1, "int")
            .field("history", Value::list({}))
            .computed("doubled", [](ObservableRecord &self) { return Value{self.get("count").as_int() * 2}; },
                      {"count"}, "int")
            .computed_with_arguments(
                "times",
                [](ObservableRecord &self, const Arguments &arguments) {
                    return Value{self.get("count").as_int() * arguments.at(0).as_int()};
                },
                {"count"})
            .method("increment",
                    [](ObservableRecord &self, const Arguments &) {
                        self.set("count", self.get("count").as_int() + 1);
                        return Value{};
                    })
            .build();
    }

} // namespace

TEST_CASE("RecordType - declares members", "[record_type]") {
    auto type = counter_type();
    CHECK(type->name() == "Counter");
    CHECK(type->data_members().size() == 2);
    CHECK(type->computed_members().size() == 2);
    CHECK(type->methods().size() == 1);
    CHECK(type->is_callable("doubled"));
    CHECK(type->is_callable("increment"));
    CHECK_FALSE(type->is_callable("count"));
    CHECK(type->annotation("count") == std::optional<std::string>{"int"});
    CHECK_FALSE(type->annotation("history").has_value());
}

TEST_CASE("RecordType - instances get private copies of the defaults", "[record_type]") {
    auto type = counter_type();
    auto first = type->instantiate();
    auto second = type->instantiate();

    first.members.at("history").plain_list().push_back(1);

    CHECK(second.members.at("history").plain_list().empty());
    CHECK(first.type_name() == "Counter");
    CHECK(first.members.at("count") == Value{1});
}

TEST_CASE("RecordType - field factories run per instance", "[record_type]") {
    int calls = 0;
    auto type = RecordTypeBuilder("Made").field_factory("value", [&] { return Value{++calls}; }).build();
    (void) type->instantiate();
    auto second = type->instantiate();
    CHECK(calls == 2);
    CHECK(second.members.at("value") == Value{2});
}

TEST_CASE("RecordType - invalid declarations are rejected", "[record_type]") {
    CHECK_THROWS_AS(RecordTypeBuilder("Twice").field("a").field("a").build(), ConfigurationError);
    CHECK_THROWS_AS(
        RecordTypeBuilder("Clash").field("a").method("a", [](ObservableRecord &, const Arguments &) { return Value{}; })
            .build(),
        ConfigurationError);
    CHECK_THROWS_AS(RecordTypeBuilder("Dangling")
                        .computed("c", [](ObservableRecord &) { return Value{}; }, {"missing"})
                        .build(),
                    ConfigurationError);
    CHECK_THROWS_AS(RecordTypeBuilder("Reserved").field(".").build(), ConfigurationError);
}

TEST_CASE("RecordType - computed dependency cycles are rejected", "[record_type]") {
    auto none = [](ObservableRecord &) { return Value{}; };
    CHECK_THROWS_AS(RecordTypeBuilder("Self").computed("loop", none, {"loop"}).build(), ConfigurationError);
    CHECK_THROWS_AS(RecordTypeBuilder("Mutual").computed("a", none, {"b"}).computed("b", none, {"a"}).build(),
                    ConfigurationError);
    CHECK_THROWS_AS(RecordTypeBuilder("Ring")
                        .field("seed")
                        .computed("a", none, {"seed", "c"})
                        .computed("b", none, {"a"})
                        .computed("c", none, {"b"})
                        .build(),
                    ConfigurationError);
    // Shared dependencies without a cycle are fine
    CHECK_NOTHROW(RecordTypeBuilder("Diamond")
                      .field("seed")
                      .computed("left", none, {"seed"})
                      .computed("right", none, {"seed"})
                      .computed("both", none, {"left", "right"})
                      .build());
}

TEST_CASE("RecordType - computed members and methods run on the wrapper", "[record_type]") {
    auto state = use_state(counter_type());

    CHECK(state->get("doubled") == Value{2});
    CHECK(state->compute("times", {5}) == Value{5});
    state->call("increment");
    CHECK(state->get("count") == Value{2});
    CHECK(state->get("doubled") == Value{4});
    CHECK(state->call("times", {3}) == Value{6});
}

TEST_CASE("RecordType - callable members cannot be assigned or read as data", "[record_type]") {
    auto state = use_state(counter_type());
    CHECK_THROWS_AS(state->set("doubled", 1), ConfigurationError);
    CHECK_THROWS_AS(state->set("increment", 1), ConfigurationError);
    CHECK_THROWS_AS(state->get("increment"), ConfigurationError);
    CHECK_THROWS_AS(state->call("missing"), LookupError);
}

TEST_CASE("RecordType - a method's mutations notify individually", "[record_type]") {
    auto state = use_state(counter_type());
    int count_events = 0;
    state->on_event("count", [&] { ++count_events; });

    state->call("increment");
    state->call("increment");

    CHECK(count_events == 2);
}
