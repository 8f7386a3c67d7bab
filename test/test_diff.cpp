// test_diff.cpp - Tests for the diff system

#include <catch2/catch_all.hpp>
#include <deep_diff/builders.h>
#include <deep_diff/serialization.h>
#include <deep_diff/value_diff.h>
#include <deep_diff/value.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

using namespace deep_diff;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value json(const char* text) {
    std::string err;
    Value v = from_json(text, &err);
    INFO("parse error: " << err);
    REQUIRE(err.empty());
    return v;
}

Value create_state_v1() {
    return Value::map({
        {"name", Value{"Alice"}},
        {"age", Value{30}},
        {"items", Value::vector({
            Value{1},
            Value{2},
            Value{3}
        })}
    });
}

Value create_state_v2() {
    return Value::map({
        {"name", Value{"Bob"}},       // Changed
        {"age", Value{30}},           // Same
        {"items", Value::vector({
            Value{1},
            Value{2},
            Value{4}                  // Changed
        })},
        {"email", Value{"bob@test.com"}}  // Added
    });
}

// Every difference of diff(a, b) appears in diff(b, a) at the same path with sides swapped
void require_symmetric(const Value& a, const Value& b) {
    auto forward = deep_diff::deep_diff(a, b);
    auto backward = deep_diff::deep_diff(b, a);
    REQUIRE(forward.size() == backward.size());
    for (const auto& d : forward) {
        auto it = std::find(backward.begin(), backward.end(), d.reversed());
        INFO("missing reversed entry for " << d);
        REQUIRE(it != backward.end());
    }
}

// Redirects std::cout into a buffer for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }

    CoutCapture(const CoutCapture&) = delete;
    CoutCapture& operator=(const CoutCapture&) = delete;

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // namespace

// ============================================================
// Difference Tests
// ============================================================

TEST_CASE("Difference construction", "[diff][entry]") {
    Path path{std::string{"test"}};

    SECTION("Add entry") {
        Difference d{path, std::nullopt, Value{42}};
        REQUIRE(d.type() == Difference::Type::Add);
        REQUIRE(d.path == "test");
        REQUIRE(d.value().as_int64() == 42);
    }

    SECTION("Remove entry") {
        Difference d{path, Value{42}, std::nullopt};
        REQUIRE(d.type() == Difference::Type::Remove);
        REQUIRE(d.value().as_int64() == 42);
    }

    SECTION("Change entry") {
        Difference d{path, Value{1}, Value{2}};
        REQUIRE(d.type() == Difference::Type::Change);
        REQUIRE(d.before->as_int64() == 1);
        REQUIRE(d.after->as_int64() == 2);
        REQUIRE(d.value().as_int64() == 2);
    }

    SECTION("present null is not absent") {
        Difference d{path, Value{}, Value{1}};
        REQUIRE(d.type() == Difference::Type::Change);
        REQUIRE(d.before.has_value());
        REQUIRE(d.before->is_null());
    }

    SECTION("reversed swaps sides") {
        Difference d{path, std::nullopt, Value{"x"}};
        auto r = d.reversed();
        REQUIRE(r.type() == Difference::Type::Remove);
        REQUIRE(r.path == d.path);
        REQUIRE(*r.before == Value{"x"});
        REQUIRE_FALSE(r.after.has_value());
    }

    SECTION("both sides absent") {
        STATIC_REQUIRE_FALSE(std::is_default_constructible_v<Difference>);

        Difference d{path, std::nullopt, std::nullopt};
        REQUIRE(d.type() == Difference::Type::Add);
        REQUIRE(d.value().is_null());
        REQUIRE(difference_to_string(d) == "ADD    test: <absent>");
        REQUIRE(difference_to_string(d.reversed()) == "ADD    test: <absent>");
    }
}

// ============================================================
// Scenario Tests
// ============================================================

TEST_CASE("deep_diff identical values", "[diff][reflexive]") {
    SECTION("primitive") {
        auto a = Value{"Alice"};
        REQUIRE(deep_diff::deep_diff(a, a).empty());
    }

    SECTION("same map") {
        auto a = json(R"({"name": "Bob", "age": 25})");
        REQUIRE(deep_diff::deep_diff(a, a).empty());
    }

    SECTION("every kind") {
        auto a = json(R"({"n": null, "b": true, "i": 7, "d": 2.5, "s": "x",
                          "arr": [1, [2, {"k": []}]], "obj": {"e": {}}})");
        REQUIRE(deep_diff::deep_diff(a, a).empty());
    }
}

TEST_CASE("deep_diff top-level change", "[diff][leaf]") {
    auto result = deep_diff::deep_diff(Value{"Alice"}, Value{"Bob"});
    REQUIRE(result.size() == 1);
    REQUIRE(result[0].path == "");
    REQUIRE(result[0].segments.empty());
    REQUIRE(*result[0].before == Value{"Alice"});
    REQUIRE(*result[0].after == Value{"Bob"});
}

TEST_CASE("deep_diff leaf scalar in object", "[diff][leaf]") {
    auto a = json(R"({"name": "Alice", "age": 30})");
    auto b = json(R"({"name": "Bob", "age": 30})");

    auto result = deep_diff::deep_diff(a, b);

    REQUIRE(result.size() == 1);
    REQUIRE(result[0].path == "name");
    REQUIRE(*result[0].before == Value{"Alice"});
    REQUIRE(*result[0].after == Value{"Bob"});
}

TEST_CASE("deep_diff kind mismatch short-circuits", "[diff][kind]") {
    SECTION("object vs array at root") {
        auto a = json(R"({"x": true})");
        auto b = json("[1, 2, 3]");

        auto result = deep_diff::deep_diff(a, b);

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "");
        REQUIRE(*result[0].before == a);
        REQUIRE(*result[0].after == b);
    }

    SECTION("empty object vs empty array") {
        auto result = deep_diff::deep_diff(json("{}"), json("[]"));
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].type() == Difference::Type::Change);
    }

    SECTION("nested mismatch is reported once at the container") {
        auto a = json(R"({"cfg": {"a": 1, "b": 2}})");
        auto b = json(R"({"cfg": "disabled"})");

        auto result = deep_diff::deep_diff(a, b);

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "cfg");
        REQUIRE(result[0].before->is_object());
        REQUIRE(*result[0].after == Value{"disabled"});
    }

    SECTION("null vs value") {
        auto result = deep_diff::deep_diff(Value{}, Value{0});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].before->is_null());
    }

    SECTION("number vs numeric string") {
        auto result = deep_diff::deep_diff(Value{1.5}, Value{"1.5"});
        REQUIRE(result.size() == 1);
    }

    SECTION("bool vs number") {
        REQUIRE(deep_diff::deep_diff(Value{true}, Value{1}).size() == 1);
    }
}

TEST_CASE("deep_diff presence divergence", "[diff][presence]") {
    SECTION("key added") {
        auto result = deep_diff::deep_diff(json(R"({"a": 1})"), json(R"({"a": 1, "b": 2})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "b");
        REQUIRE_FALSE(result[0].before.has_value());
        REQUIRE(*result[0].after == Value{2});
        REQUIRE(result[0].type() == Difference::Type::Add);
    }

    SECTION("key removed") {
        auto result = deep_diff::deep_diff(json(R"({"a": 1, "b": 2})"), json(R"({"a": 1})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "b");
        REQUIRE(*result[0].before == Value{2});
        REQUIRE_FALSE(result[0].after.has_value());
    }

    SECTION("removed nested key keeps the full path") {
        auto result = deep_diff::deep_diff(json(R"({"a": {"x": 1, "y": 2}})"),
                                           json(R"({"a": {"x": 1}})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "a.y");
        REQUIRE(result[0].type() == Difference::Type::Remove);
    }

    SECTION("missing key is not a null value") {
        auto result = deep_diff::deep_diff(json(R"({"a": null})"), json("{}"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "a");
        REQUIRE(result[0].before.has_value());
        REQUIRE(result[0].before->is_null());
        REQUIRE_FALSE(result[0].after.has_value());
    }

    SECTION("added subtree is one entry") {
        auto result = deep_diff::deep_diff(json("{}"), json(R"({"a": {"b": [1, 2]}})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "a");
        REQUIRE(*result[0].after == json(R"({"b": [1, 2]})"));
    }
}

TEST_CASE("deep_diff array positions", "[diff][vector]") {
    SECTION("element change") {
        auto result = deep_diff::deep_diff(json("[1, 2]"), json("[1, 3]"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "[1]");
        REQUIRE(*result[0].before == Value{2});
        REQUIRE(*result[0].after == Value{3});
    }

    SECTION("string element change") {
        auto result = deep_diff::deep_diff(json(R"(["Alice", "Bob"])"), json(R"(["Alice", "Hob"])"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "[1]");
        REQUIRE(*result[0].after == Value{"Hob"});
    }

    SECTION("length change (shrink)") {
        auto result = deep_diff::deep_diff(json("[1, 2, 3]"), json("[1, 2]"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "[2]");
        REQUIRE(*result[0].before == Value{3});
        REQUIRE_FALSE(result[0].after.has_value());
    }

    SECTION("length change (append)") {
        auto result = deep_diff::deep_diff(json("[1]"), json("[1, null, 3]"));

        REQUIRE(result.size() == 2);
        REQUIRE(result[0].path == "[1]");
        REQUIRE_FALSE(result[0].before.has_value());
        REQUIRE(result[0].after->is_null());
        REQUIRE(result[1].path == "[2]");
        REQUIRE(*result[1].after == Value{3});
    }

    SECTION("reordered elements diverge position by position") {
        auto result = deep_diff::deep_diff(json("[1, 2, 3]"), json("[3, 2, 1]"));

        REQUIRE(result.size() == 2);
        REQUIRE(result[0].path == "[0]");
        REQUIRE(result[1].path == "[2]");
    }

    SECTION("index rendering under a key") {
        auto result = deep_diff::deep_diff(json(R"({"items": [{"name": "a"}]})"),
                                           json(R"({"items": [{"name": "b"}]})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "items[0].name");
    }

    SECTION("key under a root index") {
        auto result = deep_diff::deep_diff(json(R"([{"x": 1}])"), json(R"([{"x": 2}])"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "[0].x");
    }
}

TEST_CASE("deep_diff nested objects", "[diff][nested]") {
    SECTION("one level") {
        auto result = deep_diff::deep_diff(json(R"({"a": {"b": 1}})"), json(R"({"a": {"b": 2}})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "a.b");
        REQUIRE(*result[0].before == Value{1});
        REQUIRE(*result[0].after == Value{2});
    }

    SECTION("deep object fields") {
        auto result = deep_diff::deep_diff(
            json(R"({"person": {"name": {"first": "Alice"}}})"),
            json(R"({"person": {"name": {"first": "Bob"}}})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "person.name.first");
    }

    SECTION("deep array elements") {
        auto result = deep_diff::deep_diff(
            json(R"({"person": {"name": {"first": [1, 2, 3]}}})"),
            json(R"({"person": {"name": {"first": [1, 2, 4]}}})"));

        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "person.name.first[2]");
        REQUIRE(*result[0].before == Value{3});
        REQUIRE(*result[0].after == Value{4});
    }

    SECTION("segments match the rendered path") {
        auto result = deep_diff::deep_diff(json(R"({"a": {"b": [0, {"c": 1}]}})"),
                                           json(R"({"a": {"b": [0, {"c": 2}]}})"));

        REQUIRE(result.size() == 1);
        Path expected{std::string{"a"}, std::string{"b"}, std::size_t{1}, std::string{"c"}};
        REQUIRE(result[0].segments == expected);
        REQUIRE(result[0].path == "a.b[1].c");
    }
}

TEST_CASE("deep_diff numeric equality", "[diff][number]") {
    SECTION("1.0 equals 1") {
        REQUIRE(deep_diff::deep_diff(Value{1.0}, Value{1}).empty());
        REQUIRE(deep_diff::deep_diff(json("1.0"), json("1")).empty());
    }

    SECTION("1.5 equals 1.50") {
        REQUIRE(deep_diff::deep_diff(json("1.5"), json("1.50")).empty());
        REQUIRE(deep_diff::deep_diff(json("15e-1"), json("1.5")).empty());
    }

    SECTION("1 vs 2") {
        auto result = deep_diff::deep_diff(Value{1}, Value{2});
        REQUIRE(result.size() == 1);
        REQUIRE(result[0].path == "");
    }

    SECTION("numeric strings compare as strings") {
        REQUIRE(deep_diff::deep_diff(Value{"1.50"}, Value{"1.5"}).size() == 1);
    }

    SECTION("int vs non-integral double") {
        REQUIRE(deep_diff::deep_diff(Value{1}, Value{1.25}).size() == 1);
    }

    SECTION("large integers stay exact") {
        REQUIRE(deep_diff::deep_diff(Value{int64_t{9007199254740993}},
                                     Value{int64_t{9007199254740992}}).size() == 1);
        REQUIRE(deep_diff::deep_diff(Value{int64_t{9007199254740993}},
                                     Value{9007199254740992.0}).size() == 1);
    }

    SECTION("inside containers") {
        REQUIRE(deep_diff::deep_diff(json(R"({"v": [1, 2.0]})"), json(R"({"v": [1.0, 2]})")).empty());
    }
}

TEST_CASE("deep_diff object key order", "[diff][order]") {
    SECTION("removed keys of the first value come before added keys") {
        auto result = deep_diff::deep_diff(json(R"({"x": 1})"), json(R"({"y": 2})"));

        REQUIRE(result.size() == 2);
        REQUIRE(result[0].path == "x");
        REQUIRE(result[0].type() == Difference::Type::Remove);
        REQUIRE(result[1].path == "y");
        REQUIRE(result[1].type() == Difference::Type::Add);
    }

    SECTION("insertion order does not matter for equality") {
        auto a = MapBuilder().set("a", 1).set("b", 2).set("c", Value::vector({1, 2})).finish();
        auto b = MapBuilder().set("c", Value::vector({1, 2})).set("b", 2).set("a", 1).finish();
        REQUIRE(deep_diff::deep_diff(a, b).empty());
        REQUIRE(a == b);
    }

    SECTION("deterministic across runs") {
        auto a = create_state_v1();
        auto b = create_state_v2();
        REQUIRE(deep_diff::deep_diff(a, b) == deep_diff::deep_diff(a, b));
    }
}

TEST_CASE("deep_diff multi-change state", "[diff][collector]") {
    auto result = deep_diff::deep_diff(create_state_v1(), create_state_v2());

    REQUIRE(result.size() == 3);

    std::vector<std::string> paths;
    for (const auto& d : result) {
        paths.push_back(d.path);
    }
    std::sort(paths.begin(), paths.end());
    const std::vector<std::string> expected{"email", "items[2]", "name"};
    REQUIRE(paths == expected);

    // The key only present in the second value is reported last
    REQUIRE(result.back().path == "email");
    REQUIRE(result.back().type() == Difference::Type::Add);
}

// ============================================================
// Property Tests
// ============================================================

TEST_CASE("deep_diff symmetry", "[diff][symmetry]") {
    require_symmetric(create_state_v1(), create_state_v2());
    require_symmetric(json(R"({"x": true})"), json("[1, 2, 3]"));
    require_symmetric(json("[1, 2, 3]"), json("[1]"));
    require_symmetric(json(R"({"a": {"b": null}, "c": [1, {"d": 2}]})"),
                      json(R"({"a": {"e": false}, "c": [1, {"d": 3}, 4]})"));
}

TEST_CASE("deep_diff entries point into both trees", "[diff][paths]") {
    auto a = json(R"({"users": [{"name": "Alice", "tags": ["x"]}, {"name": "Bob"}], "v": 1})");
    auto b = json(R"({"users": [{"name": "Alice", "tags": ["x", "y"]}], "v": 1.5, "new": null})");

    auto result = deep_diff::deep_diff(a, b);
    REQUIRE(result.size() == 4);

    for (const auto& d : result) {
        INFO(d);
        REQUIRE(get_at_path(a, d.segments) == d.before);
        REQUIRE(get_at_path(b, d.segments) == d.after);
    }
}

TEST_CASE("deep_diff is empty exactly when values are equal", "[diff][equality]") {
    std::vector<Value> values{
        json("null"), json("true"), json("false"), json("0"), json("0.0"), json("1"),
        json(R"("1")"), json("[]"), json("{}"), json("[1]"), json(R"({"a": 1})"),
        json(R"({"a": 1.0})"), json(R"({"a": [null]})"), json(R"({"a": []})"),
    };

    for (const auto& a : values) {
        for (const auto& b : values) {
            INFO(to_json(a, true) << " vs " << to_json(b, true));
            REQUIRE(deep_diff::deep_diff(a, b).empty() == (a == b));
            REQUIRE(has_any_difference(a, b) == !(a == b));
        }
    }
}

TEST_CASE("deep_diff against a deep copy", "[diff][copy]") {
    const char* text = R"({"config": {"servers": [{"host": "a", "port": 80}], "debug": false}})";
    auto a = json(text);
    auto b = from_json(to_json(a));

    REQUIRE(&a.data != &b.data);
    REQUIRE(deep_diff::deep_diff(a, b).empty());
}

TEST_CASE("deep_diff structural sharing", "[diff][sharing]") {
    auto base = create_state_v1();
    auto modified = base.set("age", Value{31});

    auto result = deep_diff::deep_diff(base, modified);

    REQUIRE(result.size() == 1);
    REQUIRE(result[0].path == "age");
}

// ============================================================
// DiffCollector Tests
// ============================================================

TEST_CASE("DiffCollector basic diff", "[diff][collector]") {
    DiffCollector collector;
    collector.diff(create_state_v1(), create_state_v2());

    REQUIRE(collector.has_changes());
    REQUIRE(collector.is_recursive());
    REQUIRE(collector.get_diffs().size() == 3);
}

TEST_CASE("DiffCollector no changes", "[diff][collector]") {
    auto state = Value::map({{"a", Value{1}}});

    DiffCollector collector;
    collector.diff(state, state);

    REQUIRE_FALSE(collector.has_changes());
    REQUIRE(collector.get_diffs().empty());
}

TEST_CASE("DiffCollector clear and reuse", "[diff][collector]") {
    DiffCollector collector;
    collector.diff(Value::map({{"a", Value{1}}}), Value::map({{"a", Value{2}}}));
    REQUIRE(collector.has_changes());

    collector.clear();
    REQUIRE_FALSE(collector.has_changes());

    collector.diff(Value{1}, Value{2});
    REQUIRE(collector.get_diffs().size() == 1);

    // A new diff replaces the previous result
    collector.diff(Value{1}, Value{1});
    REQUIRE_FALSE(collector.has_changes());
}

TEST_CASE("DiffCollector take_diffs", "[diff][collector]") {
    DiffCollector collector;
    collector.diff(Value{1}, Value{2});

    auto taken = collector.take_diffs();
    REQUIRE(taken.size() == 1);
    REQUIRE_FALSE(collector.has_changes());
}

TEST_CASE("DiffCollector shallow mode", "[diff][collector][shallow]") {
    auto old_state = json(R"({"nested": {"value": 1, "other": [1, 2]}, "flag": true})");
    auto new_state = json(R"({"nested": {"value": 2, "other": [1, 3]}, "flag": true})");

    SECTION("recursive = true (default)") {
        DiffCollector collector;
        collector.diff(old_state, new_state, true);

        REQUIRE(collector.is_recursive());
        REQUIRE(collector.get_diffs().size() == 2);
    }

    SECTION("recursive = false reports the root container") {
        DiffCollector collector;
        collector.diff(old_state, new_state, false);

        REQUIRE_FALSE(collector.is_recursive());
        REQUIRE(collector.get_diffs().size() == 1);
        REQUIRE(collector.get_diffs()[0].path == "");
        REQUIRE(*collector.get_diffs()[0].before == old_state);
    }

    SECTION("equal containers built separately are not reported") {
        DiffCollector collector;
        collector.diff(old_state, from_json(to_json(old_state)), false);
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("leaf and kind changes are reported as usual") {
        DiffCollector collector;
        collector.diff(Value{1}, Value{"1"}, false);
        REQUIRE(collector.get_diffs().size() == 1);
    }
}

// ============================================================
// has_any_difference Tests
// ============================================================

TEST_CASE("has_any_difference function", "[diff]") {
    SECTION("identical values") {
        auto v = create_state_v1();
        REQUIRE_FALSE(has_any_difference(v, v));
    }

    SECTION("different primitives") {
        REQUIRE(has_any_difference(Value{1}, Value{2}));
    }

    SECTION("different kinds") {
        REQUIRE(has_any_difference(Value{1}, Value{"1"}));
    }

    SECTION("int vs equal double") {
        REQUIRE_FALSE(has_any_difference(Value{3}, Value{3.0}));
    }

    SECTION("nested difference") {
        REQUIRE(has_any_difference(create_state_v1(), create_state_v2()));
    }

    SECTION("same key count, different keys") {
        REQUIRE(has_any_difference(json(R"({"a": 1})"), json(R"({"b": 1})")));
    }

    SECTION("structural sharing (same pointer)") {
        auto v1 = create_state_v1();
        auto v2 = v1;
        REQUIRE_FALSE(has_any_difference(v1, v2));
    }
}

// ============================================================
// Rendering Tests
// ============================================================

TEST_CASE("difference_to_string", "[diff][print]") {
    SECTION("change") {
        Difference d{Path{std::string{"a"}, std::string{"b"}}, Value{1}, Value{2}};
        REQUIRE(difference_to_string(d) == "CHANGE a.b: 1 -> 2");
    }

    SECTION("add") {
        Difference d{Path{std::string{"tags"}, std::size_t{3}}, std::nullopt, Value{"new"}};
        REQUIRE(difference_to_string(d) == "ADD    tags[3]: \"new\"");
    }

    SECTION("remove") {
        Difference d{Path{std::string{"email"}}, Value{"bob@test.com"}, std::nullopt};
        REQUIRE(difference_to_string(d) == "REMOVE email: \"bob@test.com\"");
    }

    SECTION("root and containers") {
        Difference d{Path{}, json(R"({"x": true})"), json("[1, 2, 3]")};
        REQUIRE(difference_to_string(d) == "CHANGE <root>: {object:1} -> [array:3]");
    }
}

TEST_CASE("DiffCollector print_diffs", "[diff][print]") {
    DiffCollector collector;

    SECTION("no changes") {
        collector.diff(Value{1}, Value{1.0});

        CoutCapture capture;
        collector.print_diffs();
        REQUIRE(capture.str() == "  (no changes)\n");
    }

    SECTION("one line per difference in traversal order") {
        collector.diff(json("[1, 2]"), json(R"([1, 3, "x"])"));

        CoutCapture capture;
        collector.print_diffs();
        REQUIRE(capture.str() ==
                "  CHANGE [1]: 2 -> 3\n"
                "  ADD    [2]: \"x\"\n");
    }

    SECTION("shallow mode prints the container once") {
        collector.diff(json(R"({"a": [1]})"), json(R"({"a": [2]})"), false);

        CoutCapture capture;
        collector.print_diffs();
        REQUIRE(capture.str() == "  CHANGE <root>: {object:1} -> {object:1}\n");
    }
}
