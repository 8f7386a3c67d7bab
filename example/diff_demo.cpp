// diff_demo.cpp
// Diffs two JSON documents and prints one line per difference.

#include <deep_diff/builders.h>
#include <deep_diff/serialization.h>
#include <deep_diff/value.h>
#include <deep_diff/value_diff.h>

#include <iostream>
#include <string>

using namespace deep_diff;

namespace {

const char* kSampleBefore = R"({
    "name": "Alice",
    "age": 30,
    "config": {"theme": "dark", "font_size": 12.0},
    "tags": ["admin", "dev"],
    "email": "alice@example.com"
})";

const char* kSampleAfter = R"({
    "name": "Alice",
    "age": 31,
    "config": {"theme": "light", "font_size": 12},
    "tags": ["admin", "dev", "ops"],
    "phone": null
})";

bool load(const std::string& text, const char* label, Value& out)
{
    std::string err;
    out = from_json(text, &err);
    if (!err.empty()) {
        std::cerr << label << ": " << err << "\n";
        return false;
    }
    return true;
}

} // namespace

int main()
{
    Value before;
    Value after;
    if (!load(kSampleBefore, "before", before) || !load(kSampleAfter, "after", after)) {
        return 1;
    }

    std::cout << "=== Recursive diff ===\n";
    DiffCollector collector;
    collector.diff(before, after);
    collector.print_diffs();

    // Shallow mode reports the root once if anything below it changed
    std::cout << "\n=== Shallow diff ===\n";
    collector.diff(before, after, false);
    collector.print_diffs();

    // Apply one edit with a builder and diff against the original
    std::cout << "\n=== Edited copy ===\n";
    Value edited = MapBuilder(before).set("age", 99).erase("email").finish();
    for (const auto& d : deep_diff::deep_diff(before, edited)) {
        std::cout << "  " << d << "\n";
    }

    return 0;
}
