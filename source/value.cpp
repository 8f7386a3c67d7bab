// value.cpp - Value type utilities

#include <deep_diff/value.h>
#include <deep_diff/builders.h>
#include <deep_diff/serialization.h>

namespace deep_diff {

const char* kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:    return "null";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number:  return "number";
        case ValueKind::String:  return "string";
        case ValueKind::Array:   return "array";
        case ValueKind::Object:  return "object";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([&val](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ValueMap>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            // Scalars print as their JSON text
            return to_json(val, true);
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& [k, v] : arg) {
                    std::cout << std::string(depth * 2, ' ') << prefix << k << ":\n";
                    print_value(*v, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << std::string(depth * 2, ' ') << prefix << "["
                              << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else {
                std::cout << std::string(depth * 2, ' ') << prefix
                          << to_json(val, true) << "\n";
            }
        },
        val.data);
}

// ============================================================
// Explicit Template Instantiations
//
// Matching 'extern template' declarations live in value.h and builders.h,
// so the code for the default policy is generated once, here.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;
template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace deep_diff
