// path.cpp - Path rendering and lookup

#include <deep_diff/path.h>

namespace deep_diff {

void append_path_element(std::string& out, const PathElement& elem)
{
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            if (!out.empty()) {
                out += '.';
            }
            out += v;
        } else {
            out += '[';
            out += std::to_string(v);
            out += ']';
        }
    }, elem);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    result.reserve(path.size() * 8);
    for (const auto& elem : path) {
        append_path_element(result, elem);
    }
    return result;
}

std::optional<Value> get_at_path(const Value& root, const Path& path)
{
    const Value* current = &root;
    for (const auto& elem : path) {
        const ValueBox* next = nullptr;
        if (auto* key = std::get_if<std::string>(&elem)) {
            if (auto* m = current->get_if<ValueMap>()) {
                next = m->find(*key);
            }
        } else {
            const auto index = std::get<std::size_t>(elem);
            if (auto* v = current->get_if<ValueVector>()) {
                if (index < v->size()) {
                    next = &(*v)[index];
                }
            }
        }
        if (!next) {
            return std::nullopt;
        }
        current = &next->get();
    }
    return *current;
}

} // namespace deep_diff
