#include "storage/value.hpp"

namespace memkv {

std::string_view type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::String:    return "string";
        case ValueType::List:      return "list";
        case ValueType::Set:       return "set";
        case ValueType::SortedSet: return "zset";
    }
    return "none";
}

std::optional<ValueType> type_from_name(std::string_view name) noexcept {
    if (name == "string") return ValueType::String;
    if (name == "list")   return ValueType::List;
    if (name == "set")    return ValueType::Set;
    if (name == "zset")   return ValueType::SortedSet;
    return std::nullopt;
}

bool is_empty_container(const Value& v) noexcept {
    return std::visit(
        [](const auto& x) -> bool {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, StringValue>) {
                return false;
            } else {
                return x.empty();
            }
        },
        v);
}

} // namespace memkv
