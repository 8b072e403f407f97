#include "network/reply.hpp"

#include <spdlog/fmt/fmt.h>

namespace memkv {

bool operator==(const StatusReply& a, const StatusReply& b) { return a.text == b.text; }
bool operator==(const ErrorReply& a, const ErrorReply& b) { return a.message == b.message; }
bool operator==(const IntegerReply& a, const IntegerReply& b) { return a.value == b.value; }
bool operator==(const BulkReply& a, const BulkReply& b) { return a.value == b.value; }
bool operator==(const ArrayReply& a, const ArrayReply& b) { return a.elements == b.elements; }
bool operator==(const Reply& a, const Reply& b) { return a.value == b.value; }

namespace reply {

Reply ok() { return StatusReply{"OK"}; }
Reply status(std::string text) { return StatusReply{std::move(text)}; }
Reply error(std::string message) { return ErrorReply{std::move(message)}; }
Reply integer(int64_t value) { return IntegerReply{value}; }
Reply bulk(std::string value) { return BulkReply{std::move(value)}; }
Reply nil_bulk() { return BulkReply{std::nullopt}; }
Reply array(std::vector<Reply> elements) { return ArrayReply{std::move(elements)}; }
Reply nil_array() { return ArrayReply{std::nullopt}; }

Reply bulk_array(const std::vector<std::string>& items) {
    std::vector<Reply> elements;
    elements.reserve(items.size());
    for (const auto& item : items) {
        elements.push_back(BulkReply{item});
    }
    return ArrayReply{std::move(elements)};
}

} // namespace reply

namespace {

void render(const Reply& r, const std::string& indent, std::string& out) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, StatusReply>) {
                out += v.text;
            } else if constexpr (std::is_same_v<T, ErrorReply>) {
                out += "(error) " + v.message;
            } else if constexpr (std::is_same_v<T, IntegerReply>) {
                out += fmt::format("(integer) {}", v.value);
            } else if constexpr (std::is_same_v<T, BulkReply>) {
                out += v.value ? fmt::format("\"{}\"", *v.value) : std::string{"(nil)"};
            } else if constexpr (std::is_same_v<T, ArrayReply>) {
                if (!v.elements) {
                    out += "(nil)";
                } else if (v.elements->empty()) {
                    out += "(empty array)";
                } else {
                    for (std::size_t i = 0; i < v.elements->size(); ++i) {
                        if (i > 0) {
                            out += '\n';
                            out += indent;
                        }
                        out += fmt::format("{}) ", i + 1);
                        render((*v.elements)[i], indent + "   ", out);
                    }
                }
            }
        },
        r.value);
}

} // namespace

std::string to_display_string(const Reply& r) {
    std::string out;
    render(r, "", out);
    return out;
}

} // namespace memkv
