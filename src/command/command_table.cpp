#include "command/command_table.hpp"
#include "command/arguments.hpp"

#include <algorithm>
#include <utility>

namespace memkv::command {

void CommandTable::add(CommandSpec spec) {
    std::string name = to_lower(spec.name);
    spec.name = name;
    commands_.insert_or_assign(std::move(name), std::move(spec));
}

const CommandSpec* CommandTable::find(std::string_view name) const {
    auto it = commands_.find(to_lower(name));
    return it == commands_.end() ? nullptr : &it->second;
}

std::vector<std::string> CommandTable::names() const {
    std::vector<std::string> out;
    out.reserve(commands_.size());
    for (const auto& [name, spec] : commands_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

CommandTable make_default_command_table() {
    CommandTable table;
    register_server_commands(table);
    register_key_commands(table);
    register_string_commands(table);
    register_list_commands(table);
    register_set_commands(table);
    register_zset_commands(table);
    return table;
}

} // namespace memkv::command
