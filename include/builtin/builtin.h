#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "command_context.h"

using CommandHandler = std::function<int(const std::vector<std::string>&, CommandContext&)>;

struct BuiltinCommand {
    std::string name;
    CommandHandler handler;
    std::string summary;
};

// Name -> handler table. Filled once at construction; nothing can register
// or replace a command afterwards.
class CommandRegistry {
   public:
    explicit CommandRegistry(std::vector<BuiltinCommand> commands);

    const BuiltinCommand* find(const std::string& name) const;

    bool contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    // sorted by name
    const std::vector<BuiltinCommand>& commands() const {
        return commands_;
    }

   private:
    std::vector<BuiltinCommand> commands_;
    std::unordered_map<std::string, size_t> index_;
};

CommandRegistry create_builtin_registry();
