#pragma once

#include <optional>
#include <string>
#include <vector>

#include "command_context.h"
#include "parser/parser.h"

namespace vfs {
class VirtualFilesystem;
}
class CommandRegistry;
struct Session;

// Runs command lines against one session and filesystem.
//
// A line is variable-expanded once, then split into ';' statements, '&&'/'||'
// parts and '|' segments. Each segment gets its own substitution pass,
// redirect parsing, tokenizing, glob expansion, assignment and alias handling
// before the command is looked up in the registry. Pipelines are fully
// buffered; every stage runs to completion before the next starts.
class Shell {
   public:
    Shell(vfs::VirtualFilesystem& fs, Session& session, const CommandRegistry& registry);

    // Runs line and returns the last statement's exit code. Never throws for
    // anything a command does.
    int execute(const std::string& line, const OutputSink& out, const OutputSink& err,
                const std::optional<std::string>& stdin_data = std::nullopt);

    // execute() with both streams captured
    ExecResult exec(const std::string& line);

    // exec() that leaves the session's exit request as it found it
    ExecResult exec_isolated(const std::string& line);

    Session& session() {
        return session_;
    }
    vfs::VirtualFilesystem& filesystem() {
        return fs_;
    }
    const CommandRegistry& registry() const {
        return registry_;
    }
    int nesting_depth() const {
        return nesting_depth_;
    }

   private:
    int execute_logic_chain(const std::vector<LogicalCommand>& parts, const OutputSink& out,
                            const OutputSink& err, const std::optional<std::string>& stdin_data);
    int execute_pipeline(const std::string& part, const OutputSink& out, const OutputSink& err,
                         const std::optional<std::string>& stdin_data);
    int execute_segment(const std::string& segment, const std::optional<std::string>& stdin_data,
                        const OutputSink& out, const OutputSink& err);
    int run_command(std::vector<std::string> args, const std::optional<std::string>& stdin_data,
                    const OutputSink& out, const OutputSink& err);

    std::vector<std::string> expand_words(const std::vector<Word>& words) const;
    ExecHook make_exec_hook();

    vfs::VirtualFilesystem& fs_;
    Session& session_;
    const CommandRegistry& registry_;
    int nesting_depth_ = 0;
};
