#include "shell.h"

#include <exception>
#include <utility>

#include "builtin/builtin.h"
#include "error_out.h"
#include "interpreter/command_substitution_evaluator.h"
#include "parser/parser_utils.h"
#include "parser/variable_expander.h"
#include "session.h"
#include "utils/debug.h"
#include "utils/string_utils.h"
#include "vfs/virtual_filesystem.h"
#include "vsh.h"

namespace {

struct NestingGuard {
    explicit NestingGuard(int& depth) : depth_(depth) {
        ++depth_;
    }
    ~NestingGuard() {
        --depth_;
    }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

   private:
    int& depth_;
};

bool is_hidden_match(const std::string& match, const std::string& pattern) {
    std::string name = vfs::VirtualFilesystem::base_name("/" + match);
    std::string pattern_name = vfs::VirtualFilesystem::base_name("/" + pattern);
    return !name.empty() && name[0] == '.' && (pattern_name.empty() || pattern_name[0] != '.');
}

}  // namespace

Shell::Shell(vfs::VirtualFilesystem& fs, Session& session, const CommandRegistry& registry)
    : fs_(fs), session_(session), registry_(registry) {
}

ExecResult Shell::exec(const std::string& line) {
    ExecResult result;
    result.exit_code =
        execute(line, [&result](const std::string& text) { result.stdout_text += text; },
                [&result](const std::string& text) { result.stderr_text += text; });
    return result;
}

ExecResult Shell::exec_isolated(const std::string& line) {
    const bool exit_requested = session_.exit_requested;
    const int exit_status = session_.exit_status;
    ExecResult result = exec(line);
    session_.exit_requested = exit_requested;
    session_.exit_status = exit_status;
    return result;
}

ExecHook Shell::make_exec_hook() {
    return [this](const std::string& line) { return exec(line); };
}

int Shell::execute(const std::string& line, const OutputSink& out, const OutputSink& err,
                   const std::optional<std::string>& stdin_data) {
    if (nesting_depth_ >= config::max_nesting_depth) {
        debug_msg("exec: nesting limit %d reached", config::max_nesting_depth);
        err("vsh: maximum nesting depth exceeded (" + std::to_string(config::max_nesting_depth) +
            ")\n");
        return 2;
    }
    NestingGuard guard(nesting_depth_);
    PerformanceTracker tracker("execute");

    if (trim_whitespace(line).empty() || is_comment_line(line)) {
        return 0;
    }

    // expansion happens once for the whole line, so expanded text is parsed as syntax
    const std::string expanded = VariableExpander(session_).expand(line);

    int exit_code = 0;
    for (const auto& statement : Parser::parse_semicolon_commands(expanded)) {
        if (is_comment_line(statement)) {
            continue;
        }
        debug_msg("exec[%d]: %s", nesting_depth_, statement.c_str());
        try {
            exit_code = execute_logic_chain(Parser::parse_logical_commands(statement), out, err,
                                            stdin_data);
        } catch (const std::exception& e) {
            err(std::string("vsh: ") + e.what() + "\n");
            exit_code = 1;
        }
        session_.last_exit_code = exit_code;
        if (session_.exit_requested) {
            break;
        }
    }
    return exit_code;
}

int Shell::execute_logic_chain(const std::vector<LogicalCommand>& parts, const OutputSink& out,
                               const OutputSink& err,
                               const std::optional<std::string>& stdin_data) {
    int last_code = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            const std::string& prev_op = parts[i - 1].op;
            if ((prev_op == "&&" && last_code != 0) || (prev_op == "||" && last_code == 0)) {
                debug_msg("exec: skipping '%s' after %s with status %d", parts[i].command.c_str(),
                          prev_op.c_str(), last_code);
                continue;
            }
        }
        last_code = execute_pipeline(parts[i].command, out, err, stdin_data);
        if (session_.exit_requested) {
            break;
        }
    }
    return last_code;
}

int Shell::execute_pipeline(const std::string& part, const OutputSink& out, const OutputSink& err,
                            const std::optional<std::string>& stdin_data) {
    const auto segments = Parser::parse_pipeline(part);
    std::optional<std::string> input = stdin_data;
    int exit_code = 0;

    for (size_t i = 0; i < segments.size(); ++i) {
        if (i + 1 == segments.size()) {
            exit_code = execute_segment(segments[i], input, out, err);
            break;
        }
        std::string buffer;
        exit_code = execute_segment(
            segments[i], input, [&buffer](const std::string& text) { buffer += text; }, err);
        input = std::move(buffer);
    }
    return exit_code;
}

int Shell::execute_segment(const std::string& segment,
                           const std::optional<std::string>& stdin_data, const OutputSink& out,
                           const OutputSink& err) {
    // a substitution runs on its own: an exit inside it ends only the substitution
    CommandSubstitutionEvaluator evaluator(
        [this](const std::string& command) { return exec_isolated(command); });
    auto substituted = evaluator.expand_substitutions(segment);
    if (!substituted.stderr_text.empty()) {
        err(substituted.stderr_text);
    }

    auto parsed = Parser::parse_redirects(substituted.text);
    if (parsed.is_error()) {
        print_error(ErrorInfo(ErrorType::SYNTAX_ERROR, "vsh", parsed.error(), {}), err);
        return 2;
    }
    const Command& command = parsed.value();

    std::optional<std::string> input = stdin_data;
    const Redirect* stdout_redirect = nullptr;
    const Redirect* stderr_redirect = nullptr;
    for (const auto& redirect : command.redirects) {
        if (redirect.kind == Redirect::Kind::Input) {
            auto content = fs_.read_file(session_.resolve_path(redirect.target));
            if (content.is_error()) {
                print_error("vsh", content, err);
                return 1;
            }
            input = content.value();
        } else if (redirect.is_stdout()) {
            stdout_redirect = &redirect;
        } else {
            stderr_redirect = &redirect;
        }
    }

    // targets overridden by a later redirect of the same stream are still created
    for (const auto& redirect : command.redirects) {
        if (redirect.kind == Redirect::Kind::Input || &redirect == stdout_redirect ||
            &redirect == stderr_redirect) {
            continue;
        }
        vfs::WriteOptions options;
        options.append = redirect.appends();
        options.uid = session_.uid;
        options.gid = session_.gid;
        auto created = fs_.write_file(session_.resolve_path(redirect.target), "", options);
        if (created.is_error()) {
            print_error("vsh", created, err);
            return 1;
        }
    }

    std::string captured_out;
    std::string captured_err;
    OutputSink stage_out = out;
    OutputSink stage_err = err;
    if (stdout_redirect != nullptr) {
        stage_out = [&captured_out](const std::string& text) { captured_out += text; };
    }
    if (stderr_redirect != nullptr) {
        stage_err = [&captured_err](const std::string& text) { captured_err += text; };
    }

    int exit_code = run_command(expand_words(Tokenizer::tokenize_words(command.text)), input,
                                stage_out, stage_err);

    auto flush = [&](const Redirect* redirect, const std::string& data) {
        if (redirect == nullptr) {
            return;
        }
        vfs::WriteOptions options;
        options.append = redirect->appends();
        options.uid = session_.uid;
        options.gid = session_.gid;
        auto written = fs_.write_file(session_.resolve_path(redirect->target), data, options);
        if (written.is_error()) {
            print_error("vsh", written, err);
            if (exit_code == 0) {
                exit_code = 1;
            }
        }
    };
    flush(stdout_redirect, captured_out);
    flush(stderr_redirect, captured_err);
    return exit_code;
}

std::vector<std::string> Shell::expand_words(const std::vector<Word>& words) const {
    std::vector<std::string> args;
    args.reserve(words.size());

    for (const auto& word : words) {
        if (!word.glob_candidate || looks_like_assignment(word.text)) {
            args.push_back(word.text);
            continue;
        }

        std::string pattern = word.text;
        std::string prefix;
        while (string_utils::starts_with(pattern, "./")) {
            prefix += "./";
            pattern = pattern.substr(2);
        }

        auto matches = fs_.glob(pattern, session_.cwd);
        size_t added = 0;
        if (matches.is_ok()) {
            for (const auto& match : matches.value()) {
                if (is_hidden_match(match, pattern)) {
                    continue;
                }
                args.push_back(prefix + match);
                ++added;
            }
        }
        if (added == 0) {
            args.push_back(word.text);
        }
    }
    return args;
}

int Shell::run_command(std::vector<std::string> args,
                       const std::optional<std::string>& stdin_data, const OutputSink& out,
                       const OutputSink& err) {
    size_t assignments = 0;
    std::string name;
    std::string value;
    while (assignments < args.size() && split_assignment(args[assignments], name, value)) {
        session_.set_env(name, value);
        ++assignments;
    }
    args.erase(args.begin(), args.begin() + static_cast<long>(assignments));
    if (args.empty()) {
        return 0;
    }

    auto alias = session_.aliases.find(args[0]);
    if (alias != session_.aliases.end()) {
        auto replacement = Tokenizer::tokenize_command(alias->second);
        args.erase(args.begin());
        args.insert(args.begin(), replacement.begin(), replacement.end());
        if (args.empty()) {
            return 0;
        }
    }

    const BuiltinCommand* command = registry_.find(args[0]);
    if (command == nullptr) {
        print_error(ErrorInfo(ErrorType::COMMAND_NOT_FOUND, args[0], "", {}), err);
        return 127;
    }

    CommandContext ctx(fs_, session_);
    ctx.stdin_data = stdin_data;
    ctx.out = out;
    ctx.err = err;
    ctx.exec = make_exec_hook();
    ctx.exec_isolated = [this](const std::string& line) { return exec_isolated(line); };
    ctx.registry = &registry_;

    try {
        return command->handler(args, ctx);
    } catch (const std::exception& e) {
        err(args[0] + ": " + e.what() + "\n");
        return 1;
    }
}
