#include "builtin/text_commands.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <regex>
#include <sstream>

#include "builtin/builtin_help.h"
#include "builtin/builtin_utils.h"
#include "builtin/echo_command.h"
#include "command_context.h"
#include "error_out.h"
#include "utils/string_utils.h"
#include "vfs/virtual_filesystem.h"

using builtin_utils::ParsedArgs;

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line;
        text += '\n';
    }
    return text;
}

// head/tail accept "-n N", "-nN" and "-N"; a leading '+' (tail only) counts from the start
bool parse_line_count(const std::vector<std::string>& args, long long& count, bool& from_start,
                      std::vector<std::string>& files, CommandContext& ctx) {
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;
        if (arg == "-n") {
            if (i + 1 >= args.size()) {
                print_error({ErrorType::INVALID_ARGUMENT, args[0], "option requires an argument -- 'n'", {}},
                            ctx.err);
                return false;
            }
            value = args[++i];
        } else if (arg.size() > 2 && arg.compare(0, 2, "-n") == 0) {
            value = arg.substr(2);
        } else if (arg.size() > 1 && arg[0] == '-' &&
                   std::isdigit(static_cast<unsigned char>(arg[1])) != 0) {
            value = arg.substr(1);
        } else {
            files.push_back(arg);
            continue;
        }

        from_start = !value.empty() && value[0] == '+';
        if (from_start || (!value.empty() && value[0] == '-')) {
            value = value.substr(1);
        }
        if (!builtin_utils::parse_int(value, count) || count < 0) {
            print_error({ErrorType::INVALID_ARGUMENT, args[0], "invalid number of lines: '" + value + "'", {}},
                        ctx.err);
            return false;
        }
    }
    return true;
}

// Numeric printf arguments: a leading quote yields the character code, as in POSIX.
bool printf_number(const std::string& text, long double& value) {
    if (text.empty()) {
        value = 0;
        return true;
    }
    if (text[0] == '\'' || text[0] == '"') {
        value = text.size() > 1 ? static_cast<unsigned char>(text[1]) : 0;
        return true;
    }
    char* end = nullptr;
    value = std::strtold(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

long long clamp_to_long_long(long double value) {
    if (std::isnan(value)) {
        return 0;
    }
    if (value >= static_cast<long double>(std::numeric_limits<long long>::max())) {
        return std::numeric_limits<long long>::max();
    }
    if (value <= static_cast<long double>(std::numeric_limits<long long>::min())) {
        return std::numeric_limits<long long>::min();
    }
    return static_cast<long long>(value);
}

template <typename T>
std::string format_value(const std::string& fmt, T value) {
    int needed = std::snprintf(nullptr, 0, fmt.c_str(), value);
    if (needed < 0) {
        return std::string();
    }
    std::string out(static_cast<size_t>(needed) + 1, '\0');
    std::snprintf(&out[0], out.size(), fmt.c_str(), value);
    out.resize(static_cast<size_t>(needed));
    return out;
}

// Formats one %-directive. flags holds flags, width and precision without the
// leading '%' or the conversion letter.
std::string format_directive(const std::string& flags, char conversion, const std::string& arg,
                             bool& bad_number) {
    std::string fmt = "%" + flags;
    long double number = 0;
    switch (conversion) {
        case 'c':
            return format_value(fmt + 'c',
                                arg.empty() ? 0 : static_cast<int>(static_cast<unsigned char>(arg[0])));
        case 'd':
        case 'i':
            bad_number = !printf_number(arg, number);
            return format_value(fmt + "ll" + conversion, clamp_to_long_long(number));
        case 'o':
        case 'u':
        case 'x':
        case 'X':
            bad_number = !printf_number(arg, number);
            return format_value(fmt + "ll" + conversion,
                                static_cast<unsigned long long>(clamp_to_long_long(number)));
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
            bad_number = !printf_number(arg, number);
            return format_value(fmt + 'L' + conversion, number);
        default:
            return format_value(fmt + 's', arg.c_str());
    }
}

}  // namespace

int grep_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: grep [-i] [-v] [-n] [-c] PATTERN [FILE ...]",
                             "Print lines matching PATTERN (ECMAScript regular expression).",
                             "-i ignores case, -v inverts, -n numbers lines, -c counts matches.",
                             "Exit status is 0 if a line was selected, 1 if none, 2 on error."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "ivncE", parsed, ctx)) {
        return 2;
    }
    if (parsed.operands.empty()) {
        print_error({ErrorType::INVALID_ARGUMENT, "grep", "missing pattern", {"Usage: grep [-i] [-v] [-n] [-c] PATTERN [FILE ...]"}},
                    ctx.err);
        return 2;
    }

    const bool invert = parsed.flags.count('v') > 0;
    const bool number = parsed.flags.count('n') > 0;
    const bool count_only = parsed.flags.count('c') > 0;
    auto syntax = std::regex::ECMAScript;
    if (parsed.flags.count('i') > 0) {
        syntax |= std::regex::icase;
    }

    std::regex pattern;
    try {
        pattern = std::regex(parsed.operands[0], syntax);
    } catch (const std::regex_error& e) {
        print_error({ErrorType::INVALID_ARGUMENT, "grep", "invalid pattern: " + std::string(e.what()), {}},
                    ctx.err);
        return 2;
    }

    std::vector<std::string> files(parsed.operands.begin() + 1, parsed.operands.end());
    const bool prefix_names = files.size() > 1;
    if (files.empty()) {
        files.push_back("-");
    }

    bool any_selected = false;
    bool had_error = false;
    std::string output;
    for (const auto& file : files) {
        std::string text;
        if (file == "-") {
            text = ctx.read_stdin();
        } else {
            auto content = ctx.fs.read_file(ctx.resolve(file));
            if (content.is_error()) {
                print_error("grep", content, ctx.err);
                had_error = true;
                continue;
            }
            text = content.value();
        }

        const std::string prefix = prefix_names ? file + ":" : "";
        size_t selected = 0;
        const auto lines = string_utils::split_lines(text);
        for (size_t i = 0; i < lines.size(); ++i) {
            bool found = std::regex_search(lines[i], pattern);
            if (found == invert) {
                continue;
            }
            ++selected;
            if (!count_only) {
                output += prefix;
                if (number) {
                    output += std::to_string(i + 1) + ":";
                }
                output += lines[i] + "\n";
            }
        }
        if (count_only) {
            output += prefix + std::to_string(selected) + "\n";
        }
        any_selected = any_selected || selected > 0;
    }
    ctx.out(output);

    if (had_error) {
        return 2;
    }
    return any_selected ? 0 : 1;
}

int head_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: head [-n N] [FILE ...]",
                             "Print the first N lines (default 10)."},
                            ctx)) {
        return 0;
    }
    long long count = 10;
    bool from_start = false;
    std::vector<std::string> files;
    if (!parse_line_count(args, count, from_start, files, ctx)) {
        return 1;
    }

    bool ok = true;
    auto lines = string_utils::split_lines(builtin_utils::read_inputs(files, ctx, "head", ok));
    if (static_cast<size_t>(count) < lines.size()) {
        lines.resize(static_cast<size_t>(count));
    }
    ctx.out(join_lines(lines));
    return ok ? 0 : 1;
}

int tail_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: tail [-n [+]N] [FILE ...]",
                             "Print the last N lines (default 10); +N starts at line N."},
                            ctx)) {
        return 0;
    }
    long long count = 10;
    bool from_start = false;
    std::vector<std::string> files;
    if (!parse_line_count(args, count, from_start, files, ctx)) {
        return 1;
    }

    bool ok = true;
    auto lines = string_utils::split_lines(builtin_utils::read_inputs(files, ctx, "tail", ok));
    size_t first = 0;
    if (from_start) {
        first = count > 0 ? static_cast<size_t>(count - 1) : 0;
    } else if (static_cast<size_t>(count) < lines.size()) {
        first = lines.size() - static_cast<size_t>(count);
    }
    if (first > lines.size()) {
        first = lines.size();
    }
    ctx.out(join_lines(std::vector<std::string>(lines.begin() + static_cast<long>(first),
                                                lines.end())));
    return ok ? 0 : 1;
}

int wc_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: wc [-l] [-w] [-c] [FILE ...]",
                             "Print newline, word and byte counts."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "lwcm", parsed, ctx)) {
        return 2;
    }
    bool lines_flag = parsed.flags.count('l') > 0;
    bool words_flag = parsed.flags.count('w') > 0;
    bool bytes_flag = parsed.flags.count('c') > 0 || parsed.flags.count('m') > 0;
    if (!lines_flag && !words_flag && !bytes_flag) {
        lines_flag = words_flag = bytes_flag = true;
    }

    struct Counts {
        size_t lines = 0;
        size_t words = 0;
        size_t bytes = 0;
    };
    auto count_text = [](const std::string& text) {
        Counts counts;
        counts.bytes = text.size();
        counts.lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
        std::istringstream stream(text);
        std::string word;
        while (stream >> word) {
            ++counts.words;
        }
        return counts;
    };
    auto format = [&](const Counts& counts, const std::string& name) {
        std::vector<std::string> fields;
        if (lines_flag) {
            fields.push_back(std::to_string(counts.lines));
        }
        if (words_flag) {
            fields.push_back(std::to_string(counts.words));
        }
        if (bytes_flag) {
            fields.push_back(std::to_string(counts.bytes));
        }
        if (!name.empty()) {
            fields.push_back(name);
        }
        return string_utils::join(fields, " ") + "\n";
    };

    if (parsed.operands.empty()) {
        ctx.out(format(count_text(ctx.read_stdin()), ""));
        return 0;
    }

    int status = 0;
    Counts total;
    std::string output;
    for (const auto& file : parsed.operands) {
        std::string text;
        if (file == "-") {
            text = ctx.read_stdin();
        } else {
            auto content = ctx.fs.read_file(ctx.resolve(file));
            if (content.is_error()) {
                print_error("wc", content, ctx.err);
                status = 1;
                continue;
            }
            text = content.value();
        }
        Counts counts = count_text(text);
        total.lines += counts.lines;
        total.words += counts.words;
        total.bytes += counts.bytes;
        output += format(counts, file);
    }
    if (parsed.operands.size() > 1) {
        output += format(total, "total");
    }
    ctx.out(output);
    return status;
}

int sort_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: sort [-r] [-u] [-n] [FILE ...]",
                             "Sort lines. -r reverses, -u drops duplicates, -n compares "
                             "numerically."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "run", parsed, ctx)) {
        return 2;
    }
    const bool reverse = parsed.flags.count('r') > 0;
    const bool unique = parsed.flags.count('u') > 0;
    const bool numeric = parsed.flags.count('n') > 0;

    bool ok = true;
    auto lines =
        string_utils::split_lines(builtin_utils::read_inputs(parsed.operands, ctx, "sort", ok));

    auto leading_number = [](const std::string& line) {
        return std::strtod(line.c_str(), nullptr);
    };
    auto less = [&](const std::string& a, const std::string& b) {
        if (numeric) {
            double x = leading_number(a);
            double y = leading_number(b);
            if (x != y) {
                return x < y;
            }
        }
        return a < b;
    };
    std::stable_sort(lines.begin(), lines.end(), less);
    if (reverse) {
        std::reverse(lines.begin(), lines.end());
    }
    if (unique) {
        lines.erase(std::unique(lines.begin(), lines.end(),
                                [&](const std::string& a, const std::string& b) {
                                    return !less(a, b) && !less(b, a);
                                }),
                    lines.end());
    }
    ctx.out(join_lines(lines));
    return ok ? 0 : 1;
}

int uniq_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: uniq [-c] [FILE]",
                             "Collapse adjacent duplicate lines; -c prefixes each with its count."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "c", parsed, ctx)) {
        return 2;
    }
    const bool with_counts = parsed.flags.count('c') > 0;

    bool ok = true;
    auto lines =
        string_utils::split_lines(builtin_utils::read_inputs(parsed.operands, ctx, "uniq", ok));

    std::string output;
    for (size_t i = 0; i < lines.size();) {
        size_t j = i + 1;
        while (j < lines.size() && lines[j] == lines[i]) {
            ++j;
        }
        if (with_counts) {
            std::string count = std::to_string(j - i);
            if (count.size() < 7) {
                count.insert(0, 7 - count.size(), ' ');
            }
            output += count + " ";
        }
        output += lines[i] + "\n";
        i = j;
    }
    ctx.out(output);
    return ok ? 0 : 1;
}

int tee_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: tee [-a] FILE ...",
                             "Copy standard input to standard output and to each FILE.",
                             "-a appends instead of overwriting."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "a", parsed, ctx)) {
        return 2;
    }

    const std::string data = ctx.read_stdin();
    int status = 0;
    for (const auto& file : parsed.operands) {
        vfs::WriteOptions options;
        options.append = parsed.flags.count('a') > 0;
        options.uid = ctx.session.uid;
        options.gid = ctx.session.gid;
        auto result = ctx.fs.write_file(ctx.resolve(file), data, options);
        if (result.is_error()) {
            print_error("tee", result, ctx.err);
            status = 1;
        }
    }
    ctx.out(data);
    return status;
}

int seq_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: seq [FIRST [STEP]] LAST",
                             "Print numbers from FIRST (default 1) to LAST by STEP (default 1)."},
                            ctx)) {
        return 0;
    }
    std::vector<double> values;
    bool integral = true;
    for (size_t i = 1; i < args.size(); ++i) {
        char* end = nullptr;
        double value = std::strtod(args[i].c_str(), &end);
        if (args[i].empty() || *end != '\0' || !std::isfinite(value)) {
            print_error({ErrorType::INVALID_ARGUMENT, "seq", "invalid floating point argument: '" + args[i] + "'", {}},
                        ctx.err);
            return 1;
        }
        integral = integral && value == std::floor(value);
        values.push_back(value);
    }

    double first = 1;
    double step = 1;
    double last = 0;
    if (values.size() == 1) {
        last = values[0];
    } else if (values.size() == 2) {
        first = values[0];
        last = values[1];
    } else if (values.size() == 3) {
        first = values[0];
        step = values[1];
        last = values[2];
    } else {
        print_error({ErrorType::INVALID_ARGUMENT, "seq", values.empty() ? "missing operand" : "extra operand", {}},
                    ctx.err);
        return 1;
    }
    if (step == 0) {
        print_error({ErrorType::INVALID_ARGUMENT, "seq", "invalid Zero increment value", {}}, ctx.err);
        return 1;
    }

    // the count is fixed up front so a step too small to change the value cannot loop forever
    constexpr double kLongLongLimit = 9.2e18;
    const double span = (last - first) / step;
    if (span > kLongLongLimit) {
        print_error({ErrorType::INVALID_ARGUMENT, "seq", "too many values", {}}, ctx.err);
        return 1;
    }
    if (integral && (std::fabs(first) > kLongLongLimit || std::fabs(last) > kLongLongLimit)) {
        print_error({ErrorType::INVALID_ARGUMENT, "seq", "value out of range", {}}, ctx.err);
        return 1;
    }
    const long long count = span < 0 ? 0 : static_cast<long long>(std::floor(span + 1e-9)) + 1;

    std::string output;
    for (long long k = 0; k < count; ++k) {
        const double value = first + static_cast<double>(k) * step;
        if (integral) {
            output += std::to_string(static_cast<long long>(value));
        } else {
            std::ostringstream stream;
            stream << value;
            output += stream.str();
        }
        output += '\n';
    }
    ctx.out(output);
    return 0;
}

int printf_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: printf FORMAT [ARGUMENT ...]",
                             "Print ARGUMENTs according to FORMAT.",
                             "Directives: %s %b %c %d %i %o %u %x %X %e %f %g %%, with optional",
                             "flags (-+ #0), width and precision. Backslash escapes are expanded.",
                             "FORMAT is reused while ARGUMENTs remain."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "printf", "missing operand", {"Usage: printf FORMAT [ARGUMENT ...]"}},
                    ctx.err);
        return 1;
    }

    const std::string& format = args[1];
    size_t next_arg = 2;
    int status = 0;
    bool stopped = false;
    std::string output;

    do {
        bool consumed = false;
        std::string literal;
        auto flush_literal = [&]() {
            if (!literal.empty() && !stopped) {
                output += process_escape_sequences(literal, &stopped);
            }
            literal.clear();
        };

        for (size_t i = 0; i < format.size() && !stopped; ++i) {
            if (format[i] == '\\' && i + 1 < format.size()) {
                literal += format[i];
                literal += format[++i];
                continue;
            }
            if (format[i] != '%') {
                literal += format[i];
                continue;
            }
            if (i + 1 < format.size() && format[i + 1] == '%') {
                literal += '%';
                ++i;
                continue;
            }

            flush_literal();
            size_t j = i + 1;
            while (j < format.size() && std::strchr("-+ #0", format[j]) != nullptr) {
                ++j;
            }
            while (j < format.size() && std::isdigit(static_cast<unsigned char>(format[j]))) {
                ++j;
            }
            if (j < format.size() && format[j] == '.') {
                ++j;
                while (j < format.size() && std::isdigit(static_cast<unsigned char>(format[j]))) {
                    ++j;
                }
            }
            if (j >= format.size() || std::strchr("sbcdiouxXeEfFgG", format[j]) == nullptr) {
                print_error({ErrorType::INVALID_ARGUMENT, "printf", "%" + format.substr(i + 1, j - i) + ": invalid directive", {}},
                            ctx.err);
                ctx.out(output);
                return 1;
            }

            const char conversion = format[j];
            std::string arg;
            if (next_arg < args.size()) {
                arg = args[next_arg++];
                consumed = true;
            }
            if (conversion == 'b') {
                output += process_escape_sequences(arg, &stopped);
            } else {
                bool bad_number = false;
                output += format_directive(format.substr(i + 1, j - i - 1), conversion, arg,
                                           bad_number);
                if (bad_number) {
                    print_error({ErrorType::INVALID_ARGUMENT, "printf", "'" + arg + "': expected a numeric value", {}},
                                ctx.err);
                    status = 1;
                }
            }
            i = j;
        }
        flush_literal();
        if (!consumed) {
            break;
        }
    } while (next_arg < args.size() && !stopped);

    ctx.out(output);
    return status;
}
