// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер без сторонних библиотек; формат help и ошибок
// повторяет clap v4.
//
// ==============================================================================

#include "codecollector/cli.hpp"

#include "codecollector/pattern.hpp"
#include "codecollector/platform.hpp"

#include <cstring>
#include <utility>

namespace codecollector::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_line(const std::string& command) {
    if (command == "collect") {
        return "Usage: codecollector collect [OPTIONS] [PATH]";
    }
    if (command == "analyze") {
        return "Usage: codecollector analyze [OPTIONS] <FILE>...";
    }
    if (command == "cache") {
        return "Usage: codecollector cache <COMMAND>";
    }
    if (command == "cache list") {
        return "Usage: codecollector cache list [OPTIONS]";
    }
    if (command == "cache clear") {
        return "Usage: codecollector cache clear [OPTIONS] [PROJECT]";
    }
    return "Usage: codecollector [OPTIONS] <COMMAND>";
}

/// error + Usage + подсказка, как это делает clap
std::string usage_error(const std::string& error_msg, const std::string& command) {
    return "error: " + error_msg + "\n\n" + usage_line(command) +
           "\n\n"
           "For more information, try '--help'.\n";
}

/// Разбор опций подкоманды: значения, ошибки, общие флаги
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start, std::string command, ParseResult& result)
        : argc_(argc), argv_(argv), i_(start), command_(std::move(command)), result_(result) {}

    bool done() const { return i_ >= argc_; }
    const char* current() const { return argv_[i_]; }
    void advance() { ++i_; }

    /// Совпадение опции с коротким/длинным именем; "--long=value" тоже
    bool is(const char* short_name, const char* long_name) const {
        const char* arg = current();
        if (short_name != nullptr && str_eq(arg, short_name)) {
            return true;
        }
        if (long_name == nullptr) {
            return false;
        }
        if (str_eq(arg, long_name)) {
            return true;
        }
        const std::size_t n = std::strlen(long_name);
        return std::strncmp(arg, long_name, n) == 0 && arg[n] == '=';
    }

    /// Значение опции: "--opt=value" или следующий аргумент
    std::optional<std::string> value(const char* display) {
        const char* arg = current();
        if (const char* eq = std::strchr(arg, '='); eq != nullptr && starts_with(arg, "--")) {
            return std::string(eq + 1);
        }
        if (i_ + 1 >= argc_) {
            fail("a value is required for '" + std::string(display) + "' but none was supplied");
            return std::nullopt;
        }
        ++i_;
        return std::string(argv_[i_]);
    }

    /// Флаги, общие для всех подкоманд; true если аргумент поглощён
    bool global_flag() {
        const char* arg = current();
        if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result_.global.quiet = true;
            return true;
        }
        if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            result_.global.verbose++;
            return true;
        }
        if (str_eq(arg, "-vv")) {
            result_.global.verbose += 2;
            return true;
        }
        if (str_eq(arg, "--no-banner")) {
            result_.global.no_banner = true;
            return true;
        }
        return false;
    }

    void fail(const std::string& message) {
        result_.ok = false;
        result_.diagnostic.exit_code = 2;
        result_.diagnostic.stderr_message = usage_error(message, command_);
    }

    void unexpected() {
        fail("unexpected argument '" + std::string(current()) + "' found");
    }

private:
    int argc_;
    char** argv_;
    int i_;
    std::string command_;
    ParseResult& result_;
};

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

bool is_positional(const char* arg) {
    return arg[0] != '-' || str_eq(arg, "-");
}

// ----------------------------------------------------------------------------
// Разбор подкоманд
// ----------------------------------------------------------------------------

void parse_collect(int argc, char** argv, int start, ParseResult& result) {
    CollectCommand cmd;
    bool have_path = false;
    ArgCursor args(argc, argv, start, "collect", result);

    for (; !args.done(); args.advance()) {
        const char* arg = args.current();

        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"collect"};
            return;
        }
        if (args.global_flag()) {
            continue;
        }

        if (args.is("-i", "--include")) {
            auto v = args.value("--include <GLOB>");
            if (!v) {
                return;
            }
            cmd.include.push_back(*v);
        } else if (args.is("-e", "--exclude")) {
            auto v = args.value("--exclude <GLOB>");
            if (!v) {
                return;
            }
            cmd.exclude.push_back(*v);
        } else if (args.is("-t", "--file-type")) {
            auto v = args.value("--file-type <TYPE>");
            if (!v) {
                return;
            }
            cmd.file_types.push_back(io::normalize_file_type(*v));
        } else if (args.is("-o", "--output")) {
            auto v = args.value("--output <FILE>");
            if (!v) {
                return;
            }
            cmd.output = platform::path_from_utf8(*v);
        } else if (args.is(nullptr, "--cache-dir")) {
            auto v = args.value("--cache-dir <DIR>");
            if (!v) {
                return;
            }
            cmd.cache_dir = platform::path_from_utf8(*v);
        } else if (args.is(nullptr, "--format")) {
            auto v = args.value("--format <FORMAT>");
            if (!v) {
                return;
            }
            if (*v != "standard" && *v != "indexed") {
                args.fail("invalid value '" + *v +
                          "' for '--format <FORMAT>'\n  [possible values: standard, indexed]");
                return;
            }
            cmd.format = *v;
        } else if (args.is(nullptr, "--config")) {
            auto v = args.value("--config <FILE>");
            if (!v) {
                return;
            }
            cmd.config = platform::path_from_utf8(*v);
        } else if (str_eq(arg, "--no-cache")) {
            cmd.no_cache = true;
        } else if (str_eq(arg, "--no-analysis")) {
            cmd.no_analysis = true;
        } else if (is_positional(arg) && !have_path) {
            cmd.path = platform::path_from_utf8(arg);
            have_path = true;
        } else {
            args.unexpected();
            return;
        }
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_analyze(int argc, char** argv, int start, ParseResult& result) {
    AnalyzeCommand cmd;
    ArgCursor args(argc, argv, start, "analyze", result);

    for (; !args.done(); args.advance()) {
        const char* arg = args.current();

        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"analyze"};
            return;
        }
        if (args.global_flag()) {
            continue;
        }

        if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (is_positional(arg)) {
            cmd.files.push_back(platform::path_from_utf8(arg));
        } else {
            args.unexpected();
            return;
        }
    }

    if (cmd.files.empty()) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            "error: the following required arguments were not provided:\n"
            "  <FILE>...\n\n" +
            usage_line("analyze") +
            "\n\n"
            "For more information, try '--help'.\n";
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_cache(int argc, char** argv, int start, ParseResult& result) {
    if (start >= argc) {
        result.ok = true;
        result.command = HelpCommand{"cache"};
        return;
    }

    const char* sub = argv[start];

    if (is_help(sub) || str_eq(sub, "help")) {
        result.ok = true;
        result.command = HelpCommand{"cache"};
        return;
    }

    if (str_eq(sub, "list")) {
        CacheListCommand cmd;
        ArgCursor args(argc, argv, start + 1, "cache list", result);
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{"cache list"};
                return;
            }
            if (args.global_flag()) {
                continue;
            }
            if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                cmd.json = true;
            } else if (args.is(nullptr, "--cache-dir")) {
                auto v = args.value("--cache-dir <DIR>");
                if (!v) {
                    return;
                }
                cmd.cache_dir = platform::path_from_utf8(*v);
            } else {
                args.unexpected();
                return;
            }
        }
        result.ok = true;
        result.command = std::move(cmd);
        return;
    }

    if (str_eq(sub, "clear")) {
        CacheClearCommand cmd;
        ArgCursor args(argc, argv, start + 1, "cache clear", result);
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{"cache clear"};
                return;
            }
            if (args.global_flag()) {
                continue;
            }
            if (args.is(nullptr, "--cache-dir")) {
                auto v = args.value("--cache-dir <DIR>");
                if (!v) {
                    return;
                }
                cmd.cache_dir = platform::path_from_utf8(*v);
            } else if (is_positional(arg) && !cmd.project.has_value()) {
                cmd.project = std::string(arg);
            } else {
                args.unexpected();
                return;
            }
        }
        result.ok = true;
        result.command = std::move(cmd);
        return;
    }

    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message =
        usage_error(std::string("unrecognized subcommand '") + sub + "'", "cache");
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: codecollector [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  collect  Collect project files into a single report\n"
               "  analyze  Show size and token statistics for files\n"
               "  cache    Manage the collection cache\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -q, --quiet      Suppress informational output\n"
               "  -v...            Print verbose output\n"
               "      --no-banner  Hide the banner\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Collect the current directory:\n"
               "        ./codecollector collect\n"
               "\n"
               "    Collect only Python files, skipping tests:\n"
               "        ./codecollector collect src/ -t py -e tests/ -o report.txt\n"
               "\n"
               "    Token statistics for a report:\n"
               "        ./codecollector analyze collected_code.txt\n";
    }

    if (*command == "collect") {
        return "Collect project files into a single report\n"
               "\n"
               "Usage: codecollector collect [OPTIONS] [PATH]\n"
               "\n"
               "Arguments:\n"
               "  [PATH]  Project root to scan [default: .]\n"
               "\n"
               "Options:\n"
               "  -i, --include <GLOB>    Only collect files whose name matches GLOB\n"
               "  -e, --exclude <GLOB>    Skip paths matching GLOB (trailing '/' = directory)\n"
               "  -t, --file-type <TYPE>  Collect files of this type (py, .py or *.py)\n"
               "  -o, --output <FILE>     Report file [default: collected_code.txt]\n"
               "      --no-cache          Do not read or update the cache\n"
               "      --cache-dir <DIR>   Cache directory [default: .code_cache]\n"
               "      --format <FORMAT>   Report layout [possible values: standard, indexed]\n"
               "      --config <FILE>     YAML configuration file\n"
               "      --no-analysis       Do not print token statistics of the report\n"
               "  -h, --help              Print help\n";
    }
    if (*command == "analyze") {
        return "Show size and token statistics for files\n"
               "\n"
               "Usage: codecollector analyze [OPTIONS] <FILE>...\n"
               "\n"
               "Arguments:\n"
               "  <FILE>...  Files to analyze\n"
               "\n"
               "Options:\n"
               "  -j, --json  Output as JSON\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "cache") {
        return "Manage the collection cache\n"
               "\n"
               "Usage: codecollector cache <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  list   List cached collections\n"
               "  clear  Remove cached collections\n"
               "  help   Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "cache list") {
        return "List cached collections\n"
               "\n"
               "Usage: codecollector cache list [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -j, --json             Output as JSON\n"
               "      --cache-dir <DIR>  Cache directory [default: .code_cache]\n"
               "  -h, --help             Print help\n";
    }
    if (*command == "cache clear") {
        return "Remove cached collections\n"
               "\n"
               "Usage: codecollector cache clear [OPTIONS] [PROJECT]\n"
               "\n"
               "Arguments:\n"
               "  [PROJECT]  Only remove entries whose key starts with PROJECT\n"
               "\n"
               "Options:\n"
               "      --cache-dir <DIR>  Cache directory [default: .code_cache]\n"
               "  -h, --help             Print help\n";
    }

    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                usage_error("unexpected argument '" + std::string(arg) + "' found", "");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "collect")) {
        parse_collect(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "analyze") || str_eq(cmd, "analyse")) {
        parse_analyze(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "cache")) {
        parse_cache(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 2 < argc && str_eq(argv[cmd_idx + 1], "cache")) {
            result.command = HelpCommand{std::string("cache ") + argv[cmd_idx + 2]};
        } else if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            usage_error(std::string("unrecognized subcommand '") + cmd + "'", "");
    }

    return result;
}

}  // namespace codecollector::cli
