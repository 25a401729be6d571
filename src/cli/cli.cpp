// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер: сообщения об ошибках в стиле clap
// ("error: ...\n\nFor more information, try '--help'.\n", exit code 2).
//
// ==============================================================================

#include "jumplist/cli.hpp"

#include "jumplist/platform.hpp"

#include <cstring>

namespace jumplist::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

constexpr const char* MORE_INFO = "For more information, try '--help'.\n";

CliDiagnostic usage_error(const std::string& message, bool with_usage) {
    CliDiagnostic diag;
    diag.exit_code = 2;
    diag.stderr_message = "error: " + message + "\n\n";
    if (with_usage) {
        diag.stderr_message += std::string("Usage: ") + PROGRAM_NAME + " [OPTIONS] [PATH]...\n\n";
    }
    diag.stderr_message += MORE_INFO;
    return diag;
}

CliDiagnostic missing_value(const char* option) {
    return usage_error(std::string("a value is required for '") + option +
                           "' but none was supplied",
                       false);
}

/// Опция со значением: "--name value" или "--name=value"
/// @return true если arg совпал с опцией (значение в out либо ошибка в diag)
bool take_value(const char* short_name, const char* long_name, const char* display, int argc,
                char** argv, int& i, std::optional<std::string>& out,
                std::optional<CliDiagnostic>& diag) {
    const char* arg = argv[i];
    const std::string long_eq = std::string(long_name) + "=";

    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 >= argc) {
            diag = missing_value(display);
            return true;
        }
        out = argv[++i];
        return true;
    }
    if (starts_with(arg, long_eq.c_str())) {
        out = std::string(arg + long_eq.size());
        return true;
    }
    return false;
}

}  // namespace

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: jumplist [OPTIONS] [PATH]...\n"
           "\n"
           "Arguments:\n"
           "  [PATH]...  Jump list files, directories or glob patterns to parse\n"
           "\n"
           "Options:\n"
           "  -p, --path <PATH>               Jump list file, directory or glob pattern (repeatable;\n"
           "                                  defaults to AutomaticDestinations and\n"
           "                                  CustomDestinations of all users)\n"
           "  -o, --output <FILE>             Write the output to a file\n"
           "      --output-format <FORMAT>    Output format [default: csv] [possible values: csv, "
           "json, jsonl]\n"
           "      --no-headers                Don't print headers when using CSV\n"
           "      --normalize                 Normalize the result to the most important fields\n"
           "      --appids <FILE>             YAML file with additional AppID to name mappings\n"
           "      --skip-errors               Skip unreadable paths and continue processing\n"
           "      --no-banner                 Hide the banner\n"
           "  -q                              Suppress informational output\n"
           "  -v...                           Print verbose output\n"
           "  -h, --help                      Print help\n"
           "  -V, --version                   Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Parse the jump lists of all users as CSV:\n"
           "        ./jumplist\n"
           "\n"
           "    Parse a directory and write normalized JSON lines to a file:\n"
           "        ./jumplist -p Recent/AutomaticDestinations --output-format jsonl "
           "--normalize -o out.jsonl\n";
}

std::optional<OutputFormat> parse_output_format(const std::string& value) {
    if (value == "csv") {
        return OutputFormat::Csv;
    }
    if (value == "json") {
        return OutputFormat::Json;
    }
    if (value == "jsonl") {
        return OutputFormat::Jsonl;
    }
    return std::nullopt;
}

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    ParseCommand cmd;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::optional<std::string> value;
        std::optional<CliDiagnostic> diag;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (arg[0] == '-' && arg[1] == 'v' && arg[1 + std::strspn(arg + 1, "v")] == '\0') {
            // -v, -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
        } else if (str_eq(arg, "--no-headers")) {
            cmd.no_headers = true;
        } else if (str_eq(arg, "--normalize")) {
            cmd.normalize = true;
        } else if (str_eq(arg, "--skip-errors")) {
            cmd.skip_errors = true;
        } else if (take_value("-p", "--path", "--path <PATH>", argc, argv, i, value, diag)) {
            if (diag) {
                result.diagnostic = *diag;
                return result;
            }
            cmd.paths.push_back(platform::path_from_utf8(*value));
        } else if (take_value("-o", "--output", "--output <FILE>", argc, argv, i, value, diag)) {
            if (diag) {
                result.diagnostic = *diag;
                return result;
            }
            cmd.output = platform::path_from_utf8(*value);
        } else if (take_value(nullptr, "--output-format", "--output-format <FORMAT>", argc, argv,
                              i, value, diag)) {
            if (diag) {
                result.diagnostic = *diag;
                return result;
            }
            auto format = parse_output_format(*value);
            if (!format) {
                result.diagnostic = usage_error(
                    "invalid value '" + *value +
                        "' for '--output-format <FORMAT>'\n  [possible values: csv, json, jsonl]",
                    false);
                return result;
            }
            cmd.format = *format;
        } else if (take_value(nullptr, "--appids", "--appids <FILE>", argc, argv, i, value,
                              diag)) {
            if (diag) {
                result.diagnostic = *diag;
                return result;
            }
            cmd.appids = platform::path_from_utf8(*value);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            result.diagnostic = usage_error(std::string("unexpected argument '") + arg + "' found",
                                            true);
            return result;
        } else {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

}  // namespace jumplist::cli
