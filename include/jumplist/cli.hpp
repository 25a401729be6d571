// ==============================================================================
// jumplist/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef JUMPLIST_CLI_HPP
#define JUMPLIST_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jumplist::cli {

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

enum class OutputFormat { Csv, Json, Jsonl };

/// Разбор jump list файлов
struct ParseCommand {
    /// -p/--path и позиционные аргументы; пусто - пути по умолчанию
    std::vector<std::filesystem::path> paths;
    std::optional<std::filesystem::path> output;  // -o, --output
    OutputFormat format = OutputFormat::Csv;      // --output-format
    bool no_headers = false;                      // --no-headers
    bool normalize = false;                       // --normalize
    std::optional<std::filesystem::path> appids;  // --appids
    bool skip_errors = false;                     // --skip-errors
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<ParseCommand, HelpCommand, VersionCommand>;

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

std::string render_help();

std::string render_version();

/// "csv" / "json" / "jsonl"
std::optional<OutputFormat> parse_output_format(const std::string& value);

constexpr const char* PROGRAM_NAME = "jumplist";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Windows Jump List Files Parser";

}  // namespace jumplist::cli

#endif  // JUMPLIST_CLI_HPP
