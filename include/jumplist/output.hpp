// ==============================================================================
// jumplist/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Writer - единственная точка записи в stdout/stderr:
// - данные отчёта идут в stdout или в файл --output
// - журнал идёт в stderr с префиксами [+] [!] [x] [*] [~]
// - префикс окрашивается, только если stderr - терминал
//
// ==============================================================================

#ifndef JUMPLIST_OUTPUT_HPP
#define JUMPLIST_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace jumplist::output {

enum class Stream { Stdout, Stderr };

enum class Level {
    Info,   // [+], скрыт при -q
    Warn,   // [!], скрыт при -q
    Error,  // [x], печатается всегда
    Debug,  // [*], с -v
    Trace   // [~], с -vv
};

struct OutputConfig {
    bool quiet = false;  // -q
    int verbose = 0;     // число -v

    /// Файл для данных отчёта (--output)
    std::optional<std::filesystem::path> output_path;
};

class Writer {
public:
    /// При заданном output_path файл открывается сразу; см. has_output_file()
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Stdout уходит в файл вывода, если он открыт
    void write(Stream s, std::string_view bytes);

    void write_line(Stream s, std::string_view bytes);

    /// Компактный JSON, перевод строки и flush
    void write_json_line(const rapidjson::Value& value);

    /// Уровень проходит фильтр -q / -v
    bool enabled(Level level) const;

    /// "<prefix> <message>\n" в stderr, если уровень включён
    void log(Level level, std::string_view message);

    void info(std::string_view message) { log(Level::Info, message); }
    void warn(std::string_view message) { log(Level::Warn, message); }
    void error(std::string_view message) { log(Level::Error, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return data_file_ != nullptr; }

private:
    FILE* target(Stream s) const;

    OutputConfig config_;
    FILE* data_file_ = nullptr;
    bool color_ = false;
};

/// "[+]", "[!]", "[x]", "[*]", "[~]"
std::string_view level_prefix(Level level);

/// ANSI SGR код цвета префикса
std::string_view level_color(Level level);

/// Строка журнала без цвета: "<prefix> <message>\n"
std::string format_log_line(Level level, std::string_view message);

}  // namespace jumplist::output

#endif  // JUMPLIST_OUTPUT_HPP
