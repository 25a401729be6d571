// ==============================================================================
// output.cpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Запись только через fwrite; std::endl не используется.
//
// ==============================================================================

#include "jumplist/output.hpp"

#include "jumplist/platform.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace jumplist::output {

namespace {

constexpr std::string_view ANSI_RESET = "\x1b[0m";

FILE* open_for_write(const std::filesystem::path& path) {
#ifdef _WIN32
    return _wfopen(path.c_str(), L"wb");
#else
    return std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
}

}  // namespace

std::string_view level_prefix(Level level) {
    switch (level) {
    case Level::Info:
        return "[+]";
    case Level::Warn:
        return "[!]";
    case Level::Error:
        return "[x]";
    case Level::Debug:
        return "[*]";
    case Level::Trace:
        return "[~]";
    }
    return "[?]";
}

std::string_view level_color(Level level) {
    switch (level) {
    case Level::Info:
        return "\x1b[32m";
    case Level::Warn:
        return "\x1b[33m";
    case Level::Error:
        return "\x1b[31m";
    case Level::Debug:
        return "\x1b[36m";
    case Level::Trace:
        return "\x1b[35m";
    }
    return "";
}

std::string format_log_line(Level level, std::string_view message) {
    std::string line(level_prefix(level));
    line += ' ';
    line.append(message);
    line += '\n';
    return line;
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg)
    : config_(cfg), color_(platform::is_tty_stderr()) {
    if (config_.output_path.has_value()) {
        data_file_ = open_for_write(*config_.output_path);
    }
}

Writer::~Writer() {
    flush();
    if (data_file_ != nullptr) {
        std::fclose(data_file_);
    }
}

FILE* Writer::target(Stream s) const {
    if (s == Stream::Stderr) {
        return stderr;
    }
    return data_file_ != nullptr ? data_file_ : stdout;
}

void Writer::write(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), target(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> json(buffer);
    value.Accept(json);

    write_line(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Info:
    case Level::Warn:
        return !config_.quiet;
    case Level::Error:
        return true;
    case Level::Debug:
        return config_.verbose > 0;
    case Level::Trace:
        return config_.verbose > 1;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    if (!color_) {
        write(Stream::Stderr, format_log_line(level, message));
        return;
    }
    std::string line(level_color(level));
    line.append(level_prefix(level));
    line.append(ANSI_RESET);
    line += ' ';
    line.append(message);
    line += '\n';
    write(Stream::Stderr, line);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (data_file_ != nullptr) {
        std::fflush(data_file_);
    }
}

}  // namespace jumplist::output
