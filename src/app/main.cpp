// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Поиск файлов, разбор, отчёт
// 4. Возврат exit code
//
// Исключения перехватываются на границе приложения.
//
// ==============================================================================

#include "jumplist/appids.hpp"
#include "jumplist/cli.hpp"
#include "jumplist/discovery.hpp"
#include "jumplist/jumplist.hpp"
#include "jumplist/output.hpp"
#include "jumplist/platform.hpp"
#include "jumplist/report.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

constexpr const char* BANNER = R"(
     _                       _ _     _
    (_)_   _ _ __ ___  _ __ | (_)___| |_
    | | | | | '_ ` _ \| '_ \| | / __| __|
    | | |_| | | | | | | |_) | | \__ \ |_
   _/ |\__,_|_| |_| |_| .__/|_|_|___/\__|
  |__/                |_|
)";

void print_banner(jumplist::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(jumplist::output::Stream::Stderr, BANNER);
    writer.write_line(jumplist::output::Stream::Stderr, "");
}

jumplist::output::Format to_output_format(jumplist::cli::OutputFormat f) {
    switch (f) {
    case jumplist::cli::OutputFormat::Json:
        return jumplist::output::Format::Json;
    case jumplist::cli::OutputFormat::Jsonl:
        return jumplist::output::Format::Jsonl;
    case jumplist::cli::OutputFormat::Csv:
    default:
        return jumplist::output::Format::Csv;
    }
}

std::string file_size_string(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? std::string("unknown") : std::to_string(size);
}

int run_parse(const jumplist::cli::ParseCommand& cmd, jumplist::output::Writer& writer) {
    using namespace jumplist;

    parse::AppIdTable appids;
    if (cmd.appids.has_value()) {
        if (!appids.load_yaml(*cmd.appids)) {
            writer.error(appids.last_error()->format());
            return 1;
        }
        writer.debug("loaded " + std::to_string(appids.size()) + " application ids");
    }

    // Файл вывода: отдельный Writer, stdout которого направлен в файл
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("unable to open output file: " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    writer.debug("platform: " + platform::os_name());

    std::vector<std::filesystem::path> inputs = cmd.paths;
    if (inputs.empty()) {
        inputs = io::default_jumplist_dirs(platform::users_root());
        writer.debug("using default jump list locations under " +
                     platform::path_to_utf8(platform::users_root()));
    }

    io::DiscoveryOptions disc_opt;
    disc_opt.suffixes = io::jumplist_suffixes();
    disc_opt.skip_errors = cmd.skip_errors;
    auto files = io::discover_files(inputs, disc_opt);

    writer.info("Loaded " + std::to_string(files.size()) + " jump list files");

    output::ReportOptions report_opts;
    report_opts.format = to_output_format(cmd.format);
    report_opts.normalize = cmd.normalize;
    report_opts.no_headers = cmd.no_headers;
    output::Reporter reporter(*out, report_opts);
    reporter.begin();

    std::size_t failed = 0;
    for (const auto& file : files) {
        const std::string display = platform::path_to_utf8(file);
        writer.trace("parsing " + display);

        auto result = parse::parse_jumplist_file(file, appids);
        if (auto* err = std::get_if<JumplistError>(&result)) {
            writer.warn("failed to parse '" + display + "' - " + err->format());
            writer.debug("file size of '" + display + "': " + file_size_string(file) + " bytes");
            ++failed;
            continue;
        }

        const auto& record = std::get<parse::JumplistRecord>(result);
        if (const auto* destlist = std::get_if<parse::DestList>(&record.data)) {
            if (destlist->truncation) {
                writer.debug("'" + display + "': DestList entries stopped early - " +
                             destlist->truncation->format());
            }
            for (const auto& failure : destlist->correlation_failures) {
                writer.debug("'" + display + "': " + failure.format());
            }
        }
        if (auto notice = parse::empty_artifact_notice(record)) {
            writer.warn(notice->message);
        }

        reporter.add(record);
    }

    reporter.finish();

    writer.info("Done, " + std::to_string(files.size() - failed) + " parsed, " +
                std::to_string(failed) + " failed");
    return 0;
}

int run(int argc, char** argv) {
    using namespace jumplist;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Диагностика печатается как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                print_banner(writer, parse_result.global.no_banner, out_cfg.quiet);
                return run_parse(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
