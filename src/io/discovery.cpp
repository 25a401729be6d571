// ==============================================================================
// discovery.cpp - Поиск jump list файлов
// ==============================================================================

#include "jumplist/discovery.hpp"

#include "jumplist/platform.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace jumplist::io {

namespace {

bool has_suffix(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool matches_suffixes(const std::filesystem::path& file_path,
                      const std::vector<std::string>& suffixes) {
    if (suffixes.empty()) {
        return true;
    }
    const std::string filename = platform::path_to_utf8(file_path.filename());
    return std::any_of(suffixes.begin(), suffixes.end(),
                       [&filename](const std::string& s) { return has_suffix(filename, s); });
}

/// Ошибка обхода: предупреждение при skip_errors, иначе исключение
void report(const std::string& message, bool skip_errors) {
    if (skip_errors) {
        std::cerr << "[!] " << message << "\n";
        return;
    }
    throw std::runtime_error(message);
}

void collect_files_recursive(const std::filesystem::path& path,
                             const std::vector<std::string>& suffixes, bool skip_errors,
                             std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        report("failed to check path existence - " + ec.message(), skip_errors);
        return;
    }
    if (!exists) {
        report("specified path does not exist - " + platform::path_to_utf8(path), skip_errors);
        return;
    }

    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        report("failed to get metadata for file - " + ec.message(), skip_errors);
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator it(path, ec);
        if (ec) {
            report("failed to read directory - " + ec.message(), skip_errors);
            return;
        }

        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            collect_files_recursive(it->path(), suffixes, skip_errors, result);
        }
        if (ec) {
            report("failed to enter directory - " + ec.message(), skip_errors);
        }
    } else if (std::filesystem::is_regular_file(status)) {
        if (matches_suffixes(path, suffixes)) {
            result.push_back(path);
        }
    }
    // Symlinks на директории, сокеты и т.п. игнорируются
}

}  // namespace

std::vector<std::string> jumplist_suffixes() {
    return {".automaticDestinations-ms", ".customDestinations-ms"};
}

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;

    for (const auto& input : inputs) {
        const std::string text = platform::path_to_utf8(input);
        if (!platform::has_glob_chars(text)) {
            collect_files_recursive(input, opt.suffixes, opt.skip_errors, result);
            continue;
        }

        std::vector<std::filesystem::path> matches;
        try {
            matches = platform::expand_glob(text);
        } catch (const std::runtime_error& e) {
            report(e.what(), opt.skip_errors);
            continue;
        }
        if (matches.empty()) {
            report("specified path does not exist - " + text, opt.skip_errors);
            continue;
        }
        for (const auto& match : matches) {
            collect_files_recursive(match, opt.suffixes, opt.skip_errors, result);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::filesystem::path> default_jumplist_dirs(const std::filesystem::path& users_root) {
    std::vector<std::filesystem::path> dirs;

    std::error_code ec;
    if (!std::filesystem::is_directory(users_root, ec)) {
        return dirs;
    }

    const std::filesystem::path recent =
        std::filesystem::path("AppData") / "Roaming" / "Microsoft" / "Windows" / "Recent";

    std::filesystem::directory_iterator it(users_root, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        for (const char* leaf : {"AutomaticDestinations", "CustomDestinations"}) {
            std::filesystem::path candidate = it->path() / recent / leaf;
            std::error_code dir_ec;
            if (std::filesystem::is_directory(candidate, dir_ec)) {
                dirs.push_back(std::move(candidate));
            }
        }
    }

    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

}  // namespace jumplist::io
