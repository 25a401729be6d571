// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Всё, что зависит от ОС: кодировка путей, TTY, раскрытие шаблонов путей,
// расположение профилей пользователей.
//
// ==============================================================================

#include "jumplist/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <glob.h>
#include <unistd.h>
#endif

namespace jumplist::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    const int src_len = static_cast<int>(u8str.size());
    const int len = MultiByteToWideChar(CP_UTF8, 0, u8str.data(), src_len, nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wide(static_cast<std::size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), src_len, wide.data(), len);
    return std::filesystem::path(wide);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wide = p.native();
    if (wide.empty()) {
        return {};
    }
    const int src_len = static_cast<int>(wide.size());
    const int len =
        WideCharToMultiByte(CP_UTF8, 0, wide.data(), src_len, nullptr, 0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string narrow(static_cast<std::size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), src_len, narrow.data(), len, nullptr, nullptr);
    return narrow;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Шаблоны путей
// ----------------------------------------------------------------------------

bool has_glob_chars(std::string_view u8str) {
    return u8str.find_first_of("*?[") != std::string_view::npos;
}

std::vector<std::filesystem::path> expand_glob(std::string_view u8pattern) {
    std::vector<std::filesystem::path> matches;
#ifdef _WIN32
    // FindFirstFileW понимает '*' и '?' только в последнем компоненте,
    // поэтому шаблон раскрывается покомпонентно
    const std::filesystem::path pattern = path_from_utf8(u8pattern);
    std::vector<std::filesystem::path> current{pattern.root_path()};

    for (const auto& part : pattern.relative_path()) {
        std::vector<std::filesystem::path> next;
        const bool wild = part.native().find_first_of(L"*?") != std::wstring::npos;
        for (const auto& base : current) {
            if (!wild) {
                next.push_back(base / part);
                continue;
            }
            WIN32_FIND_DATAW data;
            HANDLE h = FindFirstFileW((base / part).c_str(), &data);
            if (h == INVALID_HANDLE_VALUE) {
                const DWORD code = GetLastError();
                if (code == ERROR_FILE_NOT_FOUND || code == ERROR_PATH_NOT_FOUND) {
                    continue;
                }
                throw std::runtime_error("failed to read directory - " + path_to_utf8(base));
            }
            do {
                const std::wstring_view name(data.cFileName);
                if (name != L"." && name != L"..") {
                    next.push_back(base / data.cFileName);
                }
            } while (FindNextFileW(h, &data));
            FindClose(h);
        }
        current = std::move(next);
    }

    for (auto& candidate : current) {
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            matches.push_back(std::move(candidate));
        }
    }
    std::sort(matches.begin(), matches.end());
#else
    const std::string pattern(u8pattern);
    glob_t found{};
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &found);
    if (rc == 0) {
        // glob(3) возвращает пути уже отсортированными
        for (std::size_t i = 0; i < found.gl_pathc; ++i) {
            matches.emplace_back(found.gl_pathv[i]);
        }
    }
    globfree(&found);
    if (rc != 0 && rc != GLOB_NOMATCH) {
        throw std::runtime_error("failed to expand pattern - " + pattern);
    }
#endif
    return matches;
}

// ----------------------------------------------------------------------------
// Профили пользователей
// ----------------------------------------------------------------------------

std::filesystem::path users_root() {
#ifdef _WIN32
    const char* drive = std::getenv("SystemDrive");
    std::string root = (drive != nullptr && drive[0] != '\0') ? drive : "C:";
    return path_from_utf8(root + "\\Users");
#else
    // WSL: системный диск Windows смонтирован в /mnt/c
    return std::filesystem::path("/mnt/c/Users");
#endif
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace jumplist::platform
