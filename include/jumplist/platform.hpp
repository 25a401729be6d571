// ==============================================================================
// jumplist/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// - Пути: std::filesystem::path <-> UTF-8 для вывода и аргументов CLI
// - TTY у stderr (цветной журнал)
// - Раскрытие шаблонов путей (*, ?, [...]) для -p/--path
// - Корень профилей пользователей для путей по умолчанию
//
// ==============================================================================

#ifndef JUMPLIST_PLATFORM_HPP
#define JUMPLIST_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jumplist::platform {

/// Преобразовать UTF-8 строку в native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать path в UTF-8 строку
std::string path_to_utf8(const std::filesystem::path& p);

/// stderr подключён к терминалу
bool is_tty_stderr();

/// Строка содержит символы шаблона: '*', '?' или '['
bool has_glob_chars(std::string_view u8str);

/// Раскрыть шаблон пути в существующие пути, отсортированные по имени.
/// Шаблон без совпадений даёт пустой список.
/// @throws std::runtime_error если каталог на пути шаблона нельзя прочитать
std::vector<std::filesystem::path> expand_glob(std::string_view u8pattern);

/// Каталог с профилями пользователей Windows.
/// Windows: "%SystemDrive%\Users", прочие ОС: "/mnt/c/Users" (WSL)
std::filesystem::path users_root();

/// Название ОС
std::string os_name();

}  // namespace jumplist::platform

#endif  // JUMPLIST_PLATFORM_HPP
