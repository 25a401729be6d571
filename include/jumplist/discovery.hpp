// ==============================================================================
// jumplist/discovery.hpp - Поиск jump list файлов
// ==============================================================================
//
// - Рекурсивный обход директорий
// - Шаблоны путей (*, ?, [...]) раскрываются до обхода
// - Фильтрация по суффиксу имени файла (с учётом регистра)
// - Детерминированный порядок результатов (сортировка)
// - Режим skip_errors: предупреждения в stderr вместо исключений
// - Пути по умолчанию: Recent\{Automatic,Custom}Destinations всех пользователей
//
// ==============================================================================

#ifndef JUMPLIST_DISCOVERY_HPP
#define JUMPLIST_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace jumplist::io {

struct DiscoveryOptions {
    /// Допустимые суффиксы имени файла (".automaticDestinations-ms").
    /// Пустой список - все файлы.
    std::vector<std::string> suffixes;

    /// true = предупреждения в stderr вместо ошибок
    bool skip_errors = false;
};

/// Суффиксы обоих форматов jump list
std::vector<std::string> jumplist_suffixes();

/// Найти файлы по путям с фильтрацией по суффиксам
///
/// @param inputs Пути к файлам или директориям, либо шаблоны путей.
///        Шаблон без совпадений обрабатывается как несуществующий путь.
/// @param opt Параметры поиска
/// @return Отсортированный список найденных файлов; пустой результат - не ошибка
///
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

/// Директории Jump List по умолчанию для каждого пользователя в users_root:
///   <users_root>/<user>/AppData/Roaming/Microsoft/Windows/Recent/AutomaticDestinations
///   <users_root>/<user>/AppData/Roaming/Microsoft/Windows/Recent/CustomDestinations
/// Возвращаются только существующие директории, в отсортированном порядке.
std::vector<std::filesystem::path> default_jumplist_dirs(const std::filesystem::path& users_root);

}  // namespace jumplist::io

#endif  // JUMPLIST_DISCOVERY_HPP
