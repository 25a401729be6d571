// ==============================================================================
// jumplist/appids.hpp - Таблица AppID -> имя приложения
// ==============================================================================
//
// Имя jump list файла начинается с AppID ("1b4dd67f29cb1962.automaticDestinations-ms").
// Таблица содержит встроенный набор известных AppID и может быть дополнена
// пользовательским YAML файлом (--appids).
//
// Формат YAML:
//   1b4dd67f29cb1962: Windows Explorer
// или
//   appids:
//     1b4dd67f29cb1962: Windows Explorer
//
// ==============================================================================

#ifndef JUMPLIST_APPIDS_HPP
#define JUMPLIST_APPIDS_HPP

#include <jumplist/error.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace jumplist::parse {

class AppIdTable {
public:
    /// Таблица со встроенным набором AppID
    AppIdTable();

    /// Пустая таблица
    static AppIdTable empty();

    /// Имя приложения по AppID (регистр не важен); пусто, если неизвестен
    std::string lookup(const std::string& app_id) const;

    /// Добавить или заменить запись
    void insert(const std::string& app_id, std::string name);

    /// Загрузить записи из YAML файла. Существующие ключи перезаписываются.
    /// @return false при ошибке (см. last_error())
    bool load_yaml(const std::filesystem::path& path);

    const std::optional<JumplistError>& last_error() const { return error_; }

    std::size_t size() const { return names_.size(); }

private:
    explicit AppIdTable(bool builtin);

    std::unordered_map<std::string, std::string> names_;
    std::optional<JumplistError> error_;
};

}  // namespace jumplist::parse

#endif  // JUMPLIST_APPIDS_HPP
