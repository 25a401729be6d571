// ==============================================================================
// jumplist/jumplist.hpp - Запись Jump List и диспетчер форматов
// ==============================================================================
//
// Формат определяется только по суффиксу имени файла:
//   *.automaticDestinations-ms -> CFB контейнер с потоком DestList
//   *.customDestinations-ms    -> плоский поток категорий
//
// ==============================================================================

#ifndef JUMPLIST_JUMPLIST_HPP
#define JUMPLIST_JUMPLIST_HPP

#include <jumplist/appids.hpp>
#include <jumplist/custom_destinations.hpp>
#include <jumplist/destlist.hpp>
#include <jumplist/error.hpp>
#include <jumplist/value.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jumplist::parse {

enum class JumplistType { Automatic, Custom };

constexpr std::string_view AUTOMATIC_SUFFIX = ".automaticDestinations-ms";
constexpr std::string_view CUSTOM_SUFFIX = ".customDestinations-ms";

/// Имя потока индекса внутри Automatic контейнера
constexpr const char* DESTLIST_STREAM_NAME = "DestList";

/// "automatic" / "custom"
const char* jumplist_type_to_string(JumplistType type);

using JumplistTypeResult = std::variant<JumplistType, JumplistError>;

/// Определить формат по суффиксу имени файла (с учётом регистра)
JumplistTypeResult jumplist_type_from_filename(std::string_view filename);

using JumplistData = std::variant<DestList, CustomDestinations>;

struct JumplistRecord {
    /// Имя файла до первой точки
    std::string app_id;

    /// Имя приложения по AppID (пусто, если неизвестно)
    std::string app_name;

    JumplistType type = JumplistType::Automatic;

    std::string source_path;

    JumplistData data;

    Value to_value() const;
};

using JumplistResult = std::variant<JumplistRecord, JumplistError>;

/// Декодировать буфер заданного формата. Поля идентификации остаются пустыми.
JumplistResult parse_jumplist_bytes(std::vector<std::uint8_t> bytes, JumplistType type);

/// Прочитать и декодировать файл; заполняет app_id, app_name, source_path.
JumplistResult parse_jumplist_file(const std::filesystem::path& path, const AppIdTable& appids);

/// Предупреждение EmptyArtifact для Automatic записи без записей DestList
std::optional<JumplistError> empty_artifact_notice(const JumplistRecord& record);

}  // namespace jumplist::parse

#endif  // JUMPLIST_JUMPLIST_HPP
