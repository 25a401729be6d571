// ==============================================================================
// jumplist/lnk.hpp - Декодер Shell Link (LNK, MS-SHLLINK)
// ==============================================================================
//
// Назначение:
// - Декодирование LNK записей, встроенных в CustomDestinations (inline,
//   курсор останавливается ровно за записью) и в потоки CFB (буфер целиком)
// - Нормализация в плоский набор полей для отчётов
// - Сериализация в Value
//
// Содержимое цели ссылки не интерпретируется: только поля самой записи.
//
// ==============================================================================

#ifndef JUMPLIST_LNK_HPP
#define JUMPLIST_LNK_HPP

#include <jumplist/binary.hpp>
#include <jumplist/error.hpp>
#include <jumplist/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jumplist::io::lnk {

/// CLSID Shell Link (в заголовке LNK и перед записями CustomDestinations)
constexpr const char* SHELL_LINK_CLSID = "00021401-0000-0000-C000-000000000046";

/// Размер заголовка ShellLinkHeader
constexpr std::uint32_t HEADER_SIZE = 0x4C;

// LinkFlags
constexpr std::uint32_t HAS_LINK_TARGET_ID_LIST = 0x00000001;
constexpr std::uint32_t HAS_LINK_INFO = 0x00000002;
constexpr std::uint32_t HAS_NAME = 0x00000004;
constexpr std::uint32_t HAS_RELATIVE_PATH = 0x00000008;
constexpr std::uint32_t HAS_WORKING_DIR = 0x00000010;
constexpr std::uint32_t HAS_ARGUMENTS = 0x00000020;
constexpr std::uint32_t HAS_ICON_LOCATION = 0x00000040;
constexpr std::uint32_t IS_UNICODE = 0x00000080;

/// Сигнатура TrackerDataBlock
constexpr std::uint32_t TRACKER_DATA_SIGNATURE = 0xA0000003;

struct ShellLinkHeader {
    std::uint32_t link_flags = 0;
    std::uint32_t file_attributes = 0;
    std::uint64_t creation_time = 0;  // FILETIME
    std::uint64_t access_time = 0;    // FILETIME
    std::uint64_t write_time = 0;     // FILETIME
    std::uint32_t file_size = 0;
    std::int32_t icon_index = 0;
    std::uint32_t show_command = 0;
    std::uint16_t hot_key = 0;
};

/// LinkInfo: расположение цели (локальный том или сетевой ресурс)
struct LinkInfo {
    std::uint32_t flags = 0;
    std::optional<std::uint32_t> drive_type;
    std::optional<std::uint32_t> drive_serial_number;
    std::optional<std::string> volume_label;
    std::optional<std::string> local_base_path;
    std::optional<std::string> network_share_name;
    std::optional<std::string> device_name;
    std::string common_path_suffix;
};

/// TrackerDataBlock: NetBIOS имя машины и DROID идентификаторы
struct TrackerData {
    std::string machine_id;
    std::string volume_droid;
    std::string file_droid;
    std::string volume_birth_droid;
    std::string file_birth_droid;
};

/// Декодированная LNK запись
struct ShellLink {
    ShellLinkHeader header;

    /// Путь, собранный из shell items LinkTargetIDList
    std::optional<std::string> id_list_path;

    std::optional<LinkInfo> link_info;

    // StringData
    std::optional<std::string> name;
    std::optional<std::string> relative_path;
    std::optional<std::string> working_dir;
    std::optional<std::string> arguments;
    std::optional<std::string> icon_location;

    std::optional<TrackerData> tracker;

    /// Полный путь цели: LinkInfo (локальный или сетевой), иначе IDList
    std::string target_full_path() const;

    /// Отображаемое имя (StringData NAME_STRING)
    const std::optional<std::string>& name_string() const { return name; }

    /// Аргументы командной строки (StringData COMMAND_LINE_ARGUMENTS)
    const std::optional<std::string>& command_line_arguments() const { return arguments; }

    /// Плоский набор полей:
    /// target_full_path, target_creation_time, target_access_time,
    /// target_modification_time, target_size, target_hostname, working_dir,
    /// relative_path, icon_location, volume_label, drive_serial_number
    FlatRecord normalize() const;

    Value to_value() const;
};

using DecodeResult = std::variant<ShellLink, JumplistError>;

/// Декодировать LNK с текущей позиции курсора.
/// При успехе курсор стоит сразу за терминальным блоком ExtraData.
/// Ошибки имеют kind EmbeddedDecode.
DecodeResult decode_shell_link(ByteCursor& cursor);

/// Декодировать LNK из буфера целиком
DecodeResult decode_shell_link(const std::vector<std::uint8_t>& bytes);

}  // namespace jumplist::io::lnk

#endif  // JUMPLIST_LNK_HPP
