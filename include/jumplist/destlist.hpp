// ==============================================================================
// jumplist/destlist.hpp - Декодер DestList и корреляция с LNK потоками
// ==============================================================================
//
// Поток DestList внутри *.automaticDestinations-ms:
//   header { version u32, entry_count u32, pinned_count u32, reserved 20 }
//   entries до конца потока (раскладка зависит от version, см. EntryLayout)
//
// Каждая запись ссылается на поток CFB, имя которого - entry_ordinal
// в нижнем регистре hex ("c" для 12). Найденный поток декодируется как LNK.
//
// Разбор мягкий: ошибка записи завершает цикл, накопленное сохраняется.
// Ошибка корреляции даёт запись без LNK.
//
// ==============================================================================

#ifndef JUMPLIST_DESTLIST_HPP
#define JUMPLIST_DESTLIST_HPP

#include <jumplist/cfb.hpp>
#include <jumplist/error.hpp>
#include <jumplist/lnk.hpp>
#include <jumplist/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jumplist::parse {

/// Значение поля pin_status для незакреплённой записи
constexpr std::uint32_t PIN_SENTINEL_UNPINNED = 0xFFFFFFFF;

/// Размер заголовка DestList
constexpr std::size_t DESTLIST_HEADER_SIZE = 32;

struct DestListHeader {
    std::uint32_t version = 0;
    std::uint32_t entry_count = 0;
    std::uint32_t pinned_count = 0;
};

/// Версионно-зависимые зарезервированные области записи
struct EntryLayout {
    std::size_t reserved_after_pin = 0;   // после pin_status
    std::size_t reserved_after_path = 0;  // после path
};

/// Раскладка записи для версии заголовка (version > 1 добавляет 16 + 4 байта)
EntryLayout entry_layout(std::uint32_t version);

struct DestListEntry {
    std::string volume_id;
    std::string file_id;
    std::string volume_birth_id;
    std::string file_birth_id;

    /// NetBIOS имя, 16 байт UTF-8 с NUL-дополнением
    std::string hostname;

    std::uint32_t entry_ordinal = 0;

    /// FILETIME последнего изменения
    std::uint64_t mtime = 0;

    /// pin_status != 0xFFFFFFFF
    bool pinned = false;

    std::string path;

    /// LNK из потока с именем stream_name(), если найден и декодирован
    std::optional<io::lnk::ShellLink> lnk;

    /// Имя LNK потока: entry_ordinal в нижнем регистре hex
    std::string stream_name() const;

    Value to_value() const;
};

struct DestList {
    DestListHeader header;

    /// Записи по убыванию entry_ordinal (MRU первыми)
    std::vector<DestListEntry> entries;

    /// Ошибка, завершившая цикл записей (обрезанный поток)
    std::optional<JumplistError> truncation;

    /// Ошибки открытия/декодирования LNK потоков
    std::vector<JumplistError> correlation_failures;

    Value to_value() const;
};

using DestListResult = std::variant<DestList, JumplistError>;

/// Декодировать поток DestList.
///
/// @param bytes Содержимое потока DestList (пусто -> нулевой заголовок, нет записей)
/// @param listing Перечень потоков контейнера; nullptr - корреляция не выполняется
/// @param container Контейнер для чтения LNK потоков (заимствуется на время вызова)
/// @return DestList или ошибка Structure при повреждённом заголовке
DestListResult decode_destlist(const std::vector<std::uint8_t>& bytes,
                               const std::vector<io::cfb::StreamEntry>* listing,
                               const io::cfb::CompoundContainer* container);

}  // namespace jumplist::parse

#endif  // JUMPLIST_DESTLIST_HPP
