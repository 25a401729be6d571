// ==============================================================================
// jumplist/custom_destinations.hpp - Декодер CustomDestinations
// ==============================================================================
//
// Формат (*.customDestinations-ms):
//   header { version u32, category_count u32, reserved u32 }
//   category_count x { type u32, <тело по типу>, footer 4 байта }
//
//   0 Custom: name_len u16 (символы UTF-16), name, entry_count u32,
//             entry_count x { class_id GUID, LNK }
//   1 Known:  id i32 (1 Frequent, 2 Recent, -1 None)
//   2 Task:   entry_count u32, entry_count x { class_id GUID, LNK }
//
// Разбор строгий: любая ошибка поля или вложенного LNK прерывает разбор.
//
// ==============================================================================

#ifndef JUMPLIST_CUSTOM_DESTINATIONS_HPP
#define JUMPLIST_CUSTOM_DESTINATIONS_HPP

#include <jumplist/binary.hpp>
#include <jumplist/error.hpp>
#include <jumplist/lnk.hpp>
#include <jumplist/value.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace jumplist::parse {

struct CustomDestinationsHeader {
    std::uint32_t version = 0;
    std::uint32_t category_count = 0;
    std::uint32_t reserved = 0;
};

/// Дискриминанты категорий
constexpr std::uint32_t CATEGORY_CUSTOM = 0x00;
constexpr std::uint32_t CATEGORY_KNOWN = 0x01;
constexpr std::uint32_t CATEGORY_TASK = 0x02;

/// Известные категории (закрытое множество + Unknown)
enum class KnownCategoryKind { Frequent, Recent, None, Unknown };

struct KnownCategoryId {
    KnownCategoryKind kind = KnownCategoryKind::Unknown;
    std::int32_t raw = 0;

    /// "frequent", "recent", "none" или 4 hex-цифры (верхний регистр) для Unknown
    std::string to_string() const;
};

/// 1 -> Frequent, 2 -> Recent, -1 -> None, прочее -> Unknown(raw)
KnownCategoryId known_category_from_i32(std::int32_t id);

struct CustomCategory {
    std::string name;
    std::uint32_t entry_count = 0;
    std::vector<io::lnk::ShellLink> entries;
};

struct KnownCategory {
    KnownCategoryId id;
};

struct TaskCategory {
    std::uint32_t entry_count = 0;
    std::vector<io::lnk::ShellLink> entries;
};

using Category = std::variant<CustomCategory, KnownCategory, TaskCategory>;

/// "custom", "known" или "task"
const char* category_type_name(const Category& category);

/// Записи LNK категории (пусто для Known)
const std::vector<io::lnk::ShellLink>* category_entries(const Category& category);

Value category_to_value(const Category& category);

struct CustomDestinations {
    CustomDestinationsHeader header;

    /// Категории в порядке следования в файле
    std::vector<Category> categories;

    Value to_value() const;
};

using CustomDestinationsResult = std::variant<CustomDestinations, JumplistError>;

/// Декодировать CustomDestinations с позиции курсора
CustomDestinationsResult decode_custom_destinations(io::ByteCursor& cursor);

CustomDestinationsResult decode_custom_destinations(const std::vector<std::uint8_t>& bytes);

}  // namespace jumplist::parse

#endif  // JUMPLIST_CUSTOM_DESTINATIONS_HPP
