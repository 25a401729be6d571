// ==============================================================================
// jumplist/binary.hpp - Примитивное чтение полей (little-endian)
// ==============================================================================
//
// Назначение:
// - Чтение целых 8/16/32/64 бит (LE), GUID, UTF-16 и UTF-8 строк
// - Относительные переходы через зарезервированные области
// - Каждое чтение именует поле; при нехватке байт возвращает false и
//   сохраняет JumplistError{Structure} с полем и смещением
// - Частичного успеха нет: при ошибке позиция курсора не меняется
//
// ==============================================================================

#ifndef JUMPLIST_BINARY_HPP
#define JUMPLIST_BINARY_HPP

#include <jumplist/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jumplist::io {

/// Размер GUID в байтах
constexpr std::size_t GUID_SIZE = 16;

// ----------------------------------------------------------------------------
// Чтение по указателю (вызывающий проверяет границы)
// ----------------------------------------------------------------------------

inline std::uint16_t read_u16_le(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

inline std::uint32_t read_u32_le(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

inline std::uint64_t read_u64_le(const std::uint8_t* data) {
    return static_cast<std::uint64_t>(read_u32_le(data)) |
           (static_cast<std::uint64_t>(read_u32_le(data + 4)) << 32);
}

// ----------------------------------------------------------------------------
// Преобразования
// ----------------------------------------------------------------------------

/// GUID в текстовом виде XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX (верхний регистр).
/// Первые три группы хранятся little-endian (раскладка Windows GUID).
std::string guid_to_string(const std::uint8_t* data);

/// UTF-16LE -> UTF-8, останов на первом NUL, суррогатные пары поддерживаются
std::string utf16le_to_utf8(const std::uint8_t* data, std::size_t byte_len);

/// Однобайтовая строка (ANSI) -> UTF-8, останов на первом NUL.
/// Байты >= 0x80 трактуются как Latin-1.
std::string ansi_to_utf8(const std::uint8_t* data, std::size_t len);

/// FILETIME (100 нс с 1601-01-01) -> "YYYY-MM-DDTHH:MM:SSZ".
/// Значения до эпохи Unix или после 2500 года дают пустую строку.
std::string filetime_to_iso8601(std::uint64_t filetime);

// ----------------------------------------------------------------------------
// ByteCursor - позиционируемый курсор поверх буфера
// ----------------------------------------------------------------------------

/// Курсор не владеет буфером; буфер должен жить дольше курсора.
class ByteCursor {
public:
    ByteCursor(const std::uint8_t* data, std::size_t size);
    explicit ByteCursor(const std::vector<std::uint8_t>& data);

    std::size_t position() const { return pos_; }
    std::size_t size() const { return size_; }
    std::size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ >= size_; }

    /// Указатель на текущую позицию
    const std::uint8_t* current() const { return data_ + pos_; }

    /// Абсолютный переход (pos <= size)
    bool seek(std::string_view field, std::size_t pos);

    bool read_u8(std::string_view field, std::uint8_t& out);
    bool read_u16(std::string_view field, std::uint16_t& out);
    bool read_u32(std::string_view field, std::uint32_t& out);
    bool read_i32(std::string_view field, std::int32_t& out);
    bool read_u64(std::string_view field, std::uint64_t& out);

    /// 16 байт GUID в текстовом виде
    bool read_guid(std::string_view field, std::string& out);

    /// UTF-16LE строка из char_count кодовых единиц (2 байта каждая)
    bool read_utf16(std::string_view field, std::size_t char_count, std::string& out);

    /// UTF-16LE строка известной длины в байтах
    bool read_utf16_bytes(std::string_view field, std::size_t byte_len, std::string& out);

    /// UTF-8 строка фиксированной ширины, NUL-дополнение отбрасывается
    bool read_utf8(std::string_view field, std::size_t byte_len, std::string& out);

    bool read_bytes(std::string_view field, std::size_t n, std::vector<std::uint8_t>& out);

    /// Относительный переход вперёд
    bool skip(std::string_view field, std::size_t n);

    /// Последняя ошибка чтения
    const std::optional<JumplistError>& last_error() const { return error_; }

private:
    /// Проверить, что доступно n байт; иначе записать ошибку
    bool require(std::string_view field, std::size_t n);

    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t pos_ = 0;
    std::optional<JumplistError> error_;
};

}  // namespace jumplist::io

#endif  // JUMPLIST_BINARY_HPP
