// ==============================================================================
// binary.cpp - Примитивное чтение полей (little-endian)
// ==============================================================================

#include "jumplist/binary.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace jumplist::io {

namespace {

/// Разница эпох FILETIME (1601) и Unix (1970) в 100-нс интервалах
constexpr std::uint64_t EPOCH_DIFF = 116444736000000000ULL;

/// 2500-01-01T00:00:00Z в секундах Unix
constexpr std::uint64_t MAX_UNIX_SECONDS = 16725225600ULL;

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования
// ----------------------------------------------------------------------------

std::string guid_to_string(const std::uint8_t* data) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    oss << std::setw(8) << read_u32_le(data) << '-';
    oss << std::setw(4) << read_u16_le(data + 4) << '-';
    oss << std::setw(4) << read_u16_le(data + 6) << '-';
    for (std::size_t i = 8; i < GUID_SIZE; ++i) {
        if (i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

std::string utf16le_to_utf8(const std::uint8_t* data, std::size_t byte_len) {
    std::string result;
    result.reserve(byte_len / 2);

    for (std::size_t i = 0; i + 1 < byte_len; i += 2) {
        std::uint16_t wchar = read_u16_le(data + i);
        if (wchar == 0) {
            break;
        }

        if (wchar >= 0xD800 && wchar <= 0xDBFF) {
            if (i + 3 < byte_len) {
                std::uint16_t low = read_u16_le(data + i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    std::uint32_t cp = 0x10000 + ((static_cast<std::uint32_t>(wchar - 0xD800) << 10) |
                                                  static_cast<std::uint32_t>(low - 0xDC00));
                    append_utf8(result, cp);
                    i += 2;
                    continue;
                }
            }
            // Непарный суррогат -> U+FFFD
            append_utf8(result, 0xFFFD);
            continue;
        }
        if (wchar >= 0xDC00 && wchar <= 0xDFFF) {
            append_utf8(result, 0xFFFD);
            continue;
        }
        append_utf8(result, wchar);
    }

    return result;
}

std::string ansi_to_utf8(const std::uint8_t* data, std::size_t len) {
    std::string result;
    result.reserve(len);
    for (std::size_t i = 0; i < len && data[i] != 0; ++i) {
        append_utf8(result, data[i]);
    }
    return result;
}

std::string filetime_to_iso8601(std::uint64_t filetime) {
    if (filetime < EPOCH_DIFF) {
        return "";
    }

    std::uint64_t unix_seconds = (filetime - EPOCH_DIFF) / 10000000ULL;
    if (unix_seconds >= MAX_UNIX_SECONDS) {
        return "";
    }

    std::time_t time = static_cast<std::time_t>(unix_seconds);
    std::tm tm_result{};
#ifdef _WIN32
    if (gmtime_s(&tm_result, &time) != 0) {
        return "";
    }
#else
    if (gmtime_r(&time, &tm_result) == nullptr) {
        return "";
    }
#endif

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << (tm_result.tm_year + 1900) << "-" << std::setw(2)
        << (tm_result.tm_mon + 1) << "-" << std::setw(2) << tm_result.tm_mday << "T" << std::setw(2)
        << tm_result.tm_hour << ":" << std::setw(2) << tm_result.tm_min << ":" << std::setw(2)
        << tm_result.tm_sec << "Z";
    return oss.str();
}

// ----------------------------------------------------------------------------
// ByteCursor
// ----------------------------------------------------------------------------

ByteCursor::ByteCursor(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

ByteCursor::ByteCursor(const std::vector<std::uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

bool ByteCursor::require(std::string_view field, std::size_t n) {
    if (n <= remaining()) {
        return true;
    }
    JumplistError err;
    err.kind = JumplistErrorKind::Structure;
    err.field = std::string(field);
    err.offset = pos_;
    err.message = "unable to read '" + err.field + "': need " + std::to_string(n) +
                  " bytes, " + std::to_string(remaining()) + " remaining";
    error_ = std::move(err);
    return false;
}

bool ByteCursor::seek(std::string_view field, std::size_t pos) {
    if (pos > size_) {
        JumplistError err;
        err.kind = JumplistErrorKind::Structure;
        err.field = std::string(field);
        err.offset = pos_;
        err.message = "unable to seek to " + std::to_string(pos) + " for '" + err.field +
                      "': buffer holds " + std::to_string(size_) + " bytes";
        error_ = std::move(err);
        return false;
    }
    pos_ = pos;
    return true;
}

bool ByteCursor::read_u8(std::string_view field, std::uint8_t& out) {
    if (!require(field, 1)) {
        return false;
    }
    out = data_[pos_];
    pos_ += 1;
    return true;
}

bool ByteCursor::read_u16(std::string_view field, std::uint16_t& out) {
    if (!require(field, 2)) {
        return false;
    }
    out = read_u16_le(data_ + pos_);
    pos_ += 2;
    return true;
}

bool ByteCursor::read_u32(std::string_view field, std::uint32_t& out) {
    if (!require(field, 4)) {
        return false;
    }
    out = read_u32_le(data_ + pos_);
    pos_ += 4;
    return true;
}

bool ByteCursor::read_i32(std::string_view field, std::int32_t& out) {
    std::uint32_t raw = 0;
    if (!read_u32(field, raw)) {
        return false;
    }
    out = static_cast<std::int32_t>(raw);
    return true;
}

bool ByteCursor::read_u64(std::string_view field, std::uint64_t& out) {
    if (!require(field, 8)) {
        return false;
    }
    out = read_u64_le(data_ + pos_);
    pos_ += 8;
    return true;
}

bool ByteCursor::read_guid(std::string_view field, std::string& out) {
    if (!require(field, GUID_SIZE)) {
        return false;
    }
    out = guid_to_string(data_ + pos_);
    pos_ += GUID_SIZE;
    return true;
}

bool ByteCursor::read_utf16(std::string_view field, std::size_t char_count, std::string& out) {
    if (char_count > remaining() / 2) {
        return require(field, char_count * 2);
    }
    return read_utf16_bytes(field, char_count * 2, out);
}

bool ByteCursor::read_utf16_bytes(std::string_view field, std::size_t byte_len,
                                  std::string& out) {
    if (!require(field, byte_len)) {
        return false;
    }
    out = utf16le_to_utf8(data_ + pos_, byte_len);
    pos_ += byte_len;
    return true;
}

bool ByteCursor::read_utf8(std::string_view field, std::size_t byte_len, std::string& out) {
    if (!require(field, byte_len)) {
        return false;
    }
    std::size_t len = 0;
    while (len < byte_len && data_[pos_ + len] != 0) {
        ++len;
    }
    out.assign(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += byte_len;
    return true;
}

bool ByteCursor::read_bytes(std::string_view field, std::size_t n,
                            std::vector<std::uint8_t>& out) {
    if (!require(field, n)) {
        return false;
    }
    out.assign(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return true;
}

bool ByteCursor::skip(std::string_view field, std::size_t n) {
    if (!require(field, n)) {
        return false;
    }
    pos_ += n;
    return true;
}

}  // namespace jumplist::io
