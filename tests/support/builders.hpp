// ==============================================================================
// support/builders.hpp - Синтез бинарных фикстур для тестов
// ==============================================================================
//
// - ByteWriter: little-endian запись полей
// - build_lnk(): минимальная LNK запись (LinkInfo, StringData, TrackerData)
// - build_compound_file(): CFB v3 (512-байтные сектора, mini stream)
// - build_destlist(), custom_category() и др.: содержимое форматов Jump List
//
// ==============================================================================

#ifndef JUMPLIST_TESTS_SUPPORT_BUILDERS_HPP
#define JUMPLIST_TESTS_SUPPORT_BUILDERS_HPP

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jumplist::test {

// ----------------------------------------------------------------------------
// ByteWriter
// ----------------------------------------------------------------------------

class ByteWriter {
public:
    ByteWriter& u8(std::uint8_t v) {
        buf_.push_back(v);
        return *this;
    }

    ByteWriter& u16(std::uint16_t v) {
        u8(static_cast<std::uint8_t>(v & 0xFF));
        return u8(static_cast<std::uint8_t>(v >> 8));
    }

    ByteWriter& u32(std::uint32_t v) {
        u16(static_cast<std::uint16_t>(v & 0xFFFF));
        return u16(static_cast<std::uint16_t>(v >> 16));
    }

    ByteWriter& i32(std::int32_t v) { return u32(static_cast<std::uint32_t>(v)); }

    ByteWriter& u64(std::uint64_t v) {
        u32(static_cast<std::uint32_t>(v & 0xFFFFFFFFULL));
        return u32(static_cast<std::uint32_t>(v >> 32));
    }

    /// "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX" в раскладке Windows GUID
    ByteWriter& guid(const std::string& text) {
        auto hex = [&text](std::size_t pos, std::size_t len) {
            return std::strtoull(text.substr(pos, len).c_str(), nullptr, 16);
        };
        u32(static_cast<std::uint32_t>(hex(0, 8)));
        u16(static_cast<std::uint16_t>(hex(9, 4)));
        u16(static_cast<std::uint16_t>(hex(14, 4)));
        u8(static_cast<std::uint8_t>(hex(19, 2)));
        u8(static_cast<std::uint8_t>(hex(21, 2)));
        for (std::size_t i = 0; i < 6; ++i) {
            u8(static_cast<std::uint8_t>(hex(24 + i * 2, 2)));
        }
        return *this;
    }

    /// ASCII текст как UTF-16LE (без завершающего NUL)
    ByteWriter& utf16(const std::string& ascii) {
        for (char c : ascii) {
            u16(static_cast<std::uint16_t>(static_cast<unsigned char>(c)));
        }
        return *this;
    }

    ByteWriter& ascii(const std::string& text) {
        buf_.insert(buf_.end(), text.begin(), text.end());
        return *this;
    }

    /// Текст, дополненный NUL до width байт
    ByteWriter& fixed(const std::string& text, std::size_t width) {
        for (std::size_t i = 0; i < width; ++i) {
            u8(i < text.size() ? static_cast<std::uint8_t>(text[i]) : 0);
        }
        return *this;
    }

    ByteWriter& zeros(std::size_t n) {
        buf_.insert(buf_.end(), n, 0);
        return *this;
    }

    ByteWriter& bytes(const std::vector<std::uint8_t>& data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
        return *this;
    }

    /// Перезаписать u32 по смещению
    void patch_u32(std::size_t offset, std::uint32_t v) {
        for (std::size_t i = 0; i < 4; ++i) {
            buf_[offset + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }

    std::size_t size() const { return buf_.size(); }

    const std::vector<std::uint8_t>& data() const { return buf_; }

    std::vector<std::uint8_t> take() { return std::move(buf_); }

private:
    std::vector<std::uint8_t> buf_;
};

// ----------------------------------------------------------------------------
// LNK
// ----------------------------------------------------------------------------

constexpr const char* LNK_CLSID = "00021401-0000-0000-C000-000000000046";

/// 2021-01-01T00:00:00Z
constexpr std::uint64_t FILETIME_2021 = 132539328000000000ULL;

struct LnkSpec {
    std::optional<std::string> local_base_path;
    std::optional<std::string> volume_label;
    std::uint32_t drive_serial_number = 0x1234ABCD;
    std::optional<std::string> name;
    std::optional<std::string> relative_path;
    std::optional<std::string> working_dir;
    std::optional<std::string> arguments;
    std::optional<std::string> icon_location;
    std::optional<std::string> machine_id;
    std::uint64_t creation_time = FILETIME_2021;
    std::uint64_t access_time = FILETIME_2021;
    std::uint64_t write_time = FILETIME_2021;
    std::uint32_t file_size = 0;
};

inline std::vector<std::uint8_t> build_lnk(const LnkSpec& spec) {
    std::uint32_t flags = 0x80;  // IS_UNICODE
    if (spec.local_base_path) {
        flags |= 0x02;
    }
    if (spec.name) {
        flags |= 0x04;
    }
    if (spec.relative_path) {
        flags |= 0x08;
    }
    if (spec.working_dir) {
        flags |= 0x10;
    }
    if (spec.arguments) {
        flags |= 0x20;
    }
    if (spec.icon_location) {
        flags |= 0x40;
    }

    ByteWriter w;
    w.u32(0x4C).guid(LNK_CLSID).u32(flags).u32(0x20);
    w.u64(spec.creation_time).u64(spec.access_time).u64(spec.write_time);
    w.u32(spec.file_size).i32(0).u32(1).u16(0).zeros(10);

    if (spec.local_base_path) {
        // LinkInfo: заголовок 0x1C, VolumeID, LocalBasePath, CommonPathSuffix
        const std::string label = spec.volume_label.value_or("");
        const std::uint32_t volume_off = 0x1C;
        const std::uint32_t volume_size = static_cast<std::uint32_t>(0x10 + label.size() + 1);
        const std::uint32_t base_off = volume_off + volume_size;
        const std::uint32_t suffix_off =
            base_off + static_cast<std::uint32_t>(spec.local_base_path->size() + 1);
        const std::uint32_t total = suffix_off + 1;

        w.u32(total).u32(0x1C).u32(0x1).u32(volume_off).u32(base_off).u32(0).u32(suffix_off);
        w.u32(volume_size).u32(3).u32(spec.drive_serial_number).u32(0x10);
        w.ascii(label).u8(0);
        w.ascii(*spec.local_base_path).u8(0);
        w.u8(0);
    }

    auto string_data = [&w](const std::optional<std::string>& s) {
        if (s) {
            w.u16(static_cast<std::uint16_t>(s->size())).utf16(*s);
        }
    };
    string_data(spec.name);
    string_data(spec.relative_path);
    string_data(spec.working_dir);
    string_data(spec.arguments);
    string_data(spec.icon_location);

    if (spec.machine_id) {
        w.u32(0x60).u32(0xA0000003).u32(0x58).u32(0);
        w.fixed(*spec.machine_id, 16);
        w.guid("11111111-2222-3333-4444-555555555555");
        w.guid("66666666-7777-8888-9999-AAAAAAAAAAAA");
        w.guid("11111111-2222-3333-4444-555555555555");
        w.guid("66666666-7777-8888-9999-AAAAAAAAAAAA");
    }
    w.u32(0);  // TerminalBlock
    return w.take();
}

// ----------------------------------------------------------------------------
// CustomDestinations
// ----------------------------------------------------------------------------

inline ByteWriter& custom_header(ByteWriter& w, std::uint32_t version, std::uint32_t count) {
    return w.u32(version).u32(count).u32(0);
}

inline ByteWriter& custom_footer(ByteWriter& w) {
    return w.u32(0xBABFFBAB);
}

inline ByteWriter& known_category(ByteWriter& w, std::int32_t id) {
    w.u32(0x01).i32(id);
    return custom_footer(w);
}

inline ByteWriter& custom_category(ByteWriter& w, const std::string& name,
                                   const std::vector<std::vector<std::uint8_t>>& links) {
    w.u32(0x00).u16(static_cast<std::uint16_t>(name.size())).utf16(name);
    w.u32(static_cast<std::uint32_t>(links.size()));
    for (const auto& link : links) {
        w.guid(LNK_CLSID).bytes(link);
    }
    return custom_footer(w);
}

inline ByteWriter& task_category(ByteWriter& w,
                                 const std::vector<std::vector<std::uint8_t>>& links) {
    w.u32(0x02).u32(static_cast<std::uint32_t>(links.size()));
    for (const auto& link : links) {
        w.guid(LNK_CLSID).bytes(link);
    }
    return custom_footer(w);
}

// ----------------------------------------------------------------------------
// DestList
// ----------------------------------------------------------------------------

struct DestListEntrySpec {
    std::uint32_t ordinal = 1;
    std::uint32_t pin_status = 0xFFFFFFFF;
    std::string hostname = "desktop-01";
    std::string path = "C:\\Users\\user\\file.txt";
    std::uint64_t mtime = FILETIME_2021;
};

inline ByteWriter& destlist_header(ByteWriter& w, std::uint32_t version, std::uint32_t count,
                                   std::uint32_t pinned) {
    return w.u32(version).u32(count).u32(pinned).zeros(20);
}

inline ByteWriter& destlist_entry(ByteWriter& w, std::uint32_t version,
                                  const DestListEntrySpec& e) {
    w.zeros(8);
    w.guid("AAAAAAAA-0000-0000-0000-000000000001");
    w.guid("BBBBBBBB-0000-0000-0000-000000000002");
    w.guid("CCCCCCCC-0000-0000-0000-000000000003");
    w.guid("DDDDDDDD-0000-0000-0000-000000000004");
    w.fixed(e.hostname, 16);
    w.u32(e.ordinal).zeros(8).u64(e.mtime).u32(e.pin_status);
    if (version > 1) {
        w.zeros(16);
    }
    w.u16(static_cast<std::uint16_t>(e.path.size())).utf16(e.path);
    if (version > 1) {
        w.zeros(4);
    }
    return w;
}

inline std::vector<std::uint8_t> build_destlist(std::uint32_t version,
                                                const std::vector<DestListEntrySpec>& entries) {
    ByteWriter w;
    std::uint32_t pinned = 0;
    for (const auto& e : entries) {
        pinned += e.pin_status != 0xFFFFFFFF ? 1 : 0;
    }
    destlist_header(w, version, static_cast<std::uint32_t>(entries.size()), pinned);
    for (const auto& e : entries) {
        destlist_entry(w, version, e);
    }
    return w.take();
}

// ----------------------------------------------------------------------------
// Compound File (CFB v3)
// ----------------------------------------------------------------------------

/// Потоки в корневом хранилище, в порядке перечисления
using StreamList = std::vector<std::pair<std::string, std::vector<std::uint8_t>>>;

/// Построить CFB v3. Потоки короче 4096 байт кладутся в mini stream.
inline std::vector<std::uint8_t> build_compound_file(const StreamList& streams) {
    constexpr std::uint32_t SECTOR = 512;
    constexpr std::uint32_t MINI = 64;
    constexpr std::uint32_t CUTOFF = 4096;
    constexpr std::uint32_t END = 0xFFFFFFFE;
    constexpr std::uint32_t FREE = 0xFFFFFFFF;
    constexpr std::uint32_t FATSECT = 0xFFFFFFFD;

    auto sectors_for = [](std::size_t n, std::size_t unit) { return (n + unit - 1) / unit; };

    // Mini stream и MiniFAT
    std::vector<std::uint8_t> mini_stream;
    std::vector<std::uint32_t> minifat;
    std::vector<std::uint32_t> starts(streams.size(), END);
    for (std::size_t i = 0; i < streams.size(); ++i) {
        const auto& data = streams[i].second;
        if (data.empty() || data.size() >= CUTOFF) {
            continue;
        }
        std::size_t count = sectors_for(data.size(), MINI);
        std::uint32_t first = static_cast<std::uint32_t>(minifat.size());
        starts[i] = first;
        for (std::size_t k = 0; k < count; ++k) {
            minifat.push_back(k + 1 < count ? first + static_cast<std::uint32_t>(k) + 1 : END);
        }
        mini_stream.insert(mini_stream.end(), data.begin(), data.end());
        mini_stream.resize(minifat.size() * MINI, 0);
    }

    // Раскладка секторов: FAT, каталог, MiniFAT, mini stream, большие потоки
    const std::size_t dir_entries = streams.size() + 1;
    const std::size_t dir_sectors = sectors_for(dir_entries * 128, SECTOR);
    const std::size_t minifat_sectors = sectors_for(minifat.size() * 4, SECTOR);
    const std::size_t ministream_sectors = sectors_for(mini_stream.size(), SECTOR);

    std::vector<std::uint32_t> fat;
    auto allocate = [&fat](std::size_t count, std::uint32_t& first) {
        first = count == 0 ? END : static_cast<std::uint32_t>(fat.size());
        for (std::size_t k = 0; k < count; ++k) {
            fat.push_back(k + 1 < count ? static_cast<std::uint32_t>(fat.size()) + 1 : END);
        }
    };

    fat.push_back(FATSECT);
    std::uint32_t dir_start = END;
    std::uint32_t minifat_start = END;
    std::uint32_t ministream_start = END;
    allocate(dir_sectors, dir_start);
    allocate(minifat_sectors, minifat_start);
    allocate(ministream_sectors, ministream_start);
    for (std::size_t i = 0; i < streams.size(); ++i) {
        const auto& data = streams[i].second;
        if (data.size() >= CUTOFF) {
            allocate(sectors_for(data.size(), SECTOR), starts[i]);
        }
    }
    fat.resize(SECTOR / 4, FREE);

    ByteWriter w;

    // Заголовок
    w.u8(0xD0).u8(0xCF).u8(0x11).u8(0xE0).u8(0xA1).u8(0xB1).u8(0x1A).u8(0xE1);
    w.zeros(16);
    w.u16(0x3E).u16(3).u16(0xFFFE).u16(9).u16(6).zeros(6);
    w.u32(0).u32(1).u32(dir_start).u32(0).u32(CUTOFF);
    w.u32(minifat_start).u32(static_cast<std::uint32_t>(minifat_sectors));
    w.u32(END).u32(0);
    w.u32(0);
    for (std::size_t i = 1; i < 109; ++i) {
        w.u32(FREE);
    }

    // FAT
    for (std::uint32_t v : fat) {
        w.u32(v);
    }

    // Каталог: корень -> child 1, потоки связаны через right sibling
    auto dir_entry = [&w](const std::string& name, std::uint8_t type, std::uint32_t right,
                          std::uint32_t child, std::uint32_t start, std::uint32_t size) {
        const std::size_t begin = w.size();
        w.utf16(name).u16(0);
        w.zeros(64 - (w.size() - begin));
        w.u16(static_cast<std::uint16_t>((name.size() + 1) * 2)).u8(type).u8(1);
        w.u32(0xFFFFFFFF).u32(right).u32(child);
        w.zeros(16 + 4 + 16);
        w.u32(start).u32(size).u32(0);
    };
    dir_entry("Root Entry", 5, 0xFFFFFFFF, streams.empty() ? 0xFFFFFFFF : 1, ministream_start,
              static_cast<std::uint32_t>(mini_stream.size()));
    for (std::size_t i = 0; i < streams.size(); ++i) {
        std::uint32_t right = i + 1 < streams.size() ? static_cast<std::uint32_t>(i) + 2 : FREE;
        dir_entry(streams[i].first, 2, right, 0xFFFFFFFF, starts[i],
                  static_cast<std::uint32_t>(streams[i].second.size()));
    }
    w.zeros(dir_sectors * SECTOR - dir_entries * 128);

    // MiniFAT
    for (std::uint32_t v : minifat) {
        w.u32(v);
    }
    w.zeros(minifat_sectors * SECTOR - minifat.size() * 4);

    // Mini stream
    w.bytes(mini_stream);
    w.zeros(ministream_sectors * SECTOR - mini_stream.size());

    // Большие потоки
    for (const auto& stream : streams) {
        const auto& data = stream.second;
        if (data.size() >= CUTOFF) {
            w.bytes(data);
            w.zeros(sectors_for(data.size(), SECTOR) * SECTOR - data.size());
        }
    }

    return w.take();
}

}  // namespace jumplist::test

#endif  // JUMPLIST_TESTS_SUPPORT_BUILDERS_HPP
