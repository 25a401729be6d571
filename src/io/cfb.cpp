// ==============================================================================
// cfb.cpp - Чтение Compound File Binary (OLE Structured Storage)
// ==============================================================================
//
// Раскладка [MS-CFB]:
// - Заголовок 512 байт; сектор N расположен по смещению (N + 1) * sector_size
// - DIFAT: 109 слотов в заголовке + цепочка DIFAT секторов
// - FAT / MiniFAT: массивы u32 следующих секторов
// - Каталог: записи по 128 байт, красно-чёрное дерево на каждое хранилище
// - Потоки короче mini_stream_cutoff лежат в mini stream корневой записи
//
// ==============================================================================

#include "jumplist/cfb.hpp"

#include "jumplist/binary.hpp"

#include <algorithm>
#include <cstring>

namespace jumplist::io::cfb {

namespace {

constexpr std::uint8_t SIGNATURE[8] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

constexpr std::uint32_t MAXREGSECT = 0xFFFFFFFA;
constexpr std::uint32_t ENDOFCHAIN = 0xFFFFFFFE;
constexpr std::uint32_t FREESECT = 0xFFFFFFFF;
constexpr std::uint32_t NOSTREAM = 0xFFFFFFFF;

constexpr std::size_t HEADER_SIZE = 512;
constexpr std::size_t HEADER_DIFAT_SLOTS = 109;
constexpr std::size_t DIR_ENTRY_SIZE = 128;

// Смещения полей заголовка
constexpr std::size_t OFF_MAJOR_VERSION = 0x1A;
constexpr std::size_t OFF_BYTE_ORDER = 0x1C;
constexpr std::size_t OFF_SECTOR_SHIFT = 0x1E;
constexpr std::size_t OFF_MINI_SECTOR_SHIFT = 0x20;
constexpr std::size_t OFF_NUM_FAT_SECTORS = 0x2C;
constexpr std::size_t OFF_FIRST_DIR_SECTOR = 0x30;
constexpr std::size_t OFF_MINI_CUTOFF = 0x38;
constexpr std::size_t OFF_FIRST_MINIFAT_SECTOR = 0x3C;
constexpr std::size_t OFF_FIRST_DIFAT_SECTOR = 0x44;
constexpr std::size_t OFF_NUM_DIFAT_SECTORS = 0x48;
constexpr std::size_t OFF_DIFAT = 0x4C;

// Типы записей каталога
constexpr std::uint8_t OBJ_STORAGE = 1;
constexpr std::uint8_t OBJ_STREAM = 2;
constexpr std::uint8_t OBJ_ROOT = 5;

/// Глубина вложенности хранилищ
constexpr int MAX_STORAGE_DEPTH = 64;

struct DirEntry {
    std::string name;
    std::uint8_t type = 0;
    std::uint32_t left = NOSTREAM;
    std::uint32_t right = NOSTREAM;
    std::uint32_t child = NOSTREAM;
    std::uint32_t start = ENDOFCHAIN;
    std::uint64_t size = 0;
};

struct Listed {
    StreamEntry entry;
    std::uint32_t dir_id = NOSTREAM;
};

JumplistError structure_error(std::string message, std::uint64_t offset = 0) {
    JumplistError err;
    err.kind = JumplistErrorKind::Structure;
    err.message = std::move(message);
    err.offset = offset;
    return err;
}

std::vector<std::uint32_t> to_u32_array(const std::vector<std::uint8_t>& raw) {
    std::vector<std::uint32_t> out;
    out.reserve(raw.size() / 4);
    for (std::size_t i = 0; i + 4 <= raw.size(); i += 4) {
        out.push_back(read_u32_le(raw.data() + i));
    }
    return out;
}

}  // namespace

// ----------------------------------------------------------------------------
// Impl
// ----------------------------------------------------------------------------

struct CompoundFile::Impl {
    std::vector<std::uint8_t> bytes;
    std::uint16_t major = 0;
    std::uint32_t sector_size = 512;
    std::uint32_t mini_sector_size = 64;
    std::uint32_t mini_cutoff = 4096;

    std::vector<std::uint32_t> fat;
    std::vector<std::uint32_t> minifat;
    std::vector<DirEntry> dir;
    std::vector<std::uint8_t> mini_stream;
    std::vector<Listed> streams;

    /// Указатель и длина сектора (последний сектор может быть неполным)
    bool sector_data(std::uint32_t sector, const std::uint8_t*& ptr, std::size_t& len) const {
        std::uint64_t offset = (static_cast<std::uint64_t>(sector) + 1) * sector_size;
        if (offset >= bytes.size()) {
            return false;
        }
        ptr = bytes.data() + offset;
        len = static_cast<std::size_t>(
            std::min<std::uint64_t>(sector_size, bytes.size() - offset));
        return true;
    }

    /// Прочитать цепочку секторов по FAT
    bool read_chain(std::uint32_t start, std::vector<std::uint8_t>& out,
                    JumplistError& err) const {
        out.clear();
        std::uint32_t cur = start;
        std::size_t steps = 0;
        while (cur != ENDOFCHAIN && cur != FREESECT) {
            if (cur > MAXREGSECT || cur >= fat.size()) {
                err = structure_error("sector id " + std::to_string(cur) +
                                      " is outside the allocation table");
                return false;
            }
            if (++steps > fat.size()) {
                err = structure_error("sector chain starting at " + std::to_string(start) +
                                      " is cyclic");
                return false;
            }
            const std::uint8_t* ptr = nullptr;
            std::size_t len = 0;
            if (!sector_data(cur, ptr, len)) {
                err = structure_error("sector " + std::to_string(cur) + " lies beyond end of file",
                                      (static_cast<std::uint64_t>(cur) + 1) * sector_size);
                return false;
            }
            out.insert(out.end(), ptr, ptr + len);
            cur = fat[cur];
        }
        return true;
    }

    /// Прочитать цепочку мини-секторов по MiniFAT
    bool read_mini_chain(std::uint32_t start, std::vector<std::uint8_t>& out,
                         JumplistError& err) const {
        out.clear();
        std::uint32_t cur = start;
        std::size_t steps = 0;
        while (cur != ENDOFCHAIN && cur != FREESECT) {
            if (cur > MAXREGSECT || cur >= minifat.size()) {
                err = structure_error("mini sector id " + std::to_string(cur) +
                                      " is outside the mini allocation table");
                return false;
            }
            if (++steps > minifat.size()) {
                err = structure_error("mini sector chain starting at " + std::to_string(start) +
                                      " is cyclic");
                return false;
            }
            std::uint64_t offset = static_cast<std::uint64_t>(cur) * mini_sector_size;
            if (offset >= mini_stream.size()) {
                err = structure_error("mini sector " + std::to_string(cur) +
                                      " lies beyond end of mini stream");
                return false;
            }
            std::size_t len = static_cast<std::size_t>(
                std::min<std::uint64_t>(mini_sector_size, mini_stream.size() - offset));
            out.insert(out.end(), mini_stream.begin() + static_cast<std::ptrdiff_t>(offset),
                       mini_stream.begin() + static_cast<std::ptrdiff_t>(offset + len));
            cur = minifat[cur];
        }
        return true;
    }

    /// Число полных и неполных секторов после заголовка
    std::size_t sectors_in_file() const {
        if (bytes.size() <= sector_size) {
            return 0;
        }
        return (bytes.size() - sector_size + sector_size - 1) / sector_size;
    }

    bool load_fat(JumplistError& err) {
        const std::uint8_t* hdr = bytes.data();
        const std::size_t max_sectors = sectors_in_file();

        // Больше FAT секторов, чем секторов в файле, быть не может
        const std::size_t num_fat =
            std::min<std::size_t>(read_u32_le(hdr + OFF_NUM_FAT_SECTORS), max_sectors);

        std::vector<std::uint32_t> fat_sectors;
        for (std::size_t i = 0; i < HEADER_DIFAT_SLOTS && fat_sectors.size() < num_fat; ++i) {
            std::uint32_t s = read_u32_le(hdr + OFF_DIFAT + i * 4);
            if (s <= MAXREGSECT) {
                fat_sectors.push_back(s);
            }
        }

        // Цепочка DIFAT: последний u32 сектора - следующий DIFAT сектор
        std::uint32_t difat = read_u32_le(hdr + OFF_FIRST_DIFAT_SECTOR);
        std::uint32_t num_difat = read_u32_le(hdr + OFF_NUM_DIFAT_SECTORS);
        const std::size_t per_sector = sector_size / 4 - 1;
        std::vector<bool> seen(max_sectors, false);
        for (std::uint32_t n = 0; n < num_difat && difat <= MAXREGSECT; ++n) {
            const std::uint8_t* ptr = nullptr;
            std::size_t len = 0;
            if (!sector_data(difat, ptr, len) || len < sector_size) {
                err = structure_error("DIFAT sector " + std::to_string(difat) +
                                      " lies beyond end of file");
                return false;
            }
            if (seen[difat]) {
                err = structure_error("DIFAT chain is cyclic at sector " + std::to_string(difat),
                                      (static_cast<std::uint64_t>(difat) + 1) * sector_size);
                return false;
            }
            seen[difat] = true;

            for (std::size_t i = 0; i < per_sector && fat_sectors.size() < num_fat; ++i) {
                std::uint32_t s = read_u32_le(ptr + i * 4);
                if (s <= MAXREGSECT) {
                    fat_sectors.push_back(s);
                }
            }
            difat = read_u32_le(ptr + per_sector * 4);
        }

        if (fat_sectors.empty()) {
            err = structure_error("compound file has no allocation table sectors");
            return false;
        }

        fat.clear();
        fat.reserve(fat_sectors.size() * (sector_size / 4));
        for (std::uint32_t s : fat_sectors) {
            const std::uint8_t* ptr = nullptr;
            std::size_t len = 0;
            if (!sector_data(s, ptr, len)) {
                err = structure_error("FAT sector " + std::to_string(s) +
                                      " lies beyond end of file");
                return false;
            }
            for (std::size_t i = 0; i + 4 <= len; i += 4) {
                fat.push_back(read_u32_le(ptr + i));
            }
        }
        return true;
    }

    bool load_directory(JumplistError& err) {
        std::vector<std::uint8_t> raw;
        if (!read_chain(read_u32_le(bytes.data() + OFF_FIRST_DIR_SECTOR), raw, err)) {
            err.message = "unable to read directory: " + err.message;
            return false;
        }

        dir.clear();
        for (std::size_t off = 0; off + DIR_ENTRY_SIZE <= raw.size(); off += DIR_ENTRY_SIZE) {
            const std::uint8_t* e = raw.data() + off;
            DirEntry entry;
            std::uint16_t name_len = read_u16_le(e + 0x40);
            entry.name = utf16le_to_utf8(e, std::min<std::size_t>(name_len, 64));
            entry.type = e[0x42];
            entry.left = read_u32_le(e + 0x44);
            entry.right = read_u32_le(e + 0x48);
            entry.child = read_u32_le(e + 0x4C);
            entry.start = read_u32_le(e + 0x74);
            entry.size = read_u64_le(e + 0x78);
            if (major == 3) {
                entry.size &= 0xFFFFFFFFULL;
            }
            dir.push_back(std::move(entry));
        }

        if (dir.empty() || dir[0].type != OBJ_ROOT) {
            err = structure_error("compound file directory has no root entry");
            return false;
        }
        return true;
    }

    bool load_mini(JumplistError& err) {
        std::uint32_t first_minifat = read_u32_le(bytes.data() + OFF_FIRST_MINIFAT_SECTOR);
        minifat.clear();
        mini_stream.clear();
        if (first_minifat > MAXREGSECT) {
            return true;
        }

        std::vector<std::uint8_t> raw;
        if (!read_chain(first_minifat, raw, err)) {
            err.message = "unable to read mini FAT: " + err.message;
            return false;
        }
        minifat = to_u32_array(raw);

        const DirEntry& root = dir[0];
        if (!read_chain(root.start, mini_stream, err)) {
            err.message = "unable to read mini stream: " + err.message;
            return false;
        }
        if (mini_stream.size() > root.size) {
            mini_stream.resize(static_cast<std::size_t>(root.size));
        }
        return true;
    }

    /// In-order обход дерева siblings хранилища
    void collect(std::uint32_t child, const std::string& prefix, std::vector<bool>& visited,
                 int depth) {
        std::vector<std::uint32_t> stack;
        std::uint32_t node = child;
        for (;;) {
            while (node < dir.size() && !visited[node]) {
                visited[node] = true;
                stack.push_back(node);
                node = dir[node].left;
            }
            if (stack.empty()) {
                break;
            }
            std::uint32_t id = stack.back();
            stack.pop_back();

            const DirEntry& e = dir[id];
            std::string path = prefix.empty() ? e.name : prefix + "/" + e.name;
            if (e.type == OBJ_STREAM) {
                Listed item;
                item.entry.name = e.name;
                item.entry.path = std::move(path);
                item.entry.size = e.size;
                item.dir_id = id;
                streams.push_back(std::move(item));
            } else if (e.type == OBJ_STORAGE && depth < MAX_STORAGE_DEPTH) {
                collect(e.child, path, visited, depth + 1);
            }
            node = e.right;
        }
    }
};

// ----------------------------------------------------------------------------
// CompoundFile
// ----------------------------------------------------------------------------

CompoundFile::CompoundFile() : impl_(std::make_unique<Impl>()) {}

CompoundFile::~CompoundFile() = default;

CompoundFile::CompoundFile(CompoundFile&&) noexcept = default;
CompoundFile& CompoundFile::operator=(CompoundFile&&) noexcept = default;

bool CompoundFile::load(std::vector<std::uint8_t> bytes) {
    loaded_ = false;
    error_.reset();
    impl_ = std::make_unique<Impl>();
    impl_->bytes = std::move(bytes);

    const auto& data = impl_->bytes;
    if (data.size() < HEADER_SIZE) {
        error_ = structure_error("file is too small to be a compound file (" +
                                 std::to_string(data.size()) + " bytes)");
        return false;
    }
    if (std::memcmp(data.data(), SIGNATURE, sizeof(SIGNATURE)) != 0) {
        error_ = structure_error("invalid compound file signature");
        return false;
    }
    if (read_u16_le(data.data() + OFF_BYTE_ORDER) != 0xFFFE) {
        error_ = structure_error("invalid compound file byte order mark", OFF_BYTE_ORDER);
        return false;
    }

    impl_->major = read_u16_le(data.data() + OFF_MAJOR_VERSION);
    std::uint16_t sector_shift = read_u16_le(data.data() + OFF_SECTOR_SHIFT);
    if (!((impl_->major == 3 && sector_shift == 9) || (impl_->major == 4 && sector_shift == 12))) {
        error_ = structure_error("unsupported compound file version " +
                                     std::to_string(impl_->major) + " with sector shift " +
                                     std::to_string(sector_shift),
                                 OFF_MAJOR_VERSION);
        return false;
    }
    std::uint16_t mini_shift = read_u16_le(data.data() + OFF_MINI_SECTOR_SHIFT);
    if (mini_shift != 6) {
        error_ = structure_error("unsupported mini sector shift " + std::to_string(mini_shift),
                                 OFF_MINI_SECTOR_SHIFT);
        return false;
    }
    impl_->sector_size = 1U << sector_shift;
    impl_->mini_sector_size = 1U << mini_shift;
    impl_->mini_cutoff = read_u32_le(data.data() + OFF_MINI_CUTOFF);

    JumplistError err;
    if (!impl_->load_fat(err) || !impl_->load_directory(err) || !impl_->load_mini(err)) {
        error_ = std::move(err);
        return false;
    }

    std::vector<bool> visited(impl_->dir.size(), false);
    visited[0] = true;
    impl_->collect(impl_->dir[0].child, "", visited, 0);

    loaded_ = true;
    return true;
}

std::uint16_t CompoundFile::major_version() const {
    return impl_->major;
}

std::vector<StreamEntry> CompoundFile::list_streams() const {
    std::vector<StreamEntry> out;
    out.reserve(impl_->streams.size());
    for (const auto& item : impl_->streams) {
        out.push_back(item.entry);
    }
    return out;
}

StreamBytes CompoundFile::open_stream(const std::string& path) const {
    auto it = std::find_if(impl_->streams.begin(), impl_->streams.end(),
                           [&](const Listed& item) { return item.entry.path == path; });
    if (it == impl_->streams.end()) {
        JumplistError err = structure_error("no stream named '" + path + "' in compound file");
        err.field = path;
        return err;
    }

    const DirEntry& e = impl_->dir[it->dir_id];
    std::vector<std::uint8_t> out;
    JumplistError err;
    bool ok = (e.size < impl_->mini_cutoff) ? impl_->read_mini_chain(e.start, out, err)
                                           : impl_->read_chain(e.start, out, err);
    if (!ok) {
        err.field = path;
        return err;
    }
    if (out.size() < e.size) {
        JumplistError short_err =
            structure_error("stream '" + path + "' is truncated: expected " +
                            std::to_string(e.size) + " bytes, found " + std::to_string(out.size()));
        short_err.field = path;
        return short_err;
    }
    out.resize(static_cast<std::size_t>(e.size));
    return out;
}

}  // namespace jumplist::io::cfb
