// ==============================================================================
// lnk.cpp - Декодер Shell Link (LNK, MS-SHLLINK)
// ==============================================================================
//
// Порядок секций:
//   ShellLinkHeader (0x4C) -> LinkTargetIDList? -> LinkInfo? -> StringData* ->
//   ExtraData (блоки до терминального u32 < 4)
//
// ==============================================================================

#include "jumplist/lnk.hpp"

#include <iomanip>
#include <sstream>

namespace jumplist::io::lnk {

namespace {

/// Блок расширения file entry shell item с длинным именем
constexpr std::uint32_t EXT_BLOCK_BEEF0004 = 0xBEEF0004;

/// Минимальный размер заголовка LinkInfo
constexpr std::uint32_t LINK_INFO_MIN_SIZE = 0x1C;

// LinkInfoFlags
constexpr std::uint32_t VOLUME_ID_AND_LOCAL_BASE_PATH = 0x1;
constexpr std::uint32_t COMMON_NETWORK_RELATIVE_LINK = 0x2;

/// Размер TrackerDataBlock без size/signature
constexpr std::size_t TRACKER_BODY_SIZE = 0x58;

JumplistError embedded_error(const JumplistError& inner) {
    JumplistError err = inner;
    err.kind = JumplistErrorKind::EmbeddedDecode;
    err.message = "invalid shell link: " + inner.message;
    return err;
}

JumplistError embedded_error(std::string message, std::uint64_t offset) {
    JumplistError err;
    err.kind = JumplistErrorKind::EmbeddedDecode;
    err.message = "invalid shell link: " + message;
    err.offset = offset;
    return err;
}

std::optional<std::string> ansi_at(const std::uint8_t* data, std::size_t len, std::size_t off) {
    if (off == 0 || off >= len) {
        return std::nullopt;
    }
    return ansi_to_utf8(data + off, len - off);
}

std::optional<std::string> unicode_at(const std::uint8_t* data, std::size_t len,
                                      std::size_t off) {
    if (off == 0 || off >= len) {
        return std::nullopt;
    }
    return utf16le_to_utf8(data + off, len - off);
}

std::string join_path(const std::string& base, const std::string& part) {
    if (base.empty()) {
        return part;
    }
    if (part.empty()) {
        return base;
    }
    if (base.back() == '\\') {
        return base + part;
    }
    return base + "\\" + part;
}

std::string hex32(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << v;
    return oss.str();
}

// ----------------------------------------------------------------------------
// LinkTargetIDList
// ----------------------------------------------------------------------------

/// Длинное имя из блока BEEF0004; смещение строки зависит от версии блока
std::optional<std::string> long_name(const std::uint8_t* item, std::size_t size) {
    for (std::size_t off = 14; off + 8 <= size; off += 2) {
        if (read_u32_le(item + off + 4) != EXT_BLOCK_BEEF0004) {
            continue;
        }
        std::uint16_t block_size = read_u16_le(item + off);
        std::uint16_t version = read_u16_le(item + off + 2);
        if (block_size < 8 || off + block_size > size) {
            return std::nullopt;
        }

        std::size_t name_off = 0;
        if (version >= 9) {
            name_off = 0x2E;
        } else if (version == 8) {
            name_off = 0x2A;
        } else if (version == 7) {
            name_off = 0x26;
        } else if (version >= 3) {
            name_off = 0x14;
        } else {
            return std::nullopt;
        }
        if (name_off >= block_size) {
            return std::nullopt;
        }

        std::string name = utf16le_to_utf8(item + off + name_off, block_size - name_off);
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    }
    return std::nullopt;
}

/// Собрать путь из volume и file entry shell items
std::optional<std::string> parse_id_list(const std::uint8_t* data, std::size_t len) {
    std::string path;
    bool found = false;

    std::size_t off = 0;
    while (off + 2 <= len) {
        std::uint16_t item_size = read_u16_le(data + off);
        if (item_size == 0 || item_size < 3 || off + item_size > len) {
            break;
        }
        const std::uint8_t* item = data + off;
        std::uint8_t class_type = item[2];

        if ((class_type & 0x70) == 0x20) {
            // Volume: "C:\"
            path = ansi_to_utf8(item + 3, item_size - 3);
            found = true;
        } else if ((class_type & 0x70) == 0x30 && item_size > 14) {
            // File entry: основное имя с 0x0E, длинное - в BEEF0004
            std::string primary = (class_type & 0x04) != 0
                                      ? utf16le_to_utf8(item + 14, item_size - 14)
                                      : ansi_to_utf8(item + 14, item_size - 14);
            auto name = long_name(item, item_size);
            path = join_path(path, name ? *name : primary);
            found = true;
        }
        off += item_size;
    }

    if (!found) {
        return std::nullopt;
    }
    return path;
}

// ----------------------------------------------------------------------------
// LinkInfo
// ----------------------------------------------------------------------------

LinkInfo parse_link_info(const std::uint8_t* li, std::size_t size) {
    LinkInfo info;
    std::uint32_t header_size = read_u32_le(li + 4);
    info.flags = read_u32_le(li + 8);
    std::uint32_t volume_off = read_u32_le(li + 12);
    std::uint32_t base_path_off = read_u32_le(li + 16);
    std::uint32_t network_off = read_u32_le(li + 20);
    std::uint32_t suffix_off = read_u32_le(li + 24);

    std::uint32_t base_path_off_unicode = 0;
    std::uint32_t suffix_off_unicode = 0;
    if (header_size >= 0x24 && size >= 0x24) {
        base_path_off_unicode = read_u32_le(li + 28);
        suffix_off_unicode = read_u32_le(li + 32);
    }

    if ((info.flags & VOLUME_ID_AND_LOCAL_BASE_PATH) != 0) {
        if (volume_off != 0 && static_cast<std::size_t>(volume_off) + 16 <= size) {
            const std::uint8_t* vol = li + volume_off;
            std::size_t vol_len = size - volume_off;
            info.drive_type = read_u32_le(vol + 4);
            info.drive_serial_number = read_u32_le(vol + 8);
            std::uint32_t label_off = read_u32_le(vol + 12);
            if (label_off == 0x14 && vol_len >= 20) {
                info.volume_label = unicode_at(vol, vol_len, read_u32_le(vol + 16));
            } else {
                info.volume_label = ansi_at(vol, vol_len, label_off);
            }
        }
        info.local_base_path = base_path_off_unicode != 0
                                   ? unicode_at(li, size, base_path_off_unicode)
                                   : ansi_at(li, size, base_path_off);
    }

    if ((info.flags & COMMON_NETWORK_RELATIVE_LINK) != 0 && network_off != 0 &&
        static_cast<std::size_t>(network_off) + 20 <= size) {
        const std::uint8_t* net = li + network_off;
        std::size_t net_len = size - network_off;
        std::uint32_t net_flags = read_u32_le(net + 4);
        std::uint32_t name_off = read_u32_le(net + 8);
        std::uint32_t device_off = read_u32_le(net + 12);
        if (name_off > 0x14 && net_len >= 28) {
            info.network_share_name = unicode_at(net, net_len, read_u32_le(net + 20));
            info.device_name = unicode_at(net, net_len, read_u32_le(net + 24));
        } else {
            info.network_share_name = ansi_at(net, net_len, name_off);
            if ((net_flags & 0x1) != 0) {
                info.device_name = ansi_at(net, net_len, device_off);
            }
        }
    }

    auto suffix = suffix_off_unicode != 0 ? unicode_at(li, size, suffix_off_unicode)
                                          : ansi_at(li, size, suffix_off);
    info.common_path_suffix = suffix.value_or("");
    return info;
}

}  // namespace

// ----------------------------------------------------------------------------
// decode_shell_link
// ----------------------------------------------------------------------------

DecodeResult decode_shell_link(ByteCursor& cursor) {
    const std::size_t start = cursor.position();
    ShellLink link;

    auto fail = [&cursor]() -> DecodeResult { return embedded_error(*cursor.last_error()); };

    std::uint32_t header_size = 0;
    if (!cursor.read_u32("lnk.header_size", header_size)) {
        return fail();
    }
    if (header_size != HEADER_SIZE) {
        return embedded_error("unexpected header size 0x" + hex32(header_size), start);
    }

    std::string clsid;
    if (!cursor.read_guid("lnk.link_clsid", clsid)) {
        return fail();
    }
    if (clsid != SHELL_LINK_CLSID) {
        return embedded_error("unexpected class id '" + clsid + "'", start + 4);
    }

    ShellLinkHeader& h = link.header;
    if (!cursor.read_u32("lnk.link_flags", h.link_flags) ||
        !cursor.read_u32("lnk.file_attributes", h.file_attributes) ||
        !cursor.read_u64("lnk.creation_time", h.creation_time) ||
        !cursor.read_u64("lnk.access_time", h.access_time) ||
        !cursor.read_u64("lnk.write_time", h.write_time) ||
        !cursor.read_u32("lnk.file_size", h.file_size) ||
        !cursor.read_i32("lnk.icon_index", h.icon_index) ||
        !cursor.read_u32("lnk.show_command", h.show_command) ||
        !cursor.read_u16("lnk.hot_key", h.hot_key) || !cursor.skip("lnk.reserved", 10)) {
        return fail();
    }

    if ((h.link_flags & HAS_LINK_TARGET_ID_LIST) != 0) {
        std::uint16_t id_list_size = 0;
        std::vector<std::uint8_t> id_list;
        if (!cursor.read_u16("lnk.id_list_size", id_list_size) ||
            !cursor.read_bytes("lnk.id_list", id_list_size, id_list)) {
            return fail();
        }
        link.id_list_path = parse_id_list(id_list.data(), id_list.size());
    }

    if ((h.link_flags & HAS_LINK_INFO) != 0) {
        const std::size_t info_start = cursor.position();
        std::uint32_t info_size = 0;
        if (!cursor.read_u32("lnk.link_info_size", info_size)) {
            return fail();
        }
        if (info_size < LINK_INFO_MIN_SIZE) {
            return embedded_error("link info size 0x" + hex32(info_size) + " is too small",
                                  info_start);
        }
        std::vector<std::uint8_t> info;
        if (!cursor.seek("lnk.link_info", info_start) ||
            !cursor.read_bytes("lnk.link_info", info_size, info)) {
            return fail();
        }
        link.link_info = parse_link_info(info.data(), info.size());
    }

    // StringData: счётчик в символах, UTF-16 при IS_UNICODE
    const bool unicode = (h.link_flags & IS_UNICODE) != 0;
    auto read_string_data = [&cursor, unicode](const char* field,
                                               std::optional<std::string>& out) -> bool {
        std::uint16_t count = 0;
        if (!cursor.read_u16(field, count)) {
            return false;
        }
        std::string value;
        if (unicode) {
            if (!cursor.read_utf16(field, count, value)) {
                return false;
            }
        } else {
            std::vector<std::uint8_t> raw;
            if (!cursor.read_bytes(field, count, raw)) {
                return false;
            }
            value = ansi_to_utf8(raw.data(), raw.size());
        }
        out = std::move(value);
        return true;
    };

    if (((h.link_flags & HAS_NAME) != 0 && !read_string_data("lnk.name_string", link.name)) ||
        ((h.link_flags & HAS_RELATIVE_PATH) != 0 &&
         !read_string_data("lnk.relative_path", link.relative_path)) ||
        ((h.link_flags & HAS_WORKING_DIR) != 0 &&
         !read_string_data("lnk.working_dir", link.working_dir)) ||
        ((h.link_flags & HAS_ARGUMENTS) != 0 &&
         !read_string_data("lnk.command_line_arguments", link.arguments)) ||
        ((h.link_flags & HAS_ICON_LOCATION) != 0 &&
         !read_string_data("lnk.icon_location", link.icon_location))) {
        return fail();
    }

    // ExtraData
    while (cursor.remaining() >= 4) {
        const std::size_t block_start = cursor.position();
        std::uint32_t block_size = 0;
        if (!cursor.read_u32("lnk.extra_data.block_size", block_size)) {
            return fail();
        }
        if (block_size < 4) {
            break;  // TerminalBlock
        }
        if (block_size < 8) {
            return embedded_error("extra data block size 0x" + hex32(block_size) +
                                      " is too small",
                                  block_start);
        }

        std::uint32_t signature = 0;
        std::vector<std::uint8_t> body;
        if (!cursor.read_u32("lnk.extra_data.signature", signature) ||
            !cursor.read_bytes("lnk.extra_data.block", block_size - 8, body)) {
            return fail();
        }

        if (signature == TRACKER_DATA_SIGNATURE && body.size() >= TRACKER_BODY_SIZE) {
            TrackerData tracker;
            tracker.machine_id = ansi_to_utf8(body.data() + 8, 16);
            tracker.volume_droid = guid_to_string(body.data() + 24);
            tracker.file_droid = guid_to_string(body.data() + 40);
            tracker.volume_birth_droid = guid_to_string(body.data() + 56);
            tracker.file_birth_droid = guid_to_string(body.data() + 72);
            link.tracker = std::move(tracker);
        }
    }

    return link;
}

DecodeResult decode_shell_link(const std::vector<std::uint8_t>& bytes) {
    ByteCursor cursor(bytes);
    return decode_shell_link(cursor);
}

// ----------------------------------------------------------------------------
// ShellLink
// ----------------------------------------------------------------------------

std::string ShellLink::target_full_path() const {
    if (link_info.has_value()) {
        if (link_info->local_base_path.has_value() && !link_info->local_base_path->empty()) {
            return *link_info->local_base_path + link_info->common_path_suffix;
        }
        if (link_info->network_share_name.has_value()) {
            return join_path(*link_info->network_share_name, link_info->common_path_suffix);
        }
    }
    return id_list_path.value_or("");
}

FlatRecord ShellLink::normalize() const {
    FlatRecord r;
    r["target_full_path"] = target_full_path();
    r["target_creation_time"] = filetime_to_iso8601(header.creation_time);
    r["target_access_time"] = filetime_to_iso8601(header.access_time);
    r["target_modification_time"] = filetime_to_iso8601(header.write_time);
    r["target_size"] = std::to_string(header.file_size);
    r["target_hostname"] = tracker.has_value() ? tracker->machine_id : "";
    r["working_dir"] = working_dir.value_or("");
    r["relative_path"] = relative_path.value_or("");
    r["icon_location"] = icon_location.value_or("");

    r["volume_label"] = "";
    r["drive_serial_number"] = "";
    if (link_info.has_value()) {
        r["volume_label"] = link_info->volume_label.value_or("");
        if (link_info->drive_serial_number.has_value()) {
            r["drive_serial_number"] = hex32(*link_info->drive_serial_number);
        }
    }
    return r;
}

Value ShellLink::to_value() const {
    Value v = Value::make_object();
    v.set("target_full_path", Value(target_full_path()));
    v.set("link_flags", Value(header.link_flags));
    v.set("file_attributes", Value(header.file_attributes));
    v.set("creation_time", Value(filetime_to_iso8601(header.creation_time)));
    v.set("access_time", Value(filetime_to_iso8601(header.access_time)));
    v.set("write_time", Value(filetime_to_iso8601(header.write_time)));
    v.set("file_size", Value(header.file_size));
    v.set("icon_index", Value(header.icon_index));
    v.set("show_command", Value(header.show_command));
    v.set("hot_key", Value(static_cast<std::uint32_t>(header.hot_key)));

    if (id_list_path) {
        v.set("id_list_path", Value(*id_list_path));
    }
    if (name) {
        v.set("name_string", Value(*name));
    }
    if (relative_path) {
        v.set("relative_path", Value(*relative_path));
    }
    if (working_dir) {
        v.set("working_dir", Value(*working_dir));
    }
    if (arguments) {
        v.set("command_line_arguments", Value(*arguments));
    }
    if (icon_location) {
        v.set("icon_location", Value(*icon_location));
    }

    if (link_info) {
        Value info = Value::make_object();
        info.set("flags", Value(link_info->flags));
        if (link_info->drive_type) {
            info.set("drive_type", Value(*link_info->drive_type));
        }
        if (link_info->drive_serial_number) {
            info.set("drive_serial_number", Value(hex32(*link_info->drive_serial_number)));
        }
        if (link_info->volume_label) {
            info.set("volume_label", Value(*link_info->volume_label));
        }
        if (link_info->local_base_path) {
            info.set("local_base_path", Value(*link_info->local_base_path));
        }
        if (link_info->network_share_name) {
            info.set("network_share_name", Value(*link_info->network_share_name));
        }
        if (link_info->device_name) {
            info.set("device_name", Value(*link_info->device_name));
        }
        info.set("common_path_suffix", Value(link_info->common_path_suffix));
        v.set("link_info", std::move(info));
    }

    if (tracker) {
        Value t = Value::make_object();
        t.set("machine_id", Value(tracker->machine_id));
        t.set("volume_droid", Value(tracker->volume_droid));
        t.set("file_droid", Value(tracker->file_droid));
        t.set("volume_birth_droid", Value(tracker->volume_birth_droid));
        t.set("file_birth_droid", Value(tracker->file_birth_droid));
        v.set("tracker", std::move(t));
    }
    return v;
}

}  // namespace jumplist::io::lnk
