// ==============================================================================
// destlist.cpp - Декодер DestList и корреляция с LNK потоками
// ==============================================================================

#include "jumplist/destlist.hpp"

#include "jumplist/binary.hpp"

#include <algorithm>
#include <sstream>

namespace jumplist::parse {

namespace {

constexpr std::size_t HEADER_RESERVED_SIZE = 20;
constexpr std::size_t ENTRY_RESERVED_HEAD = 8;
constexpr std::size_t ENTRY_RESERVED_MID = 8;
constexpr std::size_t HOSTNAME_SIZE = 16;

bool decode_header(io::ByteCursor& cursor, DestListHeader& h) {
    return cursor.read_u32("header.version", h.version) &&
           cursor.read_u32("header.entry_count", h.entry_count) &&
           cursor.read_u32("header.pinned_count", h.pinned_count) &&
           cursor.skip("header.reserved", HEADER_RESERVED_SIZE);
}

bool decode_entry(io::ByteCursor& cursor, const EntryLayout& layout, DestListEntry& e) {
    std::uint32_t pin_status = 0;
    std::uint16_t path_len = 0;
    bool ok = cursor.skip("entry.reserved", ENTRY_RESERVED_HEAD) &&
              cursor.read_guid("entry.volume_id", e.volume_id) &&
              cursor.read_guid("entry.file_id", e.file_id) &&
              cursor.read_guid("entry.volume_birth_id", e.volume_birth_id) &&
              cursor.read_guid("entry.file_birth_id", e.file_birth_id) &&
              cursor.read_utf8("entry.hostname", HOSTNAME_SIZE, e.hostname) &&
              cursor.read_u32("entry.entry_ordinal", e.entry_ordinal) &&
              cursor.skip("entry.reserved", ENTRY_RESERVED_MID) &&
              cursor.read_u64("entry.mtime", e.mtime) &&
              cursor.read_u32("entry.pin_status", pin_status) &&
              cursor.skip("entry.reserved", layout.reserved_after_pin) &&
              cursor.read_u16("entry.path_length", path_len) &&
              cursor.read_utf16("entry.path", path_len, e.path) &&
              cursor.skip("entry.reserved", layout.reserved_after_path);
    if (ok) {
        e.pinned = pin_status != PIN_SENTINEL_UNPINNED;
    }
    return ok;
}

/// Найти и декодировать LNK поток записи; первое совпадение по имени
void correlate(DestListEntry& entry, const std::vector<io::cfb::StreamEntry>& listing,
               const io::cfb::CompoundContainer& container,
               std::vector<JumplistError>& failures) {
    const std::string name = entry.stream_name();
    auto it = std::find_if(listing.begin(), listing.end(),
                           [&name](const io::cfb::StreamEntry& s) { return s.name == name; });
    if (it == listing.end()) {
        return;
    }

    auto bytes = container.open_stream(it->path);
    if (auto* err = std::get_if<JumplistError>(&bytes)) {
        failures.push_back(*err);
        return;
    }

    auto decoded = io::lnk::decode_shell_link(std::get<std::vector<std::uint8_t>>(bytes));
    if (auto* err = std::get_if<JumplistError>(&decoded)) {
        JumplistError failure = *err;
        failure.message = "stream '" + it->path + "': " + err->message;
        failures.push_back(std::move(failure));
        return;
    }
    entry.lnk = std::move(std::get<io::lnk::ShellLink>(decoded));
}

}  // namespace

EntryLayout entry_layout(std::uint32_t version) {
    EntryLayout layout;
    if (version > 1) {
        layout.reserved_after_pin = 16;
        layout.reserved_after_path = 4;
    }
    return layout;
}

std::string DestListEntry::stream_name() const {
    std::ostringstream oss;
    oss << std::hex << entry_ordinal;
    return oss.str();
}

Value DestListEntry::to_value() const {
    Value v = Value::make_object();
    v.set("volume_droid", Value(volume_id));
    v.set("file_droid", Value(file_id));
    v.set("volume_birth_droid", Value(volume_birth_id));
    v.set("file_birth_droid", Value(file_birth_id));
    v.set("hostname", Value(hostname));
    v.set("entry_number", Value(entry_ordinal));
    v.set("mtime", Value(io::filetime_to_iso8601(mtime)));
    v.set("pinned", Value(pinned));
    v.set("path", Value(path));
    if (lnk.has_value()) {
        v.set("lnk", lnk->to_value());
    }
    return v;
}

Value DestList::to_value() const {
    Value h = Value::make_object();
    h.set("version", Value(header.version));
    h.set("number_of_entries", Value(header.entry_count));
    h.set("number_of_pinned_entries", Value(header.pinned_count));

    Value list = Value::make_array();
    for (const auto& e : entries) {
        list.push_back(e.to_value());
    }

    Value v = Value::make_object();
    v.set("header", std::move(h));
    v.set("entries", std::move(list));
    return v;
}

DestListResult decode_destlist(const std::vector<std::uint8_t>& bytes,
                               const std::vector<io::cfb::StreamEntry>* listing,
                               const io::cfb::CompoundContainer* container) {
    DestList result;
    if (bytes.empty()) {
        return result;
    }

    io::ByteCursor cursor(bytes);
    if (!decode_header(cursor, result.header)) {
        return *cursor.last_error();
    }

    const EntryLayout layout = entry_layout(result.header.version);
    while (!cursor.at_end()) {
        DestListEntry entry;
        if (!decode_entry(cursor, layout, entry)) {
            result.truncation = cursor.last_error();
            break;
        }
        if (listing != nullptr && container != nullptr) {
            correlate(entry, *listing, *container, result.correlation_failures);
        }
        result.entries.push_back(std::move(entry));
    }

    std::stable_sort(result.entries.begin(), result.entries.end(),
                     [](const DestListEntry& a, const DestListEntry& b) {
                         return a.entry_ordinal > b.entry_ordinal;
                     });
    return result;
}

}  // namespace jumplist::parse
