// ==============================================================================
// jumplist.cpp - Запись Jump List и диспетчер форматов
// ==============================================================================

#include "jumplist/jumplist.hpp"

#include "jumplist/cfb.hpp"
#include "jumplist/platform.hpp"

#include <algorithm>
#include <fstream>

namespace jumplist::parse {

namespace {

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool read_file_bytes(const std::filesystem::path& path, std::vector<std::uint8_t>& out,
                     JumplistError& error) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        error = JumplistError::make(JumplistErrorKind::Io,
                                    "could not open file: " + platform::path_to_utf8(path));
        return false;
    }

    auto size = file.tellg();
    if (size < 0) {
        error = JumplistError::make(JumplistErrorKind::Io,
                                    "could not stat file: " + platform::path_to_utf8(path));
        return false;
    }

    file.seekg(0, std::ios::beg);
    out.resize(static_cast<std::size_t>(size));
    if (size > 0 &&
        !file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
        error = JumplistError::make(JumplistErrorKind::Io,
                                    "failed to read file: " + platform::path_to_utf8(path));
        return false;
    }
    return true;
}

JumplistResult parse_automatic(std::vector<std::uint8_t> bytes) {
    io::cfb::CompoundFile container;
    if (!container.load(std::move(bytes))) {
        JumplistError err = JumplistError::make(JumplistErrorKind::Structure,
                                                "unable to parse the compound file");
        if (container.last_error()) {
            err.message += ": " + container.last_error()->format();
        }
        return err;
    }

    const std::vector<io::cfb::StreamEntry> listing = container.list_streams();

    std::vector<std::uint8_t> destlist_bytes;
    auto it = std::find_if(listing.begin(), listing.end(), [](const io::cfb::StreamEntry& s) {
        return s.name == DESTLIST_STREAM_NAME;
    });
    if (it != listing.end() && it->size > 0) {
        auto stream = container.open_stream(it->path);
        if (auto* err = std::get_if<JumplistError>(&stream)) {
            return *err;
        }
        destlist_bytes = std::move(std::get<std::vector<std::uint8_t>>(stream));
    }

    auto decoded = decode_destlist(destlist_bytes, &listing, &container);
    if (auto* err = std::get_if<JumplistError>(&decoded)) {
        return *err;
    }

    JumplistRecord record;
    record.type = JumplistType::Automatic;
    record.data = std::move(std::get<DestList>(decoded));
    return record;
}

JumplistResult parse_custom(const std::vector<std::uint8_t>& bytes) {
    auto decoded = decode_custom_destinations(bytes);
    if (auto* err = std::get_if<JumplistError>(&decoded)) {
        return *err;
    }

    JumplistRecord record;
    record.type = JumplistType::Custom;
    record.data = std::move(std::get<CustomDestinations>(decoded));
    return record;
}

}  // namespace

const char* jumplist_type_to_string(JumplistType type) {
    switch (type) {
        case JumplistType::Automatic:
            return "automatic";
        case JumplistType::Custom:
            return "custom";
    }
    return "unknown";
}

JumplistTypeResult jumplist_type_from_filename(std::string_view filename) {
    if (ends_with(filename, AUTOMATIC_SUFFIX)) {
        return JumplistType::Automatic;
    }
    if (ends_with(filename, CUSTOM_SUFFIX)) {
        return JumplistType::Custom;
    }
    return JumplistError::make(JumplistErrorKind::UnrecognizedFileType,
                               "unrecognized jump list file type: " + std::string(filename));
}

Value JumplistRecord::to_value() const {
    Value v = Value::make_object();
    v.set("app_id", Value(app_id));
    v.set("app_name", Value(app_name));
    v.set("type", Value(jumplist_type_to_string(type)));
    v.set("source_path", Value(source_path));
    std::visit([&v](const auto& d) { v.set("data", d.to_value()); }, data);
    return v;
}

JumplistResult parse_jumplist_bytes(std::vector<std::uint8_t> bytes, JumplistType type) {
    if (type == JumplistType::Automatic) {
        return parse_automatic(std::move(bytes));
    }
    return parse_custom(bytes);
}

JumplistResult parse_jumplist_file(const std::filesystem::path& path, const AppIdTable& appids) {
    const std::string filename = platform::path_to_utf8(path.filename());
    auto type = jumplist_type_from_filename(filename);
    if (auto* err = std::get_if<JumplistError>(&type)) {
        return *err;
    }

    std::vector<std::uint8_t> bytes;
    JumplistError io_error;
    if (!read_file_bytes(path, bytes, io_error)) {
        return io_error;
    }

    auto result = parse_jumplist_bytes(std::move(bytes), std::get<JumplistType>(type));
    if (auto* record = std::get_if<JumplistRecord>(&result)) {
        record->app_id = filename.substr(0, filename.find('.'));
        record->app_name = appids.lookup(record->app_id);
        record->source_path = platform::path_to_utf8(path);
    }
    return result;
}

std::optional<JumplistError> empty_artifact_notice(const JumplistRecord& record) {
    const auto* destlist = std::get_if<DestList>(&record.data);
    if (destlist == nullptr || !destlist->entries.empty()) {
        return std::nullopt;
    }
    JumplistError notice = JumplistError::make(
        JumplistErrorKind::EmptyArtifact,
        "jump list '" + record.source_path + "' has no DestList entries");
    return notice;
}

}  // namespace jumplist::parse
