// ==============================================================================
// normalize.cpp - Плоское представление декодированных записей
// ==============================================================================

#include "jumplist/normalize.hpp"

namespace jumplist::parse {

FlatRecord normalize_link(const io::lnk::ShellLink& link) {
    FlatRecord record = link.normalize();
    record["name_string"] = link.name_string().value_or("");
    record["command_line_arguments"] = link.command_line_arguments().value_or("");
    return record;
}

std::vector<FlatRecord> normalize(const DestList& destlist) {
    std::vector<FlatRecord> out;
    out.reserve(destlist.entries.size());
    for (const auto& entry : destlist.entries) {
        if (entry.lnk.has_value()) {
            out.push_back(normalize_link(*entry.lnk));
        } else {
            out.emplace_back();
        }
    }
    return out;
}

std::vector<FlatRecord> normalize(const CustomDestinations& custom) {
    std::vector<FlatRecord> out;
    for (const auto& category : custom.categories) {
        const auto* entries = category_entries(category);
        if (entries == nullptr) {
            continue;
        }
        for (const auto& link : *entries) {
            out.push_back(normalize_link(link));
        }
    }
    return out;
}

std::vector<FlatRecord> normalize(const JumplistRecord& record) {
    return std::visit([](const auto& data) { return normalize(data); }, record.data);
}

std::vector<FlatRecord> flatten(const JumplistRecord& record) {
    std::vector<FlatRecord> out = normalize(record);
    for (auto& item : out) {
        item["jumplist_file_path"] = record.source_path;
    }
    return out;
}

}  // namespace jumplist::parse
