// ==============================================================================
// appids.cpp - Таблица AppID -> имя приложения
// ==============================================================================

#include "jumplist/appids.hpp"

#include "jumplist/platform.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace jumplist::parse {

namespace {

struct BuiltinAppId {
    const char* id;
    const char* name;
};

constexpr BuiltinAppId BUILTIN_APPIDS[] = {
    {"1b4dd67f29cb1962", "Windows Explorer Pinned and Recent"},
    {"5f7b5f1e01b83767", "Quick Access"},
    {"f01b4d95cf55d32a", "Windows Explorer"},
    {"7e4dca80246863e3", "Control Panel"},
    {"9b9cdc69c1c24e2b", "Notepad (64-bit)"},
    {"918e0ecb43d17e23", "Notepad (32-bit)"},
    {"12dc1ea8e34b5a6", "Microsoft Paint 6.1"},
    {"1bc392b8e104a00e", "Remote Desktop Connection"},
    {"28c8b86deab549a1", "Internet Explorer 8 / 9"},
    {"5d696d521de238c3", "Google Chrome"},
    {"6824f4a902c78fbd", "Mozilla Firefox"},
    {"9839aec31243a928", "Microsoft Office Excel 2010"},
    {"a7bd71699cd38d1c", "Microsoft Office Word 2010"},
    {"d00655d2aa12ff6d", "Microsoft Office PowerPoint 2010"},
    {"290532160612e071", "WinRAR"},
    {"b74736c2bd8cc8a5", "WinZip"},
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

AppIdTable::AppIdTable() : AppIdTable(true) {}

AppIdTable::AppIdTable(bool builtin) {
    if (builtin) {
        for (const auto& entry : BUILTIN_APPIDS) {
            names_.emplace(entry.id, entry.name);
        }
    }
}

AppIdTable AppIdTable::empty() {
    return AppIdTable(false);
}

std::string AppIdTable::lookup(const std::string& app_id) const {
    auto it = names_.find(to_lower(app_id));
    if (it == names_.end()) {
        return {};
    }
    return it->second;
}

void AppIdTable::insert(const std::string& app_id, std::string name) {
    names_[to_lower(app_id)] = std::move(name);
}

bool AppIdTable::load_yaml(const std::filesystem::path& path) {
    error_.reset();
    const std::string display = platform::path_to_utf8(path);

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            error_ = JumplistError::make(JumplistErrorKind::Io,
                                         "cannot open appids file: " + display);
            return false;
        }

        YAML::Node root = YAML::Load(file);
        YAML::Node table = (root.IsMap() && root["appids"]) ? root["appids"] : root;
        if (table.IsNull()) {
            return true;
        }
        if (!table.IsMap()) {
            error_ = JumplistError::make(JumplistErrorKind::Structure,
                                         "appids file must contain a mapping: " + display);
            return false;
        }

        for (const auto& item : table) {
            insert(item.first.as<std::string>(), item.second.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        error_ = JumplistError::make(JumplistErrorKind::Structure,
                                     "failed to parse appids file '" + display + "': " + e.what());
        return false;
    } catch (const std::exception& e) {
        error_ = JumplistError::make(JumplistErrorKind::Io,
                                     "failed to read appids file '" + display + "': " + e.what());
        return false;
    }
    return true;
}

}  // namespace jumplist::parse
