// ==============================================================================
// custom_destinations.cpp - Декодер CustomDestinations
// ==============================================================================

#include "jumplist/custom_destinations.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace jumplist::parse {

namespace {

/// Размер завершающего маркера после каждой категории
constexpr std::size_t CATEGORY_FOOTER_SIZE = 4;

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

/// Записи Custom/Task: class_id GUID + LNK, count раз
bool read_link_entries(io::ByteCursor& cursor, std::uint32_t count,
                       std::vector<io::lnk::ShellLink>& out, JumplistError& err) {
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::size_t entry_start = cursor.position();
        std::string class_id;
        if (!cursor.read_guid("category.entry.class_id", class_id)) {
            err = *cursor.last_error();
            return false;
        }
        if (!iequals(class_id, io::lnk::SHELL_LINK_CLSID)) {
            err.kind = JumplistErrorKind::UnknownVariant;
            err.message = "Custom/Task category entry with unknown class id '" + class_id + "'";
            err.field = "category.entry.class_id";
            err.offset = entry_start;
            return false;
        }

        auto decoded = io::lnk::decode_shell_link(cursor);
        if (auto* e = std::get_if<JumplistError>(&decoded)) {
            err = *e;
            err.message = "category entry " + std::to_string(i) + ": " + e->message;
            return false;
        }
        out.push_back(std::move(std::get<io::lnk::ShellLink>(decoded)));
    }
    return true;
}

Value links_to_value(const std::vector<io::lnk::ShellLink>& links) {
    Value arr = Value::make_array();
    for (const auto& link : links) {
        arr.push_back(link.to_value());
    }
    return arr;
}

}  // namespace

// ----------------------------------------------------------------------------
// Known
// ----------------------------------------------------------------------------

KnownCategoryId known_category_from_i32(std::int32_t id) {
    KnownCategoryId out;
    out.raw = id;
    switch (id) {
    case 1:
        out.kind = KnownCategoryKind::Frequent;
        break;
    case 2:
        out.kind = KnownCategoryKind::Recent;
        break;
    case -1:
        out.kind = KnownCategoryKind::None;
        break;
    default:
        out.kind = KnownCategoryKind::Unknown;
        break;
    }
    return out;
}

std::string KnownCategoryId::to_string() const {
    switch (kind) {
    case KnownCategoryKind::Frequent:
        return "frequent";
    case KnownCategoryKind::Recent:
        return "recent";
    case KnownCategoryKind::None:
        return "none";
    case KnownCategoryKind::Unknown:
        break;
    }
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
        << static_cast<std::uint32_t>(raw);
    return oss.str();
}

// ----------------------------------------------------------------------------
// Category
// ----------------------------------------------------------------------------

const char* category_type_name(const Category& category) {
    if (std::holds_alternative<CustomCategory>(category)) {
        return "custom";
    }
    if (std::holds_alternative<KnownCategory>(category)) {
        return "known";
    }
    return "task";
}

const std::vector<io::lnk::ShellLink>* category_entries(const Category& category) {
    if (const auto* c = std::get_if<CustomCategory>(&category)) {
        return &c->entries;
    }
    if (const auto* t = std::get_if<TaskCategory>(&category)) {
        return &t->entries;
    }
    return nullptr;
}

Value category_to_value(const Category& category) {
    Value v = Value::make_object();
    v.set("type", Value(category_type_name(category)));
    std::visit(
        [&v](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, CustomCategory>) {
                v.set("name", Value(c.name));
                v.set("num_of_entries", Value(c.entry_count));
                v.set("entries", links_to_value(c.entries));
            } else if constexpr (std::is_same_v<T, KnownCategory>) {
                v.set("id", Value(c.id.to_string()));
            } else {
                v.set("num_of_entries", Value(c.entry_count));
                v.set("entries", links_to_value(c.entries));
            }
        },
        category);
    return v;
}

Value CustomDestinations::to_value() const {
    Value h = Value::make_object();
    h.set("version", Value(header.version));
    h.set("num_of_categories", Value(header.category_count));

    Value cats = Value::make_array();
    for (const auto& c : categories) {
        cats.push_back(category_to_value(c));
    }

    Value v = Value::make_object();
    v.set("header", std::move(h));
    v.set("categories", std::move(cats));
    return v;
}

// ----------------------------------------------------------------------------
// decode_custom_destinations
// ----------------------------------------------------------------------------

CustomDestinationsResult decode_custom_destinations(io::ByteCursor& cursor) {
    CustomDestinations result;
    auto& h = result.header;
    if (!cursor.read_u32("header.version", h.version) ||
        !cursor.read_u32("header.category_count", h.category_count) ||
        !cursor.read_u32("header.reserved", h.reserved)) {
        return *cursor.last_error();
    }

    for (std::uint32_t index = 0; index < h.category_count; ++index) {
        const std::size_t category_start = cursor.position();
        std::uint32_t type = 0;
        if (!cursor.read_u32("category.type", type)) {
            return *cursor.last_error();
        }

        JumplistError err;
        switch (type) {
        case CATEGORY_CUSTOM: {
            CustomCategory c;
            std::uint16_t name_len = 0;
            if (!cursor.read_u16("category.name_length", name_len) ||
                !cursor.read_utf16("category.name", name_len, c.name) ||
                !cursor.read_u32("category.entry_count", c.entry_count)) {
                return *cursor.last_error();
            }
            if (!read_link_entries(cursor, c.entry_count, c.entries, err)) {
                return err;
            }
            result.categories.emplace_back(std::move(c));
            break;
        }
        case CATEGORY_KNOWN: {
            std::int32_t id = 0;
            if (!cursor.read_i32("category.known_id", id)) {
                return *cursor.last_error();
            }
            result.categories.emplace_back(KnownCategory{known_category_from_i32(id)});
            break;
        }
        case CATEGORY_TASK: {
            TaskCategory t;
            if (!cursor.read_u32("category.entry_count", t.entry_count)) {
                return *cursor.last_error();
            }
            if (!read_link_entries(cursor, t.entry_count, t.entries, err)) {
                return err;
            }
            result.categories.emplace_back(std::move(t));
            break;
        }
        default:
            err.kind = JumplistErrorKind::UnknownVariant;
            err.message = "unknown category type " + std::to_string(type) + " (category " +
                          std::to_string(index) + ")";
            err.field = "category.type";
            err.offset = category_start;
            return err;
        }

        if (!cursor.skip("category.footer", CATEGORY_FOOTER_SIZE)) {
            return *cursor.last_error();
        }
    }

    return result;
}

CustomDestinationsResult decode_custom_destinations(const std::vector<std::uint8_t>& bytes) {
    io::ByteCursor cursor(bytes);
    return decode_custom_destinations(cursor);
}

}  // namespace jumplist::parse
