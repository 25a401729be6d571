// ==============================================================================
// report.cpp - Формирование отчёта CSV / JSON / JSONL
// ==============================================================================

#include "jumplist/report.hpp"

#include "jumplist/normalize.hpp"

#include <rapidjson/document.h>

namespace jumplist::output {

namespace {

/// Колонки идентификации файла; остальные берутся из нормализованной записи
constexpr std::size_t IDENTITY_COLUMNS = 3;

}  // namespace

const std::vector<std::string>& csv_columns() {
    static const std::vector<std::string> columns = {
        "app_id",
        "app_name",
        "type",
        "target_full_path",
        "command_line_arguments",
        "name_string",
        "target_modification_time",
        "target_access_time",
        "target_creation_time",
        "target_size",
        "target_hostname",
    };
    return columns;
}

std::string csv_quote(std::string_view field) {
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

std::string csv_header() {
    std::string line;
    for (const auto& column : csv_columns()) {
        if (!line.empty()) {
            line += ',';
        }
        line += csv_quote(column);
    }
    return line;
}

std::vector<std::string> csv_rows(const parse::JumplistRecord& record) {
    std::vector<std::string> rows;
    const auto& columns = csv_columns();
    const std::string type = parse::jumplist_type_to_string(record.type);

    for (const auto& item : parse::normalize(record)) {
        if (item.empty()) {
            continue;
        }

        std::string row = csv_quote(record.app_id) + ',' + csv_quote(record.app_name) + ',' +
                          csv_quote(type);
        for (std::size_t i = IDENTITY_COLUMNS; i < columns.size(); ++i) {
            auto it = item.find(columns[i]);
            row += ',';
            row += csv_quote(it != item.end() ? it->second : std::string());
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

Value normalized_value(const parse::JumplistRecord& record) {
    Value list = Value::make_array();
    for (auto& item : parse::flatten(record)) {
        item["app_id"] = record.app_id;
        item["app_name"] = record.app_name;
        list.push_back(Value::from_flat(item));
    }
    return list;
}

// ----------------------------------------------------------------------------
// Reporter
// ----------------------------------------------------------------------------

Reporter::Reporter(Writer& writer, const ReportOptions& opts)
    : writer_(writer), opts_(opts), json_list_(Value::make_array()) {}

void Reporter::begin() {
    if (opts_.format == Format::Csv && !opts_.no_headers) {
        writer_.write_line(Stream::Stdout, csv_header());
    }
}

void Reporter::add(const parse::JumplistRecord& record) {
    switch (opts_.format) {
    case Format::Csv:
        for (const auto& row : csv_rows(record)) {
            writer_.write_line(Stream::Stdout, row);
            ++written_;
        }
        writer_.flush();
        break;
    case Format::Jsonl: {
        Value v = opts_.normalize ? normalized_value(record) : record.to_value();
        rapidjson::Document doc = v.to_rapidjson_document();
        writer_.write_json_line(doc);
        ++written_;
        break;
    }
    case Format::Json:
        json_list_.push_back(opts_.normalize ? normalized_value(record) : record.to_value());
        ++written_;
        break;
    }
}

void Reporter::finish() {
    if (opts_.format != Format::Json) {
        return;
    }
    rapidjson::Document doc = json_list_.to_rapidjson_document();
    writer_.write_json_line(doc);
}

}  // namespace jumplist::output
