// ==============================================================================
// jumplist/report.hpp - Формирование отчёта CSV / JSON / JSONL
// ==============================================================================
//
// CSV: заголовок (если не --no-headers), затем по строке на каждую непустую
//      нормализованную запись. Все поля в кавычках, кавычки удваиваются.
// JSON: один массив в конце прогона (документы записей или массивы
//       нормализованных записей).
// JSONL: по строке на файл.
//
// ==============================================================================

#ifndef JUMPLIST_REPORT_HPP
#define JUMPLIST_REPORT_HPP

#include <jumplist/jumplist.hpp>
#include <jumplist/output.hpp>
#include <jumplist/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jumplist::output {

/// Колонки CSV в порядке вывода
const std::vector<std::string>& csv_columns();

/// Строка заголовка CSV (без перевода строки)
std::string csv_header();

/// Поле CSV: в кавычках, внутренние кавычки удвоены
std::string csv_quote(std::string_view field);

/// Строки CSV записи (без перевода строки); пустые нормализованные записи пропускаются
std::vector<std::string> csv_rows(const parse::JumplistRecord& record);

/// Массив нормализованных записей с app_id / app_name
Value normalized_value(const parse::JumplistRecord& record);

enum class Format {
    Csv,   // CSV с заголовком
    Json,  // JSON массив
    Jsonl  // JSON Lines (одна запись на строку)
};

struct ReportOptions {
    Format format = Format::Csv;
    bool normalize = false;
    bool no_headers = false;
};

/// Потоковый построитель отчёта поверх Writer
class Reporter {
public:
    Reporter(Writer& writer, const ReportOptions& opts);

    /// Заголовок CSV
    void begin();

    void add(const parse::JumplistRecord& record);

    /// Массив JSON (для Format::Json)
    void finish();

    /// Количество выведенных строк CSV / записей JSON
    std::size_t written() const { return written_; }

private:
    Writer& writer_;
    ReportOptions opts_;
    Value json_list_;
    std::size_t written_ = 0;
};

}  // namespace jumplist::output

#endif  // JUMPLIST_REPORT_HPP
