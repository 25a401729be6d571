// ==============================================================================
// jumplist/normalize.hpp - Плоское представление декодированных записей
// ==============================================================================
//
// Каждая запись с LNK превращается в FlatRecord: поля ShellLink::normalize()
// плюс name_string и command_line_arguments (пустая строка при отсутствии).
//
// DestList: запись без LNK даёт пустой FlatRecord.
// CustomDestinations: Known категории и категории без записей пропускаются.
//
// ==============================================================================

#ifndef JUMPLIST_NORMALIZE_HPP
#define JUMPLIST_NORMALIZE_HPP

#include <jumplist/custom_destinations.hpp>
#include <jumplist/destlist.hpp>
#include <jumplist/jumplist.hpp>
#include <jumplist/lnk.hpp>
#include <jumplist/value.hpp>

#include <vector>

namespace jumplist::parse {

/// Поля LNK для одной записи
FlatRecord normalize_link(const io::lnk::ShellLink& link);

std::vector<FlatRecord> normalize(const DestList& destlist);

std::vector<FlatRecord> normalize(const CustomDestinations& custom);

/// Нормализация по типу данных записи
std::vector<FlatRecord> normalize(const JumplistRecord& record);

/// normalize(record) + "jumplist_file_path" в каждой записи
std::vector<FlatRecord> flatten(const JumplistRecord& record);

}  // namespace jumplist::parse

#endif  // JUMPLIST_NORMALIZE_HPP
