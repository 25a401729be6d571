// ==============================================================================
// jumplist/error.hpp - Таксономия ошибок декодирования
// ==============================================================================
//
// Назначение:
// - Единый тип ошибки для всех декодеров (поле + смещение как локатор)
// - Классификация: структура / неизвестный вариант / вложенный LNK /
//   пустой артефакт / неизвестный тип файла / ввод-вывод
//
// Политика распространения:
// - CustomDestinations: любая ошибка прерывает разбор файла
// - DestList: ошибка записи завершает цикл, накопленное возвращается
// - Корреляция потоков: ошибка деградирует до "нет LNK"
//
// ==============================================================================

#ifndef JUMPLIST_ERROR_HPP
#define JUMPLIST_ERROR_HPP

#include <cstdint>
#include <string>

namespace jumplist {

/// Типы ошибок декодирования
enum class JumplistErrorKind {
    Structure,             // Недостаточно байт / повреждённое поле
    UnknownVariant,        // Дискриминант или GUID вне закрытого множества
    EmbeddedDecode,        // Вложенная LNK запись отвергнута декодером
    EmptyArtifact,         // Контейнер валиден, но записей нет (предупреждение)
    UnrecognizedFileType,  // Суффикс имени файла не распознан
    Io                     // Ошибка чтения файла
};

/// Имя типа ошибки ("structure", "unknown_variant", ...)
const char* error_kind_to_string(JumplistErrorKind kind);

/// Ошибка декодирования
struct JumplistError {
    JumplistErrorKind kind = JumplistErrorKind::Structure;
    std::string message;

    /// Имя поля, на котором произошёл сбой (пусто, если неприменимо)
    std::string field;

    /// Смещение в байтах от начала декодируемого буфера
    std::uint64_t offset = 0;

    /// Форматировать ошибку: "<message> (field '<field>' at offset 0x<offset>)"
    std::string format() const;

    static JumplistError make(JumplistErrorKind kind, std::string message);
};

}  // namespace jumplist

#endif  // JUMPLIST_ERROR_HPP
