// ==============================================================================
// jumplist/value.hpp - Самоописывающая модель декодированной записи (Value)
// ==============================================================================
//
// Назначение:
// - Дерево значений, в которое сериализуются JumplistRecord, категории,
//   записи DestList и LNK
// - Конверсия в RapidJSON для вывода JSON / JSONL
// - Плоское представление записи (FlatRecord) для нормализации и CSV
//
// Ключи объекта упорядочены (std::map): вывод JSON детерминирован.
//
// ==============================================================================

#ifndef JUMPLIST_VALUE_HPP
#define JUMPLIST_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// RapidJSON forward declarations
#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace jumplist {

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (упорядоченный map string -> Value)
using ValueObject = std::map<std::string, Value>;

/// Плоская запись "ключ -> строка" (нормализованный вывод)
using FlatRecord = std::map<std::string, std::string>;

/// Значение декодированной записи
class Value {
public:
    // Внутренние типы для variant
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    // Variant хранит одно из значений
    std::variant<Null, Bool, Int64, UInt64, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    /// Создать Null значение
    Value() : data_(Null{}) {}

    /// Создать Bool значение
    explicit Value(bool v) : data_(v) {}

    /// Создать Int64 значение
    explicit Value(std::int64_t v) : data_(v) {}

    /// Создать UInt64 значение
    explicit Value(std::uint64_t v) : data_(v) {}

    /// Создать String значение
    explicit Value(std::string v) : data_(std::move(v)) {}

    /// Создать String значение из C-строки
    explicit Value(const char* v) : data_(std::string(v)) {}

    /// Создать UInt64 значение из u32
    explicit Value(std::uint32_t v) : data_(static_cast<UInt64>(v)) {}

    /// Создать Int64 значение из i32
    explicit Value(std::int32_t v) : data_(static_cast<Int64>(v)) {}

    /// Создать Array значение
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}

    /// Создать Object значение
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    /// Создать пустой Array
    static Value make_array() { return Value(Array{}); }

    /// Создать пустой Object
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// Получить bool значение (undefined behavior если не is_bool())
    Bool as_bool() const { return std::get<Bool>(data_); }

    /// Получить int64 значение (undefined behavior если не is_int())
    Int64 as_int() const { return std::get<Int64>(data_); }

    /// Получить uint64 значение (undefined behavior если не is_uint())
    UInt64 as_uint() const { return std::get<UInt64>(data_); }

    /// Получить string значение (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    /// Получить array (undefined behavior если не is_array())
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }

    /// Получить object (undefined behavior если не is_object())
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (возвращает nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    /// Доступ к элементу массива по индексу
    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Проверить наличие ключа в объекте
    bool has(const std::string& key) const {
        if (const auto* obj = get_object()) {
            return obj->find(key) != obj->end();
        }
        return false;
    }

    // -------------------------------------------------------------------------
    // Конверсия в RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать в RapidJSON Value (строки копируются в alloc)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

    /// Объект из плоской записи (все значения - строки)
    static Value from_flat(const FlatRecord& record);

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

}  // namespace jumplist

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // JUMPLIST_VALUE_HPP
