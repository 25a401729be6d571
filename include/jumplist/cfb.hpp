// ==============================================================================
// jumplist/cfb.hpp - Чтение Compound File Binary (OLE Structured Storage)
// ==============================================================================
//
// Назначение:
// - Разбор заголовка CFB (версии 3 и 4), DIFAT, FAT, MiniFAT
// - Обход дерева каталогов, перечисление потоков
// - Чтение потока целиком (обычные сектора или mini stream)
//
// Контейнер только читается; повреждённые цепочки секторов не чинятся.
//
// ==============================================================================

#ifndef JUMPLIST_CFB_HPP
#define JUMPLIST_CFB_HPP

#include <jumplist/error.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jumplist::io::cfb {

/// Поток внутри контейнера
struct StreamEntry {
    /// Имя записи каталога
    std::string name;

    /// Путь от корня, разделитель '/': "DestList", "Storage/Stream"
    std::string path;

    /// Размер потока в байтах
    std::uint64_t size = 0;
};

using StreamBytes = std::variant<std::vector<std::uint8_t>, JumplistError>;

// ----------------------------------------------------------------------------
// CompoundContainer - интерфейс, от которого зависит декодер DestList
// ----------------------------------------------------------------------------

class CompoundContainer {
public:
    virtual ~CompoundContainer() = default;

    /// Потоки в порядке обхода дерева каталогов
    virtual std::vector<StreamEntry> list_streams() const = 0;

    /// Прочитать поток целиком по пути из list_streams()
    virtual StreamBytes open_stream(const std::string& path) const = 0;
};

// ----------------------------------------------------------------------------
// CompoundFile - реализация поверх образа в памяти
// ----------------------------------------------------------------------------

class CompoundFile : public CompoundContainer {
public:
    CompoundFile();
    ~CompoundFile() override;

    CompoundFile(const CompoundFile&) = delete;
    CompoundFile& operator=(const CompoundFile&) = delete;

    CompoundFile(CompoundFile&&) noexcept;
    CompoundFile& operator=(CompoundFile&&) noexcept;

    /// Загрузить контейнер из байтов
    /// @return true если заголовок, FAT и каталог разобраны
    bool load(std::vector<std::uint8_t> bytes);

    /// Последняя ошибка load()
    const std::optional<JumplistError>& last_error() const { return error_; }

    bool loaded() const { return loaded_; }

    /// Major version заголовка (3 или 4)
    std::uint16_t major_version() const;

    std::vector<StreamEntry> list_streams() const override;
    StreamBytes open_stream(const std::string& path) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::optional<JumplistError> error_;
    bool loaded_ = false;
};

}  // namespace jumplist::io::cfb

#endif  // JUMPLIST_CFB_HPP
