// ==============================================================================
// crawlsink/fields.hpp - MOD-0004: Валидация и сохранение полей
// ==============================================================================
//
// MOD-0004 fields
//
// Назначение:
// - Разбор списка имён полей ("URL,Tag")
// - Проверка имён по схеме Result
// - FieldStore: дозапись значений полей в отдельные файлы <dir>/<Name>.txt
//
// ==============================================================================

#ifndef CRAWLSINK_FIELDS_HPP
#define CRAWLSINK_FIELDS_HPP

#include <crawlsink/error.hpp>
#include <crawlsink/result.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace crawlsink::fields {

/// Директория FieldStore по умолчанию
constexpr const char* DEFAULT_STORE_DIR = "crawlsink_fields";

/// Разбить список по ',' с удалением пробелов; пустые элементы отбрасываются
std::vector<std::string> split_field_names(std::string_view list);

/// Проверить, что каждое имя списка есть в схеме Result
///
/// @return ErrorKind::InvalidField с первым неизвестным именем в subject
Status validate_field_names(std::string_view list);

/// Преобразовать проверенный список в поля; неизвестные имена пропускаются
std::vector<Field> parse_fields(std::string_view list);

// ----------------------------------------------------------------------------
// FieldStore
// ----------------------------------------------------------------------------

/// Побочный канал: значения выбранных полей каждого Result дописываются
/// построчно в файл поля. Директория создаётся при первой записи.
///
/// Потокобезопасен: у каждого поля свой mutex, записи одного поля
/// сериализуются, разных полей идут параллельно.
class FieldStore {
public:
    FieldStore(std::filesystem::path directory, std::vector<Field> fields);

    FieldStore(const FieldStore&) = delete;
    FieldStore& operator=(const FieldStore&) = delete;

    /// Дописать значения полей result; останавливается на первой ошибке
    Status store(const Result& result);

    /// Путь файла поля
    std::filesystem::path path_for(Field field) const;

    const std::filesystem::path& directory() const { return directory_; }
    const std::vector<Field>& fields() const { return fields_; }

private:
    Status ensure_directory();

    std::filesystem::path directory_;
    std::vector<Field> fields_;

    std::mutex dir_mutex_;
    bool dir_ready_ = false;

    // Заполняется в конструкторе, дальше только чтение
    std::map<Field, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace crawlsink::fields

#endif  // CRAWLSINK_FIELDS_HPP
