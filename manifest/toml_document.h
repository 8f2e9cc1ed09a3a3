#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace LayerGuard {

/**
 * TomlValue
 *
 * One node of a parsed TOML document. Tables keep their keys in
 * declaration order, which the manifest detector relies on.
 * Date/time literals are kept as raw text.
 */
class TomlValue {
public:
    enum class Type : uint8_t {
        String = 0,
        Integer = 1,
        Float = 2,
        Boolean = 3,
        Datetime = 4,
        Array = 5,
        Table = 6
    };

    TomlValue() noexcept : type_(Type::Table) {}

    [[nodiscard]] static TomlValue makeString(std::string text);
    [[nodiscard]] static TomlValue makeInteger(int64_t value);
    [[nodiscard]] static TomlValue makeFloat(double value);
    [[nodiscard]] static TomlValue makeBoolean(bool value);
    [[nodiscard]] static TomlValue makeDatetime(std::string raw);
    [[nodiscard]] static TomlValue makeArray();
    [[nodiscard]] static TomlValue makeTable();

    [[nodiscard]] Type type() const noexcept { return type_; }
    [[nodiscard]] bool isString() const noexcept { return type_ == Type::String; }
    [[nodiscard]] bool isBoolean() const noexcept { return type_ == Type::Boolean; }
    [[nodiscard]] bool isArray() const noexcept { return type_ == Type::Array; }
    [[nodiscard]] bool isTable() const noexcept { return type_ == Type::Table; }

    [[nodiscard]] const std::string& asString() const noexcept { return text_; }
    [[nodiscard]] int64_t asInteger() const noexcept { return integer_; }
    [[nodiscard]] double asFloat() const noexcept { return float_; }
    [[nodiscard]] bool asBoolean() const noexcept { return boolean_; }

    // Arrays
    [[nodiscard]] const std::vector<TomlValue>& items() const noexcept { return items_; }
    TomlValue& append(TomlValue value);
    [[nodiscard]] TomlValue* lastItem() noexcept { return items_.empty() ? nullptr : &items_.back(); }

    // Tables
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] const TomlValue* find(std::string_view key) const noexcept;
    [[nodiscard]] TomlValue* find(std::string_view key) noexcept;
    TomlValue& insert(std::string key, TomlValue value);

    /// True for tables opened implicitly by a dotted key or header path
    [[nodiscard]] bool isImplicit() const noexcept { return implicit_; }
    void setImplicit(bool implicit) noexcept { implicit_ = implicit; }

    /// Inline tables and arrays are sealed once their literal closes
    [[nodiscard]] bool isSealed() const noexcept { return sealed_; }
    void seal() noexcept { sealed_ = true; }

private:
    Type type_;
    std::string text_;
    int64_t integer_{0};
    double float_{0.0};
    bool boolean_{false};
    bool implicit_{false};
    bool sealed_{false};
    std::vector<std::string> keys_;      // table keys, parallel to items_
    std::vector<TomlValue> items_;       // array elements or table values
};

struct TomlParseResult {
    bool ok{false};
    TomlValue root;
    std::string error;
    uint32_t error_line{0};
};

/// Parse a TOML document. Never throws; the first syntax error stops the
/// parse and is reported with its 1-based line.
[[nodiscard]] TomlParseResult parseToml(std::string_view text) noexcept;

} // namespace LayerGuard
