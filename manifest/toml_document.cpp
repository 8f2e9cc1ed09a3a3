#include "manifest/toml_document.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <utility>

namespace LayerGuard {

// ========== TomlValue ==========

TomlValue TomlValue::makeString(std::string text) {
    TomlValue v;
    v.type_ = Type::String;
    v.text_ = std::move(text);
    return v;
}

TomlValue TomlValue::makeInteger(int64_t value) {
    TomlValue v;
    v.type_ = Type::Integer;
    v.integer_ = value;
    return v;
}

TomlValue TomlValue::makeFloat(double value) {
    TomlValue v;
    v.type_ = Type::Float;
    v.float_ = value;
    return v;
}

TomlValue TomlValue::makeBoolean(bool value) {
    TomlValue v;
    v.type_ = Type::Boolean;
    v.boolean_ = value;
    return v;
}

TomlValue TomlValue::makeDatetime(std::string raw) {
    TomlValue v;
    v.type_ = Type::Datetime;
    v.text_ = std::move(raw);
    return v;
}

TomlValue TomlValue::makeArray() {
    TomlValue v;
    v.type_ = Type::Array;
    return v;
}

TomlValue TomlValue::makeTable() {
    return TomlValue();
}

TomlValue& TomlValue::append(TomlValue value) {
    items_.push_back(std::move(value));
    return items_.back();
}

const TomlValue* TomlValue::find(std::string_view key) const noexcept {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &items_[i];
        }
    }
    return nullptr;
}

TomlValue* TomlValue::find(std::string_view key) noexcept {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &items_[i];
        }
    }
    return nullptr;
}

TomlValue& TomlValue::insert(std::string key, TomlValue value) {
    keys_.push_back(std::move(key));
    items_.push_back(std::move(value));
    return items_.back();
}

// ========== Parser ==========

namespace {

constexpr int MAX_NESTING = 128;

void appendUtf8(std::string* out, uint32_t cp) {
    if (cp < 0x80) {
        out->push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool isBareKeyChar(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

bool isValueDelimiter(char c) noexcept {
    return c == '\0' || c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
           c == ',' || c == ']' || c == '}' || c == '#';
}

class TomlParser {
public:
    explicit TomlParser(std::string_view text) noexcept : text_(text) {}

    bool parse(TomlValue* root);

    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] uint32_t errorLine() const noexcept { return error_line_; }

private:
    bool fail(std::string message) {
        if (error_.empty()) {
            error_ = std::move(message);
            error_line_ = line_;
        }
        return false;
    }

    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek(std::size_t offset = 0) const noexcept {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }

    void advance() noexcept {
        if (text_[pos_] == '\n') ++line_;
        ++pos_;
    }

    void skipWhitespace() noexcept {
        while (!atEnd() && (peek() == ' ' || peek() == '\t')) ++pos_;
    }

    void skipComment() noexcept {
        if (peek() != '#') return;
        while (!atEnd() && peek() != '\n') ++pos_;
    }

    bool consumeNewline() noexcept {
        if (peek() == '\r' && peek(1) == '\n') {
            ++pos_;
        }
        if (peek() == '\n') {
            advance();
            return true;
        }
        return false;
    }

    void skipWhitespaceAndNewlines() noexcept {
        for (;;) {
            skipWhitespace();
            skipComment();
            if (!consumeNewline()) break;
        }
    }

    bool expectLineEnd() {
        skipWhitespace();
        skipComment();
        if (atEnd() || consumeNewline()) return true;
        return fail("expected end of line after value");
    }

    bool parseKey(std::string* key);
    bool parseKeyPath(std::vector<std::string>* path);
    bool parseKeyValue(TomlValue* table);
    bool parseValue(TomlValue* out);
    bool parseBasicString(std::string* out);
    bool parseMultilineBasicString(std::string* out);
    bool parseLiteralString(std::string* out);
    bool parseMultilineLiteralString(std::string* out);
    bool parseEscape(std::string* out);
    bool parseArray(TomlValue* out);
    bool parseInlineTable(TomlValue* out);
    bool parseScalar(TomlValue* out);

    TomlValue* descend(TomlValue* table, const std::string& key, bool last_segment);
    TomlValue* openTable(TomlValue* root, const std::vector<std::string>& path);
    TomlValue* openArrayTable(TomlValue* root, const std::vector<std::string>& path);

    std::string_view text_;
    std::size_t pos_{0};
    uint32_t line_{1};
    int depth_{0};
    std::string error_;
    uint32_t error_line_{0};
};

bool TomlParser::parse(TomlValue* root) {
    // Optional UTF-8 byte order mark
    if (text_.substr(0, 3) == "\xEF\xBB\xBF") {
        pos_ = 3;
    }

    TomlValue* current = root;
    while (!atEnd()) {
        skipWhitespace();
        skipComment();
        if (atEnd()) break;
        if (consumeNewline()) continue;

        if (peek() == '[') {
            const bool array_table = peek(1) == '[';
            pos_ += array_table ? 2 : 1;

            std::vector<std::string> path;
            if (!parseKeyPath(&path)) return false;
            if (peek() != ']') return fail("expected ']' to close table header");
            ++pos_;
            if (array_table) {
                if (peek() != ']') return fail("expected ']]' to close array of tables header");
                ++pos_;
            }

            current = array_table ? openArrayTable(root, path) : openTable(root, path);
            if (!current) return false;
            if (!expectLineEnd()) return false;
            continue;
        }

        if (!parseKeyValue(current)) return false;
        if (!expectLineEnd()) return false;
    }
    return true;
}

bool TomlParser::parseKey(std::string* key) {
    key->clear();
    const char c = peek();
    if (c == '"') {
        if (peek(1) == '"' && peek(2) == '"') return fail("multi-line string cannot be a key");
        ++pos_;
        return parseBasicString(key);
    }
    if (c == '\'') {
        if (peek(1) == '\'' && peek(2) == '\'') return fail("multi-line string cannot be a key");
        ++pos_;
        return parseLiteralString(key);
    }

    const std::size_t start = pos_;
    while (!atEnd() && isBareKeyChar(peek())) ++pos_;
    if (pos_ == start) {
        return fail("invalid key");
    }
    key->assign(text_.substr(start, pos_ - start));
    return true;
}

bool TomlParser::parseKeyPath(std::vector<std::string>* path) {
    path->clear();
    skipWhitespace();
    for (;;) {
        std::string segment;
        if (!parseKey(&segment)) return false;
        path->push_back(std::move(segment));
        skipWhitespace();
        if (peek() != '.') break;
        ++pos_;
        skipWhitespace();
    }
    return true;
}

bool TomlParser::parseKeyValue(TomlValue* table) {
    std::vector<std::string> path;
    if (!parseKeyPath(&path)) return false;
    if (peek() != '=') return fail("expected '=' after key '" + path.back() + "'");
    ++pos_;
    skipWhitespace();

    TomlValue value;
    if (!parseValue(&value)) return false;

    TomlValue* target = table;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        TomlValue* child = target->find(path[i]);
        if (!child) {
            TomlValue implicit = TomlValue::makeTable();
            implicit.setImplicit(true);
            child = &target->insert(path[i], std::move(implicit));
        } else if (!child->isTable() || child->isSealed()) {
            return fail("cannot add keys to '" + path[i] + "'");
        }
        target = child;
    }

    if (target->find(path.back())) {
        return fail("duplicate key '" + path.back() + "'");
    }
    target->insert(path.back(), std::move(value));
    return true;
}

bool TomlParser::parseValue(TomlValue* out) {
    if (depth_ >= MAX_NESTING) {
        return fail("values nested too deeply");
    }

    const char c = peek();
    if (c == '"') {
        std::string text;
        if (peek(1) == '"' && peek(2) == '"') {
            pos_ += 3;
            if (!parseMultilineBasicString(&text)) return false;
        } else {
            ++pos_;
            if (!parseBasicString(&text)) return false;
        }
        *out = TomlValue::makeString(std::move(text));
        return true;
    }
    if (c == '\'') {
        std::string text;
        if (peek(1) == '\'' && peek(2) == '\'') {
            pos_ += 3;
            if (!parseMultilineLiteralString(&text)) return false;
        } else {
            ++pos_;
            if (!parseLiteralString(&text)) return false;
        }
        *out = TomlValue::makeString(std::move(text));
        return true;
    }
    if (c == '[') {
        ++depth_;
        const bool ok = parseArray(out);
        --depth_;
        return ok;
    }
    if (c == '{') {
        ++depth_;
        const bool ok = parseInlineTable(out);
        --depth_;
        return ok;
    }
    return parseScalar(out);
}

bool TomlParser::parseEscape(std::string* out) {
    // pos_ is on the character after the backslash
    const char c = peek();
    if (atEnd()) return fail("unterminated escape sequence");
    ++pos_;
    switch (c) {
        case 'b':  out->push_back('\b'); return true;
        case 't':  out->push_back('\t'); return true;
        case 'n':  out->push_back('\n'); return true;
        case 'f':  out->push_back('\f'); return true;
        case 'r':  out->push_back('\r'); return true;
        case '"':  out->push_back('"');  return true;
        case '\\': out->push_back('\\'); return true;
        case 'u':
        case 'U': {
            const std::size_t digits = c == 'u' ? 4 : 8;
            uint32_t cp = 0;
            for (std::size_t i = 0; i < digits; ++i) {
                const char h = peek();
                uint32_t nibble = 0;
                if (h >= '0' && h <= '9') nibble = static_cast<uint32_t>(h - '0');
                else if (h >= 'a' && h <= 'f') nibble = static_cast<uint32_t>(h - 'a' + 10);
                else if (h >= 'A' && h <= 'F') nibble = static_cast<uint32_t>(h - 'A' + 10);
                else return fail("invalid unicode escape");
                cp = (cp << 4) | nibble;
                ++pos_;
            }
            if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return fail("unicode escape is not a scalar value");
            }
            appendUtf8(out, cp);
            return true;
        }
        default:
            return fail(std::string("invalid escape sequence '\\") + c + "'");
    }
}

bool TomlParser::parseBasicString(std::string* out) {
    for (;;) {
        if (atEnd() || peek() == '\n') return fail("unterminated string");
        const char c = peek();
        if (c == '"') {
            ++pos_;
            return true;
        }
        if (c == '\\') {
            ++pos_;
            if (!parseEscape(out)) return false;
            continue;
        }
        out->push_back(c);
        ++pos_;
    }
}

bool TomlParser::parseMultilineBasicString(std::string* out) {
    // A newline right after the opening delimiter is trimmed
    consumeNewline();

    for (;;) {
        if (atEnd()) return fail("unterminated multi-line string");
        const char c = peek();

        if (c == '"' && peek(1) == '"' && peek(2) == '"') {
            std::size_t quotes = 3;
            while (quotes < 5 && peek(quotes) == '"') ++quotes;
            out->append(quotes - 3, '"');
            pos_ += quotes;
            return true;
        }

        if (c == '\\') {
            // Line-ending backslash swallows the newline and following whitespace
            std::size_t look = 1;
            while (peek(look) == ' ' || peek(look) == '\t') ++look;
            if (peek(look) == '\n' || (peek(look) == '\r' && peek(look + 1) == '\n')) {
                pos_ += look;
                while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
                    advance();
                }
                continue;
            }
            ++pos_;
            if (!parseEscape(out)) return false;
            continue;
        }

        out->push_back(c);
        advance();
    }
}

bool TomlParser::parseLiteralString(std::string* out) {
    for (;;) {
        if (atEnd() || peek() == '\n') return fail("unterminated literal string");
        const char c = peek();
        ++pos_;
        if (c == '\'') return true;
        out->push_back(c);
    }
}

bool TomlParser::parseMultilineLiteralString(std::string* out) {
    consumeNewline();

    for (;;) {
        if (atEnd()) return fail("unterminated multi-line literal string");
        const char c = peek();
        if (c == '\'' && peek(1) == '\'' && peek(2) == '\'') {
            std::size_t quotes = 3;
            while (quotes < 5 && peek(quotes) == '\'') ++quotes;
            out->append(quotes - 3, '\'');
            pos_ += quotes;
            return true;
        }
        out->push_back(c);
        advance();
    }
}

bool TomlParser::parseArray(TomlValue* out) {
    ++pos_;  // '['
    TomlValue array = TomlValue::makeArray();

    for (;;) {
        skipWhitespaceAndNewlines();
        if (atEnd()) return fail("unterminated array");
        if (peek() == ']') {
            ++pos_;
            break;
        }

        TomlValue item;
        if (!parseValue(&item)) return false;
        array.append(std::move(item));

        skipWhitespaceAndNewlines();
        if (peek() == ',') {
            ++pos_;
            continue;
        }
        if (peek() == ']') {
            ++pos_;
            break;
        }
        return fail("expected ',' or ']' in array");
    }

    array.seal();
    *out = std::move(array);
    return true;
}

bool TomlParser::parseInlineTable(TomlValue* out) {
    ++pos_;  // '{'
    TomlValue table = TomlValue::makeTable();

    skipWhitespaceAndNewlines();
    if (peek() == '}') {
        ++pos_;
        table.seal();
        *out = std::move(table);
        return true;
    }

    for (;;) {
        if (!parseKeyValue(&table)) return false;
        skipWhitespaceAndNewlines();
        if (peek() == ',') {
            ++pos_;
            skipWhitespaceAndNewlines();
            continue;
        }
        if (peek() == '}') {
            ++pos_;
            break;
        }
        return fail("expected ',' or '}' in inline table");
    }

    table.seal();
    *out = std::move(table);
    return true;
}

bool TomlParser::parseScalar(TomlValue* out) {
    const std::size_t start = pos_;
    while (!isValueDelimiter(peek())) ++pos_;

    // Date and time separated by a space: 1979-05-27 07:32:00
    if (pos_ - start == 10 && text_[start + 4] == '-' && peek() == ' ' &&
        isDigit(peek(1)) && isDigit(peek(2)) && peek(3) == ':') {
        ++pos_;
        while (!isValueDelimiter(peek())) ++pos_;
    }

    const std::string token(text_.substr(start, pos_ - start));
    if (token.empty()) {
        return fail("expected a value");
    }

    if (token == "true") {
        *out = TomlValue::makeBoolean(true);
        return true;
    }
    if (token == "false") {
        *out = TomlValue::makeBoolean(false);
        return true;
    }

    if (token == "inf" || token == "+inf") {
        *out = TomlValue::makeFloat(std::numeric_limits<double>::infinity());
        return true;
    }
    if (token == "-inf") {
        *out = TomlValue::makeFloat(-std::numeric_limits<double>::infinity());
        return true;
    }
    if (token == "nan" || token == "+nan" || token == "-nan") {
        *out = TomlValue::makeFloat(std::numeric_limits<double>::quiet_NaN());
        return true;
    }

    if (token.size() >= 10 && isDigit(token[0]) && token[4] == '-' && token[7] == '-') {
        *out = TomlValue::makeDatetime(token);
        return true;
    }
    if (token.size() >= 5 && isDigit(token[0]) && token[2] == ':') {
        *out = TomlValue::makeDatetime(token);
        return true;
    }

    std::string digits;
    digits.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        const char c = token[i];
        if (c == '_') {
            const bool between_digits = i > 0 && i + 1 < token.size() &&
                                        isBareKeyChar(token[i - 1]) && isBareKeyChar(token[i + 1]);
            if (!between_digits) return fail("invalid number '" + token + "'");
            continue;
        }
        digits.push_back(c);
    }

    int base = 10;
    std::size_t offset = 0;
    if (digits.size() > 2 && digits[0] == '0') {
        if (digits[1] == 'x') base = 16;
        else if (digits[1] == 'o') base = 8;
        else if (digits[1] == 'b') base = 2;
        if (base != 10) offset = 2;
    }

    const char* begin = digits.c_str() + offset;
    char* end = nullptr;
    errno = 0;

    const bool looks_float = base == 10 &&
        digits.find_first_of(".eE") != std::string::npos;
    if (looks_float) {
        const double value = std::strtod(begin, &end);
        if (end == begin || *end != '\0' || errno == ERANGE) {
            return fail("invalid float '" + token + "'");
        }
        *out = TomlValue::makeFloat(value);
        return true;
    }

    if (base != 10 && (*begin == '+' || *begin == '-')) {
        return fail("invalid integer '" + token + "'");
    }
    const long long value = std::strtoll(begin, &end, base);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return fail("invalid value '" + token + "'");
    }
    *out = TomlValue::makeInteger(static_cast<int64_t>(value));
    return true;
}

TomlValue* TomlParser::descend(TomlValue* table, const std::string& key, bool last_segment) {
    TomlValue* child = table->find(key);
    if (!child) {
        TomlValue created = TomlValue::makeTable();
        created.setImplicit(!last_segment);
        return &table->insert(key, std::move(created));
    }

    // [[array]] entries: later headers extend the most recent element
    if (child->isArray() && !child->isSealed()) {
        if (last_segment) {
            fail("table '" + key + "' conflicts with an array of tables");
            return nullptr;
        }
        return child->lastItem();
    }

    if (!child->isTable() || child->isSealed()) {
        fail("key '" + key + "' is not a table");
        return nullptr;
    }

    if (last_segment) {
        if (!child->isImplicit()) {
            fail("table '" + key + "' defined more than once");
            return nullptr;
        }
        child->setImplicit(false);
    }
    return child;
}

TomlValue* TomlParser::openTable(TomlValue* root, const std::vector<std::string>& path) {
    TomlValue* target = root;
    for (std::size_t i = 0; i < path.size() && target; ++i) {
        target = descend(target, path[i], i + 1 == path.size());
    }
    return target;
}

TomlValue* TomlParser::openArrayTable(TomlValue* root, const std::vector<std::string>& path) {
    TomlValue* target = root;
    for (std::size_t i = 0; i + 1 < path.size() && target; ++i) {
        target = descend(target, path[i], false);
    }
    if (!target) return nullptr;

    const std::string& key = path.back();
    TomlValue* array = target->find(key);
    if (!array) {
        array = &target->insert(key, TomlValue::makeArray());
    } else if (!array->isArray() || array->isSealed()) {
        fail("key '" + key + "' is not an array of tables");
        return nullptr;
    }
    return &array->append(TomlValue::makeTable());
}

} // namespace

TomlParseResult parseToml(std::string_view text) noexcept {
    TomlParseResult result;
    TomlParser parser(text);
    result.ok = parser.parse(&result.root);
    if (!result.ok) {
        result.error = parser.error();
        result.error_line = parser.errorLine();
        result.root = TomlValue();
    }
    return result;
}

} // namespace LayerGuard
