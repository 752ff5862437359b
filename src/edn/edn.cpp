#include "uberpack/edn.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>

namespace uberpack {

namespace {

constexpr size_t PPRINT_RIGHT_MARGIN = 72;
constexpr int MAX_NESTING_DEPTH = 512;

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == ',';
}

bool is_delimiter(char c) {
    return is_whitespace(c) || std::strchr("()[]{}\";", c) != nullptr;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ============================================================================
// Reader
// ============================================================================

class EdnReader {
public:
    explicit EdnReader(const std::string& input) : input_(input) {}

    // Returns false at end of input (after skipping whitespace and comments)
    bool at_end() {
        skip_ignorable();
        return pos_ >= input_.size();
    }

    bool read(EdnValue& out, std::string& error, int depth = 0) {
        if (depth > MAX_NESTING_DEPTH) {
            error = "nesting too deep";
            return false;
        }
        skip_ignorable();
        if (pos_ >= input_.size()) {
            error = "unexpected end of input";
            return false;
        }

        char c = input_[pos_];
        switch (c) {
            case '(':
                ++pos_;
                return read_sequence(EdnKind::List, ')', out, error, depth);
            case '[':
                ++pos_;
                return read_sequence(EdnKind::Vector, ']', out, error, depth);
            case '{':
                ++pos_;
                return read_sequence(EdnKind::Map, '}', out, error, depth);
            case ')':
            case ']':
            case '}':
                error = std::string("unmatched delimiter '") + c + "' at offset " + std::to_string(pos_);
                return false;
            case '"':
                ++pos_;
                return read_string(out, error);
            case '\\':
                ++pos_;
                return read_character(out, error);
            case '#':
                return read_dispatch(out, error, depth);
            default:
                break;
        }

        if (is_digit(c) ||
            ((c == '+' || c == '-') && pos_ + 1 < input_.size() && is_digit(input_[pos_ + 1]))) {
            return read_number(out, error);
        }
        return read_symbolic(out, error);
    }

    size_t position() const { return pos_; }

private:
    const std::string& input_;
    size_t pos_ = 0;

    void skip_ignorable() {
        while (pos_ < input_.size()) {
            char c = input_[pos_];
            if (is_whitespace(c)) {
                ++pos_;
            } else if (c == ';') {
                while (pos_ < input_.size() && input_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    std::string read_token() {
        size_t start = pos_;
        while (pos_ < input_.size() && !is_delimiter(input_[pos_])) ++pos_;
        return input_.substr(start, pos_ - start);
    }

    bool read_sequence(EdnKind kind, char close, EdnValue& out, std::string& error, int depth) {
        size_t open_pos = pos_ - 1;
        out = EdnValue{};
        out.kind = kind;

        while (true) {
            skip_ignorable();
            if (pos_ >= input_.size()) {
                error = "unterminated collection starting at offset " + std::to_string(open_pos);
                return false;
            }
            if (input_[pos_] == close) {
                ++pos_;
                break;
            }
            if (discard_next(error, depth)) {
                continue;
            }
            if (!error.empty()) {
                return false;
            }
            EdnValue item;
            if (!read(item, error, depth + 1)) {
                return false;
            }
            out.items.push_back(std::move(item));
        }

        if (kind == EdnKind::Map) {
            if (out.items.size() % 2 != 0) {
                error = "map literal must contain an even number of forms";
                return false;
            }
            for (size_t i = 0; i < out.items.size(); i += 2) {
                for (size_t j = i + 2; j < out.items.size(); j += 2) {
                    if (out.items[i] == out.items[j]) {
                        error = "duplicate key: " + print_edn(out.items[i]);
                        return false;
                    }
                }
            }
        } else if (kind == EdnKind::Set) {
            for (size_t i = 0; i < out.items.size(); ++i) {
                for (size_t j = i + 1; j < out.items.size(); ++j) {
                    if (out.items[i] == out.items[j]) {
                        error = "duplicate set element: " + print_edn(out.items[i]);
                        return false;
                    }
                }
            }
        }
        return true;
    }

    // Consumes a "#_ form" pair if one is next. Sets error on a bad form.
    bool discard_next(std::string& error, int depth) {
        if (pos_ + 1 < input_.size() && input_[pos_] == '#' && input_[pos_ + 1] == '_') {
            pos_ += 2;
            EdnValue ignored;
            if (!read(ignored, error, depth + 1)) {
                return false;
            }
            return true;
        }
        return false;
    }

    bool read_dispatch(EdnValue& out, std::string& error, int depth) {
        size_t start = pos_;
        ++pos_;
        if (pos_ >= input_.size()) {
            error = "unexpected end of input after '#'";
            return false;
        }

        char c = input_[pos_];
        if (c == '{') {
            ++pos_;
            if (!read_sequence(EdnKind::Set, '}', out, error, depth)) {
                return false;
            }
            return true;
        }
        if (c == '_') {
            pos_ = start;
            if (!discard_next(error, depth)) {
                return false;
            }
            return read(out, error, depth);
        }
        if (std::isalpha(static_cast<unsigned char>(c))) {
            std::string tag = read_token();
            EdnValue form;
            if (!read(form, error, depth + 1)) {
                return false;
            }
            out = EdnValue{};
            out.kind = EdnKind::Tagged;
            out.text = tag;
            out.items.push_back(std::move(form));
            return true;
        }

        error = std::string("unsupported dispatch '#") + c + "' at offset " + std::to_string(start);
        return false;
    }

    bool read_string(EdnValue& out, std::string& error) {
        size_t start = pos_ - 1;
        std::string content;
        while (pos_ < input_.size()) {
            char c = input_[pos_++];
            if (c == '"') {
                out = EdnValue{};
                out.kind = EdnKind::String;
                out.text = std::move(content);
                return true;
            }
            if (c != '\\') {
                content += c;
                continue;
            }
            if (pos_ >= input_.size()) {
                break;
            }
            char e = input_[pos_++];
            switch (e) {
                case 't': content += '\t'; break;
                case 'r': content += '\r'; break;
                case 'n': content += '\n'; break;
                case 'b': content += '\b'; break;
                case 'f': content += '\f'; break;
                case '\\': content += '\\'; break;
                case '"': content += '"'; break;
                case 'u': {
                    if (pos_ + 4 > input_.size()) {
                        error = "truncated unicode escape";
                        return false;
                    }
                    uint32_t cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = input_[pos_++];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
                        else {
                            error = "invalid unicode escape";
                            return false;
                        }
                    }
                    append_utf8(content, cp);
                    break;
                }
                default:
                    error = std::string("unsupported escape '\\") + e + "' in string";
                    return false;
            }
        }
        error = "unterminated string starting at offset " + std::to_string(start);
        return false;
    }

    bool read_character(EdnValue& out, std::string& error) {
        if (pos_ >= input_.size()) {
            error = "unexpected end of input after '\\'";
            return false;
        }
        // The first character is taken literally, even a delimiter
        std::string name(1, input_[pos_++]);
        while (pos_ < input_.size() && !is_delimiter(input_[pos_])) {
            name += input_[pos_++];
        }
        if (name.size() > 1) {
            static const char* named[] = {"newline", "return", "space", "tab", "formfeed", "backspace"};
            bool known = false;
            for (const char* n : named) {
                if (name == n) known = true;
            }
            if (!known && !(name[0] == 'u' && name.size() == 5)) {
                error = "unsupported character: \\" + name;
                return false;
            }
        }
        out = EdnValue{};
        out.kind = EdnKind::Character;
        out.text = name;
        return true;
    }

    bool read_number(EdnValue& out, std::string& error) {
        std::string token = read_token();
        std::string body = token;
        if (!body.empty() && body[0] == '+') {
            body.erase(0, 1);
        }

        bool is_float = body.find_first_of(".eEM") != std::string::npos;
        size_t i = (!body.empty() && body[0] == '-') ? 1 : 0;
        bool valid = i < body.size() && is_digit(body[i]);
        for (size_t j = i; valid && j < body.size(); ++j) {
            char c = body[j];
            bool last = j + 1 == body.size();
            if (is_digit(c)) continue;
            if (is_float && (c == '.' || c == 'e' || c == 'E' || c == '-' || c == '+')) continue;
            if (last && (c == 'N' || c == 'M')) continue;
            valid = false;
        }
        if (!valid) {
            error = "invalid number: " + token;
            return false;
        }

        out = EdnValue{};
        out.kind = is_float ? EdnKind::Float : EdnKind::Integer;
        out.text = body;
        return true;
    }

    bool read_symbolic(EdnValue& out, std::string& error) {
        size_t start = pos_;
        std::string token = read_token();
        if (token.empty()) {
            error = "unexpected character at offset " + std::to_string(start);
            return false;
        }

        out = EdnValue{};
        if (token == "nil") {
            out.kind = EdnKind::Nil;
            out.text = token;
        } else if (token == "true" || token == "false") {
            out.kind = EdnKind::Boolean;
            out.text = token;
        } else if (token[0] == ':') {
            if (token.size() == 1 || token[1] == ':') {
                error = "invalid keyword: " + token;
                return false;
            }
            out.kind = EdnKind::Keyword;
            out.text = token;
        } else {
            out.kind = EdnKind::Symbol;
            out.text = token;
        }
        return true;
    }
};

// ============================================================================
// Printer
// ============================================================================

void print_string_literal(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default: out += c; break;
        }
    }
    out += '"';
}

void print_into(const EdnValue& v, std::string& out);

void print_items(const std::vector<EdnValue>& items, const char* open, const char* close,
                 std::string& out) {
    out += open;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ' ';
        print_into(items[i], out);
    }
    out += close;
}

void print_into(const EdnValue& v, std::string& out) {
    switch (v.kind) {
        case EdnKind::Nil:
            out += "nil";
            break;
        case EdnKind::Boolean:
        case EdnKind::Integer:
        case EdnKind::Float:
        case EdnKind::Keyword:
        case EdnKind::Symbol:
            out += v.text;
            break;
        case EdnKind::String:
            print_string_literal(v.text, out);
            break;
        case EdnKind::Character:
            out += '\\';
            out += v.text;
            break;
        case EdnKind::List:
            print_items(v.items, "(", ")", out);
            break;
        case EdnKind::Vector:
            print_items(v.items, "[", "]", out);
            break;
        case EdnKind::Set:
            print_items(v.items, "#{", "}", out);
            break;
        case EdnKind::Map:
            out += '{';
            for (size_t i = 0; i + 1 < v.items.size(); i += 2) {
                if (i > 0) out += ", ";
                print_into(v.items[i], out);
                out += ' ';
                print_into(v.items[i + 1], out);
            }
            out += '}';
            break;
        case EdnKind::Tagged:
            out += '#';
            out += v.text;
            out += ' ';
            if (!v.items.empty()) {
                print_into(v.items[0], out);
            }
            break;
    }
}

} // namespace

// ============================================================================
// EdnValue
// ============================================================================

bool operator==(const EdnValue& a, const EdnValue& b) {
    return a.kind == b.kind && a.text == b.text && a.items == b.items;
}

bool operator!=(const EdnValue& a, const EdnValue& b) {
    return !(a == b);
}

const EdnValue* EdnValue::get(const EdnValue& key) const {
    if (kind != EdnKind::Map) {
        return nullptr;
    }
    for (size_t i = 0; i + 1 < items.size(); i += 2) {
        if (items[i] == key) {
            return &items[i + 1];
        }
    }
    return nullptr;
}

EdnValue edn_symbol(const std::string& name) {
    EdnValue v;
    v.kind = EdnKind::Symbol;
    v.text = name;
    return v;
}

EdnValue edn_map() {
    EdnValue v;
    v.kind = EdnKind::Map;
    return v;
}

void edn_assoc(EdnValue& map, EdnValue key, EdnValue value) {
    for (size_t i = 0; i + 1 < map.items.size(); i += 2) {
        if (map.items[i] == key) {
            map.items[i + 1] = std::move(value);
            return;
        }
    }
    map.items.push_back(std::move(key));
    map.items.push_back(std::move(value));
}

// ============================================================================
// Public API
// ============================================================================

EdnParseResult parse_edn(const std::string& input) {
    EdnParseResult result;
    EdnReader reader(input);

    if (!reader.read(result.value, result.error)) {
        return result;
    }
    if (!reader.at_end()) {
        result.error = "unexpected content after form at offset " + std::to_string(reader.position());
        return result;
    }

    result.ok = true;
    return result;
}

EdnParseResult parse_data_readers(const std::string& input) {
    EdnParseResult result;
    EdnReader reader(input);

    if (reader.at_end()) {
        result.ok = true;
        result.value = edn_map();
        return result;
    }

    result = parse_edn(input);
    if (!result.ok) {
        return result;
    }
    if (result.value.kind != EdnKind::Map) {
        result.ok = false;
        result.error = "reader descriptor must be a map, got " + print_edn(result.value);
        return result;
    }
    return result;
}

EdnValue merge_edn_maps(const EdnValue& base, const EdnValue& overlay) {
    EdnValue merged = base.kind == EdnKind::Map ? base : edn_map();
    if (overlay.kind != EdnKind::Map) {
        return merged;
    }
    for (size_t i = 0; i + 1 < overlay.items.size(); i += 2) {
        edn_assoc(merged, overlay.items[i], overlay.items[i + 1]);
    }
    return merged;
}

std::string print_edn(const EdnValue& value) {
    std::string out;
    print_into(value, out);
    return out;
}

std::string pprint_edn(const EdnValue& value) {
    std::string flat = print_edn(value);
    if (value.kind != EdnKind::Map || flat.size() <= PPRINT_RIGHT_MARGIN) {
        return flat + "\n";
    }

    std::string out = "{";
    for (size_t i = 0; i + 1 < value.items.size(); i += 2) {
        if (i > 0) out += ",\n ";
        print_into(value.items[i], out);
        out += ' ';
        print_into(value.items[i + 1], out);
    }
    out += "}\n";
    return out;
}

} // namespace uberpack
