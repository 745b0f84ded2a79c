#include "../include/guardian/json.hpp"

#include <charconv>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <type_traits>

namespace guardian {

namespace {

constexpr int kMaxDepth = 64;

void write_escaped(std::ostringstream& oss, const std::string& value) {
    oss << '"';
    for (char c : value) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec
                    << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

void write_number(std::ostringstream& oss, double value) {
    if (!std::isfinite(value)) {
        oss << "null";
        return;
    }
    char buffer[64];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    oss.write(buffer, result.ptr - buffer);
}

void append_utf8(std::string& out, unsigned code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

unsigned read_hex4(std::string_view text, std::size_t& pos) {
    if (pos + 4 > text.size()) {
        throw std::runtime_error("invalid unicode escape");
    }
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
        const char h = text[pos++];
        code <<= 4;
        if (h >= '0' && h <= '9') {
            code |= static_cast<unsigned>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            code |= static_cast<unsigned>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            code |= static_cast<unsigned>(h - 'A' + 10);
        } else {
            throw std::runtime_error("invalid unicode escape");
        }
    }
    return code;
}

} // namespace

const Json* Json::find(const std::string& key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    const auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

std::optional<std::string> Json::get_string(const std::string& key) const {
    if (const Json* member = find(key); member && member->is_string()) {
        return member->as_string();
    }
    return std::nullopt;
}

std::optional<double> Json::get_number(const std::string& key) const {
    if (const Json* member = find(key); member && member->is_number()) {
        return member->as_number();
    }
    return std::nullopt;
}

std::optional<bool> Json::get_bool(const std::string& key) const {
    if (const Json* member = find(key); member && member->is_bool()) {
        return member->as_bool();
    }
    return std::nullopt;
}

void Json::dump_internal(std::ostringstream& oss) const {
    std::visit([&oss](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (value ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            write_number(oss, value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_escaped(oss, value);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
            oss << '[';
            bool first = true;
            for (const auto& item : value) {
                if (!first) {
                    oss << ',';
                }
                first = false;
                item.dump_internal(oss);
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JsonObject>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : value) {
                if (!first) {
                    oss << ',';
                }
                first = false;
                write_escaped(oss, key);
                oss << ':';
                val.dump_internal(oss);
            }
            oss << '}';
        }
    }, m_value);
}

void Json::skip_ws(std::string_view text, std::size_t& pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
}

Json Json::parse(std::string_view text) {
    std::size_t pos = 0;
    skip_ws(text, pos);
    Json value = parse_value(text, pos, 0);
    skip_ws(text, pos);
    if (pos != text.size()) {
        throw std::runtime_error("unexpected trailing characters in JSON");
    }
    return value;
}

Json Json::parse_value(std::string_view text, std::size_t& pos, int depth) {
    if (depth > kMaxDepth) {
        throw std::runtime_error("JSON nesting too deep");
    }
    skip_ws(text, pos);
    if (pos >= text.size()) {
        throw std::runtime_error("unexpected end of JSON");
    }
    const char c = text[pos];
    if (c == '"') {
        return parse_string(text, pos);
    }
    if (c == '[') {
        return parse_array(text, pos, depth + 1);
    }
    if (c == '{') {
        return parse_object(text, pos, depth + 1);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
        return parse_number(text, pos);
    }
    if (text.substr(pos, 4) == "true") {
        pos += 4;
        return Json(true);
    }
    if (text.substr(pos, 5) == "false") {
        pos += 5;
        return Json(false);
    }
    if (text.substr(pos, 4) == "null") {
        pos += 4;
        return Json(nullptr);
    }
    throw std::runtime_error("invalid JSON token");
}

Json Json::parse_number(std::string_view text, std::size_t& pos) {
    const std::size_t start = pos;
    ++pos;
    while (pos < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.' || text[pos] == 'e' ||
            text[pos] == 'E' || text[pos] == '+' || text[pos] == '-')) {
        ++pos;
    }
    double number = 0.0;
    const char* first = text.data() + start;
    const char* last = text.data() + pos;
    const auto result = std::from_chars(first, last, number);
    if (result.ec != std::errc() || result.ptr != last) {
        throw std::runtime_error("invalid JSON number");
    }
    return Json(number);
}

Json Json::parse_string(std::string_view text, std::size_t& pos) {
    if (pos >= text.size() || text[pos] != '"') {
        throw std::runtime_error("expected string");
    }
    ++pos;
    std::string result;
    while (true) {
        if (pos >= text.size()) {
            throw std::runtime_error("unterminated string");
        }
        const char c = text[pos++];
        if (c == '"') {
            break;
        }
        if (c != '\\') {
            result.push_back(c);
            continue;
        }
        if (pos >= text.size()) {
            throw std::runtime_error("invalid escape");
        }
        const char esc = text[pos++];
        switch (esc) {
        case '"': result.push_back('"'); break;
        case '\\': result.push_back('\\'); break;
        case '/': result.push_back('/'); break;
        case 'b': result.push_back('\b'); break;
        case 'f': result.push_back('\f'); break;
        case 'n': result.push_back('\n'); break;
        case 'r': result.push_back('\r'); break;
        case 't': result.push_back('\t'); break;
        case 'u': {
            unsigned code = read_hex4(text, pos);
            if (code >= 0xD800 && code <= 0xDBFF) {
                if (pos + 2 > text.size() || text[pos] != '\\' || text[pos + 1] != 'u') {
                    throw std::runtime_error("unpaired surrogate");
                }
                pos += 2;
                const unsigned low = read_hex4(text, pos);
                if (low < 0xDC00 || low > 0xDFFF) {
                    throw std::runtime_error("unpaired surrogate");
                }
                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(result, code);
            break;
        }
        default:
            throw std::runtime_error("invalid escape");
        }
    }
    return Json(std::move(result));
}

Json Json::parse_array(std::string_view text, std::size_t& pos, int depth) {
    ++pos;
    JsonArray arr;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ']') {
        ++pos;
        return Json(std::move(arr));
    }
    while (true) {
        arr.emplace_back(parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            break;
        }
        throw std::runtime_error("expected comma or closing bracket");
    }
    return Json(std::move(arr));
}

Json Json::parse_object(std::string_view text, std::size_t& pos, int depth) {
    ++pos;
    JsonObject obj;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        ++pos;
        return Json(std::move(obj));
    }
    while (true) {
        skip_ws(text, pos);
        Json key = parse_string(text, pos);
        skip_ws(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("expected colon");
        }
        ++pos;
        obj.insert_or_assign(key.as_string(), parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            ++pos;
            break;
        }
        throw std::runtime_error("expected comma or closing brace");
    }
    return Json(std::move(obj));
}

} // namespace guardian
