#include "json_util.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace camingest {

namespace {

size_t skip_ws(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    return pos;
}

// Position of the first character of the value for `key`, or npos.
size_t find_value(const std::string& body, const std::string& key) {
    const std::string needle = "\"" + key + "\"";
    size_t pos = 0;
    while ((pos = body.find(needle, pos)) != std::string::npos) {
        size_t p = skip_ws(body, pos + needle.size());
        if (p < body.size() && body[p] == ':') {
            return skip_ws(body, p + 1);
        }
        pos += needle.size();
    }
    return std::string::npos;
}

// Value of four hex digits at `pos`, or -1.
long hex4(const std::string& s, size_t pos) {
    if (pos + 4 > s.size()) return -1;
    long v = 0;
    for (size_t k = pos; k < pos + 4; ++k) {
        const char c = s[k];
        v <<= 4;
        if (c >= '0' && c <= '9') v |= c - '0';
        else if (c >= 'a' && c <= 'f') v |= c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') v |= c - 'A' + 10;
        else return -1;
    }
    return v;
}

void append_utf8(std::string& out, long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // namespace

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string json_quote(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

std::optional<std::string> json_string_field(const std::string& body, const std::string& key) {
    size_t p = find_value(body, key);
    if (p == std::string::npos || p >= body.size()) return std::nullopt;
    if (body[p] != '"') {
        // Accept bare numbers for string fields ("onvif_port": 80 style callers)
        if (body.compare(p, 4, "null") == 0) return std::nullopt;
        size_t end = p;
        while (end < body.size() && body[end] != ',' && body[end] != '}' &&
               !std::isspace(static_cast<unsigned char>(body[end]))) {
            ++end;
        }
        if (end == p) return std::nullopt;
        return body.substr(p, end - p);
    }

    std::string out;
    for (size_t i = p + 1; i < body.size(); ++i) {
        char c = body[i];
        if (c == '"') return out;
        if (c == '\\' && i + 1 < body.size()) {
            char e = body[++i];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    long cp = hex4(body, i + 1);
                    if (cp < 0) return std::nullopt;
                    i += 4;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // high surrogate, must be followed by \uDC00-\uDFFF
                        long lo = (i + 2 < body.size() && body[i + 1] == '\\' && body[i + 2] == 'u')
                                      ? hex4(body, i + 3)
                                      : -1;
                        if (lo < 0xDC00 || lo > 0xDFFF) return std::nullopt;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        i += 6;
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        return std::nullopt;
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: out.push_back(e); break;
            }
            continue;
        }
        out.push_back(c);
    }
    return std::nullopt;  // unterminated string
}

std::optional<double> json_number_field(const std::string& body, const std::string& key) {
    auto raw = json_string_field(body, key);
    if (!raw || raw->empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(raw->c_str(), &end);
    if (end == raw->c_str() || *end != '\0') return std::nullopt;
    return v;
}

}  // namespace camingest
