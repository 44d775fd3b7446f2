#pragma once

#include <optional>
#include <string>

namespace camingest {

// Escapes `s` for use inside a JSON string literal (quotes not included).
std::string json_escape(const std::string& s);

// "\"" + json_escape(s) + "\""
std::string json_quote(const std::string& s);

// Minimal field lookup for flat request bodies such as
// {"id":"cam_1","source_type":"rtsp","onvif_port":80}. Nested objects are not
// supported. Returns nullopt when the key is absent or holds null.
std::optional<std::string> json_string_field(const std::string& body, const std::string& key);
std::optional<double> json_number_field(const std::string& body, const std::string& key);

}  // namespace camingest
