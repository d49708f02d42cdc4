// Repository: Seamline
// Component: Recording Manifest Implementation
// Purpose: Parse the upstream JSON record.
// Copyright (c) 2025 Seamline Authors

#include "seamline/manifest/RecordingManifest.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "seamline/util/Errors.hpp"

namespace seamline::manifest {

namespace {
  // Minimal JSON reader for the manifest schema.
  // Values are handled as raw text slices; only the members the loader needs
  // are decoded. Malformed input yields empty optionals, never exceptions.

  using Members = std::vector<std::pair<std::string, std::string>>;

  size_t SkipWhitespace(const std::string& json, size_t pos) {
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
      ++pos;
    }
    return pos;
  }

  // Returns the position one past the end of the string literal starting at
  // pos (json[pos] == '"'), or npos if unterminated.
  size_t ScanString(const std::string& json, size_t pos) {
    ++pos;
    while (pos < json.size()) {
      if (json[pos] == '\\') {
        pos += 2;
        continue;
      }
      if (json[pos] == '"') {
        return pos + 1;
      }
      ++pos;
    }
    return std::string::npos;
  }

  // Returns the position one past the end of the value starting at pos, or
  // npos if the value is malformed. Objects and arrays are matched by depth,
  // skipping brackets inside strings.
  size_t ScanValue(const std::string& json, size_t pos) {
    if (pos >= json.size()) return std::string::npos;

    const char c = json[pos];
    if (c == '"') {
      return ScanString(json, pos);
    }
    if (c == '{' || c == '[') {
      int depth = 0;
      while (pos < json.size()) {
        const char ch = json[pos];
        if (ch == '"') {
          pos = ScanString(json, pos);
          if (pos == std::string::npos) return pos;
          continue;
        }
        if (ch == '{' || ch == '[') {
          ++depth;
        } else if (ch == '}' || ch == ']') {
          --depth;
          if (depth == 0) return pos + 1;
        }
        ++pos;
      }
      return std::string::npos;
    }

    // Number or literal: run until a structural character.
    size_t end = pos;
    while (end < json.size() && json[end] != ',' && json[end] != '}' &&
           json[end] != ']' && !std::isspace(static_cast<unsigned char>(json[end]))) {
      ++end;
    }
    return end == pos ? std::string::npos : end;
  }

  void AppendUtf8(std::string& out, unsigned int cp) {
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

  // Decode a raw string literal (with quotes). Surrogate pairs are not
  // combined; URLs in practice are ASCII.
  std::optional<std::string> DecodeString(const std::string& raw) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
      return std::nullopt;
    }
    std::string out;
    out.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
      char ch = raw[i];
      if (ch != '\\') {
        out += ch;
        continue;
      }
      if (i + 2 >= raw.size()) return std::nullopt;
      char esc = raw[++i];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          if (i + 4 >= raw.size()) return std::nullopt;
          const std::string hex = raw.substr(i + 1, 4);
          char* end = nullptr;
          unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
          if (end != hex.c_str() + 4) return std::nullopt;
          AppendUtf8(out, static_cast<unsigned int>(cp));
          i += 4;
          break;
        }
        default:
          return std::nullopt;
      }
    }
    return out;
  }

  // Parse a JSON number, or a string holding one.
  std::optional<double> ParseNumber(const std::string& raw) {
    std::string text = raw;
    if (!text.empty() && text.front() == '"') {
      auto decoded = DecodeString(text);
      if (!decoded) return std::nullopt;
      text = *decoded;
    }
    // Trim surrounding whitespace (numeric strings may carry it).
    size_t first = SkipWhitespace(text, 0);
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
      --last;
    }
    text = text.substr(first, last - first);
    if (text.empty()) return std::nullopt;

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  }

  // Split an object into (key, raw value) pairs at the top level.
  std::optional<Members> ParseObjectMembers(const std::string& json) {
    size_t pos = SkipWhitespace(json, 0);
    if (pos >= json.size() || json[pos] != '{') return std::nullopt;
    pos = SkipWhitespace(json, pos + 1);

    Members members;
    if (pos < json.size() && json[pos] == '}') {
      return members;
    }

    while (pos < json.size()) {
      if (json[pos] != '"') return std::nullopt;
      size_t key_end = ScanString(json, pos);
      if (key_end == std::string::npos) return std::nullopt;
      auto key = DecodeString(json.substr(pos, key_end - pos));
      if (!key) return std::nullopt;

      pos = SkipWhitespace(json, key_end);
      if (pos >= json.size() || json[pos] != ':') return std::nullopt;
      pos = SkipWhitespace(json, pos + 1);

      size_t value_end = ScanValue(json, pos);
      if (value_end == std::string::npos) return std::nullopt;
      members.emplace_back(*key, json.substr(pos, value_end - pos));

      pos = SkipWhitespace(json, value_end);
      if (pos >= json.size()) return std::nullopt;
      if (json[pos] == '}') return members;
      if (json[pos] != ',') return std::nullopt;
      pos = SkipWhitespace(json, pos + 1);
    }
    return std::nullopt;
  }

  // Split an array into raw element values.
  std::optional<std::vector<std::string>> ParseArrayElements(const std::string& json) {
    size_t pos = SkipWhitespace(json, 0);
    if (pos >= json.size() || json[pos] != '[') return std::nullopt;
    pos = SkipWhitespace(json, pos + 1);

    std::vector<std::string> elements;
    if (pos < json.size() && json[pos] == ']') {
      return elements;
    }

    while (pos < json.size()) {
      size_t value_end = ScanValue(json, pos);
      if (value_end == std::string::npos) return std::nullopt;
      elements.push_back(json.substr(pos, value_end - pos));

      pos = SkipWhitespace(json, value_end);
      if (pos >= json.size()) return std::nullopt;
      if (json[pos] == ']') return elements;
      if (json[pos] != ',') return std::nullopt;
      pos = SkipWhitespace(json, pos + 1);
    }
    return std::nullopt;
  }

  const std::string* FindMember(const Members& members, const std::string& key) {
    // Last occurrence wins, as with most JSON readers.
    const std::string* found = nullptr;
    for (const auto& [name, value] : members) {
      if (name == key) found = &value;
    }
    return found;
  }

  bool IsObject(const std::string& raw) {
    return !raw.empty() && raw.front() == '{';
  }

  bool IsNull(const std::string& raw) {
    return raw == "null";
  }

  std::optional<ManifestEvent> ParseEvent(const std::string& raw, size_t index) {
    if (!IsObject(raw)) return std::nullopt;
    auto members = ParseObjectMembers(raw);
    if (!members) return std::nullopt;

    const std::string* data = FindMember(*members, "data");
    if (!data || !IsObject(*data)) return std::nullopt;
    auto data_members = ParseObjectMembers(*data);
    if (!data_members) return std::nullopt;

    ManifestEvent event;
    event.index = index;

    if (const std::string* url = FindMember(*data_members, "url")) {
      auto decoded = DecodeString(*url);
      if (decoded && !decoded->empty()) {
        event.url = *decoded;
      }
    }

    if (const std::string* rel = FindMember(*members, "relativeTime")) {
      if (!IsNull(*rel)) {
        auto value = ParseNumber(*rel);
        if (value) {
          event.relative_time = *value;
        } else {
          event.relative_time_invalid = true;
        }
      }
    }
    return event;
  }
}  // namespace

std::optional<RecordingManifest> RecordingManifest::FromJson(const std::string& json_str) {
  auto members = ParseObjectMembers(json_str);
  if (!members) {
    return std::nullopt;
  }

  RecordingManifest manifest;

  if (const std::string* duration = FindMember(*members, "duration")) {
    auto value = ParseNumber(*duration);
    if (value && *value > 0.0) {
      manifest.duration = *value;
    }
  }

  if (const std::string* logs = FindMember(*members, "eventLogs")) {
    auto elements = ParseArrayElements(*logs);
    if (elements) {
      for (size_t i = 0; i < elements->size(); ++i) {
        auto event = ParseEvent((*elements)[i], i);
        if (event) {
          manifest.events.push_back(std::move(*event));
        }
      }
    }
  }

  return manifest;
}

std::optional<RecordingManifest> RecordingManifest::FromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return FromJson(buffer.str());
}

double RecordingManifest::RequireDuration() const {
  if (!duration) {
    throw MissingDurationError("\"duration\" must be a positive number");
  }
  return *duration;
}

}  // namespace seamline::manifest
