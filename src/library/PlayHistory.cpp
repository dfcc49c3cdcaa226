// Repository: rotaplay
// Component: Play History Implementation
// Purpose: Minimal JSON read/write of the played id list.
// Copyright (c) 2025 Rotaplay

#include "rotaplay/library/PlayHistory.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "rotaplay/util/Logger.hpp"

namespace rotaplay::library {

using rotaplay::util::Logger;

namespace {

constexpr const char* kPlayedKey = "\"played_videos\"";

void SkipSpace(const std::string& s, size_t* pos) {
  while (*pos < s.size() && std::isspace(static_cast<unsigned char>(s[*pos]))) {
    ++(*pos);
  }
}

// Reads a JSON string starting at the opening quote. Handles the escapes
// Serialize emits plus \/ and \n.
bool ReadString(const std::string& s, size_t* pos, std::string* out) {
  if (*pos >= s.size() || s[*pos] != '"') return false;
  ++(*pos);
  out->clear();
  while (*pos < s.size()) {
    char c = s[*pos];
    if (c == '\\' && *pos + 1 < s.size()) {
      char next = s[*pos + 1];
      if (next == '"' || next == '\\' || next == '/') {
        *out += next;
      } else if (next == 'n') {
        *out += '\n';
      } else {
        return false;
      }
      *pos += 2;
      continue;
    }
    if (c == '"') {
      ++(*pos);
      return true;
    }
    *out += c;
    ++(*pos);
  }
  return false;
}

bool ReadStringArray(const std::string& s, size_t* pos,
                     std::vector<std::string>* out) {
  SkipSpace(s, pos);
  if (*pos >= s.size() || s[*pos] != '[') return false;
  ++(*pos);
  SkipSpace(s, pos);
  if (*pos < s.size() && s[*pos] == ']') {
    ++(*pos);
    return true;
  }
  while (*pos < s.size()) {
    SkipSpace(s, pos);
    std::string value;
    if (!ReadString(s, pos, &value)) return false;
    out->push_back(std::move(value));
    SkipSpace(s, pos);
    if (*pos >= s.size()) return false;
    if (s[*pos] == ',') {
      ++(*pos);
      continue;
    }
    if (s[*pos] == ']') {
      ++(*pos);
      return true;
    }
    return false;
  }
  return false;
}

std::string Escape(const std::string& value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    if (c == '"' || c == '\\') escaped += '\\';
    escaped += c;
  }
  return escaped;
}

}  // namespace

std::string PlayHistory::Serialize(const std::set<std::string>& ids) {
  std::ostringstream oss;
  oss << "{\n  " << kPlayedKey << ": [";
  bool first = true;
  for (const auto& id : ids) {
    oss << (first ? "\n    " : ",\n    ") << '"' << Escape(id) << '"';
    first = false;
  }
  oss << (ids.empty() ? "]" : "\n  ]") << "\n}\n";
  return oss.str();
}

bool PlayHistory::Parse(const std::string& json, std::vector<std::string>* out) {
  out->clear();
  size_t pos = 0;
  SkipSpace(json, &pos);
  if (pos >= json.size()) return false;

  if (json[pos] == '[') {
    return ReadStringArray(json, &pos, out);
  }
  if (json[pos] != '{') return false;

  size_t key = json.find(kPlayedKey, pos);
  if (key == std::string::npos) {
    // Object without the key: valid document, nothing played.
    return json.find('}', pos) != std::string::npos;
  }
  pos = key + std::char_traits<char>::length(kPlayedKey);
  SkipSpace(json, &pos);
  if (pos >= json.size() || json[pos] != ':') return false;
  ++pos;
  return ReadStringArray(json, &pos, out);
}

std::vector<std::string> PlayHistory::Load(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::vector<std::string> ids;
  if (!Parse(buffer.str(), &ids)) {
    Logger::Warn("[PlayHistory] Could not parse " + path +
                 ", starting with empty history");
    return {};
  }
  return ids;
}

bool PlayHistory::Save(const std::string& path,
                       const std::set<std::string>& ids) {
  const std::filesystem::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      Logger::Error("[PlayHistory] Could not create " +
                    target.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    Logger::Error("[PlayHistory] Could not open " + path + " for writing");
    return false;
  }
  file << Serialize(ids);
  file.flush();
  if (!file) {
    Logger::Error("[PlayHistory] Write failed for " + path);
    return false;
  }
  return true;
}

}  // namespace rotaplay::library
