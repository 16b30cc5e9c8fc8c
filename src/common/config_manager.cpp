#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  auto start = std::find_if_not(input.begin(), input.end(), [](unsigned char c){ return std::isspace(c); });
  auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c){ return std::isspace(c); }).base();
  if (start >= end) return std::string();
  return std::string(start, end);
}

// Surrounding single or double quotes are dropped: KEY="value"
static inline std::string Unquote(const std::string& v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) return v.substr(1, v.size() - 2);
  return v;
}

bool ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  return LoadEnvFile(env_path);
}

bool ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Warning(".env file not found: " + env_path);
    return false;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = TrimWhitespace(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = Unquote(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
  Logger::Debug("Loaded " + std::to_string(cache_.size()) + " settings from " + env_path);
  return true;
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
  cache_[key] = value;
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  Logger::Warning("Ignoring non-boolean value for " + key + ": " + *v, __FILE__, __LINE__);
  return default_value;
}
