#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// KEY=VALUE settings read from a .env file. '#' starts a comment line.
class ConfigManager {
public:
  // Replaces the cache with the file's contents. Returns false if the file
  // could not be opened (the cache is then empty).
  static bool Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static bool GetBoolOr(const std::string& key, bool default_value);
  static void Set(const std::string& key, const std::string& value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static bool LoadEnvFile(const std::string& env_path);
};
