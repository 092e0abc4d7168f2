#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Process-wide key/value settings loaded from a .env file. Keys missing from the
// file fall back to the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  // Throw std::runtime_error when the key is present but not a number
  static int GetIntOr(const std::string& key, int default_value);
  static unsigned long long GetUint64Or(const std::string& key, unsigned long long default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
