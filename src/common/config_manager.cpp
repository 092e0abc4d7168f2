#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  size_t start = 0, end = input.size();
  while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

static inline std::string Unquote(const std::string& v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) return v.substr(1, v.size() - 2);
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Warning(".env file not found: " + env_path);
    return;
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
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
  cache_[key] = value;
}

void ConfigManager::Clear() {
  cache_.clear();
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  return std::nullopt;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v || v->empty()) throw std::runtime_error("Missing required config: " + key);
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  size_t used = 0;
  int parsed = 0;
  try { parsed = std::stoi(*v, &used); } catch (const std::exception&) { used = 0; }
  if (used != v->size()) throw std::runtime_error("Config " + key + " is not an integer: " + *v);
  return parsed;
}

unsigned long long ConfigManager::GetUint64Or(const std::string& key, unsigned long long default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  size_t used = 0;
  unsigned long long parsed = 0;
  bool digits = std::all_of(v->begin(), v->end(), [](unsigned char c){ return std::isdigit(c); });
  if (digits) {
    try { parsed = std::stoull(*v, &used); } catch (const std::out_of_range&) { used = 0; }
  }
  if (!digits || used != v->size()) throw std::runtime_error("Config " + key + " is not an unsigned integer: " + *v);
  return parsed;
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  return default_value;
}
