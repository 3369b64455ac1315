/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "weighlink/config/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include "weighlink/diagnostics/logger.hpp"

namespace weighlink {
namespace config {

namespace {

void trim(std::string& s) {
  s.erase(0, s.find_first_not_of(" \t\r"));
  s.erase(s.find_last_not_of(" \t\r") + 1);
}

}  // namespace

std::any ConfigManager::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.value;
  }
  throw std::runtime_error("Configuration key not found: " + key);
}

std::any ConfigManager::get(const std::string& key, const std::any& default_value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.value;
  }
  return default_value;
}

bool ConfigManager::has(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.find(key) != config_items_.end();
}

std::string ConfigManager::get_text(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return "";
  }
  return it->second.text;
}

void ConfigManager::set(const std::string& key, const std::any& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  ConfigType type = type_of(value);
  config_items_[key] = ConfigItem(key, value, type, serialize_value(value, type));
}

bool ConfigManager::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.erase(key) > 0;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_.clear();
}

bool ConfigManager::save_to_file(const std::string& filepath) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ofstream file(filepath);
  if (!file.is_open()) {
    WEIGHLINK_LOG_ERROR("config", "save", "Cannot open configuration file for writing: " + filepath);
    return false;
  }

  file << "# weighlink configuration file\n";
  for (const auto& [key, item] : config_items_) {
    file << key << "=" << item.text << "\n";
  }
  return static_cast<bool>(file);
}

bool ConfigManager::load_from_file(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    return false;
  }

  std::map<std::string, ConfigItem> loaded;
  std::string line;
  while (std::getline(file, line)) {
    trim(line);
    // Skip comments and empty lines
    if (line.empty() || line[0] == '#' || line[0] == '!') {
      continue;
    }

    size_t pos = line.find('=');
    if (pos == std::string::npos) {
      WEIGHLINK_LOG_WARNING("config", "load", "Ignoring line without '=': " + line);
      continue;
    }

    std::string key = line.substr(0, pos);
    std::string value_str = line.substr(pos + 1);
    trim(key);
    trim(value_str);
    if (key.empty()) {
      continue;
    }

    ConfigType type = infer_type(value_str);
    std::any value = deserialize_value(value_str, type);
    loaded[key] = ConfigItem(key, value, type, value_str);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [key, item] : loaded) {
    config_items_[key] = std::move(item);
  }
  return true;
}

std::vector<std::string> ConfigManager::get_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(config_items_.size());

  for (const auto& [key, item] : config_items_) {
    keys.push_back(key);
  }

  return keys;
}

ConfigType ConfigManager::get_type(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.type;
  }
  throw std::runtime_error("Configuration key not found: " + key);
}

ConfigType ConfigManager::infer_type(const std::string& value_str) {
  if (value_str == "true" || value_str == "false") {
    return ConfigType::Boolean;
  }
  if (value_str.empty()) {
    return ConfigType::String;
  }

  size_t start = (value_str[0] == '-' || value_str[0] == '+') ? 1 : 0;
  if (start == value_str.size()) {
    return ConfigType::String;
  }
  auto digits_begin = value_str.begin() + static_cast<std::ptrdiff_t>(start);
  if (std::all_of(digits_begin, value_str.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return ConfigType::Integer;
  }
  if (std::count(digits_begin, value_str.end(), '.') == 1 &&
      std::all_of(digits_begin, value_str.end(),
                  [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || c == '.'; }) &&
      std::any_of(digits_begin, value_str.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return ConfigType::Double;
  }
  return ConfigType::String;
}

ConfigType ConfigManager::type_of(const std::any& value) {
  if (value.type() == typeid(int)) {
    return ConfigType::Integer;
  } else if (value.type() == typeid(bool)) {
    return ConfigType::Boolean;
  } else if (value.type() == typeid(double)) {
    return ConfigType::Double;
  }
  return ConfigType::String;
}

std::string ConfigManager::serialize_value(const std::any& value, ConfigType type) {
  try {
    switch (type) {
      case ConfigType::String:
        if (value.type() == typeid(const char*)) {
          return std::any_cast<const char*>(value);
        }
        return std::any_cast<std::string>(value);
      case ConfigType::Integer:
        return std::to_string(std::any_cast<int>(value));
      case ConfigType::Boolean:
        return std::any_cast<bool>(value) ? "true" : "false";
      case ConfigType::Double:
        return std::to_string(std::any_cast<double>(value));
    }
  } catch (const std::bad_any_cast&) {
    WEIGHLINK_LOG_WARNING("config", "serialize", "Value type cannot be written to a properties file");
  }
  return "";
}

std::any ConfigManager::deserialize_value(const std::string& value_str, ConfigType& type) {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any(value_str);
      case ConfigType::Integer:
        return std::any(std::stoi(value_str));
      case ConfigType::Boolean:
        return std::any(value_str == "true");
      case ConfigType::Double:
        return std::any(std::stod(value_str));
    }
  } catch (const std::logic_error& e) {
    WEIGHLINK_LOG_DEBUG("config", "load", "Keeping '" + value_str + "' as text: " + e.what());
  }
  type = ConfigType::String;
  return std::any(value_str);
}

}  // namespace config
}  // namespace weighlink
