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

#pragma once

#include <any>
#include <string>
#include <vector>

#include "weighlink/base/visibility.hpp"

namespace weighlink {
namespace config {

/**
 * Configuration value types inferred from a properties file
 */
enum class ConfigType { String, Integer, Boolean, Double };

/**
 * Configuration item definition
 */
struct ConfigItem {
  std::string key;
  std::any value;
  ConfigType type;
  std::string text;  // value as written in the file

  ConfigItem() : key(""), value(std::any()), type(ConfigType::String) {}

  ConfigItem(const std::string& k, const std::any& v, ConfigType t, const std::string& txt = "")
      : key(k), value(v), type(t), text(txt) {}
};

/**
 * Abstract interface for configuration management
 */
class WEIGHLINK_API ConfigManagerInterface {
 public:
  virtual ~ConfigManagerInterface() = default;

  // Configuration access
  virtual std::any get(const std::string& key) const = 0;
  virtual std::any get(const std::string& key, const std::any& default_value) const = 0;
  virtual bool has(const std::string& key) const = 0;

  // Configuration modification
  virtual void set(const std::string& key, const std::any& value) = 0;
  virtual bool remove(const std::string& key) = 0;
  virtual void clear() = 0;

  // Configuration persistence
  virtual bool save_to_file(const std::string& filepath) const = 0;
  virtual bool load_from_file(const std::string& filepath) = 0;

  // Configuration introspection
  virtual std::vector<std::string> get_keys() const = 0;
  virtual ConfigType get_type(const std::string& key) const = 0;
};

}  // namespace config
}  // namespace weighlink
