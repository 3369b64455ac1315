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

#include <map>
#include <mutex>

#include "weighlink/base/visibility.hpp"
#include "weighlink/config/iconfig_manager.hpp"

namespace weighlink {
namespace config {

/**
 * Thread-safe key=value properties store
 *
 * Files hold one `key=value` pair per line; blank lines and lines starting
 * with '#' or '!' are ignored. Values of `true`/`false` load as bool,
 * signed digit runs as int, a single-dot decimal as double, anything else
 * as std::string.
 */
class WEIGHLINK_API ConfigManager : public ConfigManagerInterface {
 public:
  ConfigManager() = default;
  ~ConfigManager() override = default;

  // Configuration access
  std::any get(const std::string& key) const override;
  std::any get(const std::string& key, const std::any& default_value) const override;
  bool has(const std::string& key) const override;

  /**
   * @brief Read a value back as the text it was written with
   * @return Empty string when the key is absent
   */
  std::string get_text(const std::string& key) const;

  // Configuration modification
  void set(const std::string& key, const std::any& value) override;
  bool remove(const std::string& key) override;
  void clear() override;

  // Configuration persistence
  bool save_to_file(const std::string& filepath) const override;
  bool load_from_file(const std::string& filepath) override;

  // Configuration introspection
  std::vector<std::string> get_keys() const override;
  ConfigType get_type(const std::string& key) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, ConfigItem> config_items_;

  static ConfigType infer_type(const std::string& value_str);
  static ConfigType type_of(const std::any& value);
  static std::string serialize_value(const std::any& value, ConfigType type);
  static std::any deserialize_value(const std::string& value_str, ConfigType& type);
};

}  // namespace config
}  // namespace weighlink
