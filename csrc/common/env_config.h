/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    env_config.h
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>  // for getenv
#include <stdexcept>
#include <string>

namespace lmspark {

class EnvVarConfig {
 public:
  /**
   * @brief Gets the string value of an environment variable, or returns a
   * default value if not set.
   */
  static std::string GetString(const std::string& varName,
                               const std::string& defaultValue) {
    const char* val = std::getenv(varName.c_str());
    return (val == nullptr) ? defaultValue : std::string(val);
  }

  /**
   * @brief Gets the integer value of an environment variable, or returns a
   * default value if not set or conversion fails.
   */
  static int GetInt(const std::string& varName, int defaultValue) {
    const char* val = std::getenv(varName.c_str());
    if (val == nullptr) {
      return defaultValue;
    }
    try {
      return std::stoi(val);
    } catch (const std::invalid_argument& e) {
      return defaultValue;
    } catch (const std::out_of_range& e) {
      return defaultValue;
    }
  }

  static float GetFloat(const std::string& varName, float defaultValue) {
    const char* val = std::getenv(varName.c_str());
    if (val == nullptr) {
      return defaultValue;
    }
    try {
      return std::stof(val);
    } catch (const std::invalid_argument& e) {
      return defaultValue;
    } catch (const std::out_of_range& e) {
      return defaultValue;
    }
  }

  /**
   * @brief "true" (any case) and "1" are true, any other set value is false.
   */
  static bool GetBool(const std::string& varName, bool defaultValue) {
    const char* val = std::getenv(varName.c_str());
    if (val == nullptr) {
      return defaultValue;
    }
    std::string lower(val);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower == "true" or lower == "1";
  }
};

}  // namespace lmspark
