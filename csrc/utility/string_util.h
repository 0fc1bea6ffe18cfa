/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    string_util.h
 */

#pragma once

#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

namespace lmspark {
namespace util {

class StringUtil {
 public:
  static void Trim(std::string& str);

  static bool StartsWith(const std::string& value,
                         const std::string& starting) {
    return value.rfind(starting, 0) == 0;
  }

  static bool EndsWith(const std::string& value, const std::string& ending) {
    if (ending.size() > value.size()) return false;
    return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
  }

  // empty pieces between adjacent separators are dropped
  static std::vector<std::string> Split(const std::string& text,
                                        const char* sepStr);

  static bool StrToInt64(const char* str, int64_t& value);

  static std::string ToLower(const std::string& s);
};

}  // namespace util
}  // namespace lmspark
