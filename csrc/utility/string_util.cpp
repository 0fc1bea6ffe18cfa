/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    string_util.cpp
 */

#include "string_util.h"

#include <errno.h>

#include <cctype>
#include <cstdlib>

namespace lmspark {
namespace util {

void StringUtil::Trim(std::string& str) {
  str.erase(str.find_last_not_of(" \t\r\n") + 1);
  str.erase(0, str.find_first_not_of(" \t\r\n"));
}

std::vector<std::string> StringUtil::Split(const std::string& text,
                                           const char* sepStr) {
  std::vector<std::string> vec;
  std::string sep(sepStr);
  size_t n = 0, old = 0;
  while (n != std::string::npos) {
    n = text.find(sep, n);
    if (n != std::string::npos) {
      if (n != old) vec.push_back(text.substr(old, n - old));
      n += sep.length();
      old = n;
    }
  }
  vec.push_back(text.substr(old, text.length() - old));
  return vec;
}

bool StringUtil::StrToInt64(const char* str, int64_t& value) {
  if (NULL == str || *str == 0) {
    return false;
  }
  char* endPtr = NULL;
  errno = 0;
  value = (int64_t)strtoll(str, &endPtr, 10);
  if (errno == 0 && endPtr && *endPtr == 0) {
    return true;
  }
  return false;
}

std::string StringUtil::ToLower(const std::string& s) {
  std::string rc = s;
  std::transform(rc.begin(), rc.end(), rc.begin(), ::tolower);
  return rc;
}

}  // namespace util
}  // namespace lmspark
