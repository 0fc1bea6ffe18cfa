/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    lmspark_check.cpp
 */
#include <interface/lmspark_check.h>

#include <algorithm>
#include <mutex>
#include <sstream>
#include <vector>

namespace lmspark {

static std::vector<std::string> g_errors;
static std::mutex g_errors_lock;

const std::string LsGetErrorByCode(LsStatus error_code) {
  switch (error_code) {
    case LsStatus::LMSPARK_SUCCESS:
      return "LMSPARK_SUCCESS";
    case LsStatus::LMSPARK_UNKNOWN_ERROR:
      return "LMSPARK_UNKNOWN_ERROR";
    case LsStatus::LMSPARK_PARAM_ERROR:
      return "LMSPARK_PARAM_ERROR";
    case LsStatus::LMSPARK_IO_ERROR:
      return "LMSPARK_IO_ERROR";
    case LsStatus::LMSPARK_MEMORY_ERROR:
      return "LMSPARK_MEMORY_ERROR";
    case LsStatus::LMSPARK_EXCEED_LIMIT_ERROR:
      return "LMSPARK_EXCEED_LIMIT_ERROR";
    case LsStatus::LMSPARK_INVALID_CALL_ERROR:
      return "LMSPARK_INVALID_CALL_ERROR";
    case LsStatus::LMSPARK_RUNTIME_ERROR:
      if (!g_errors.empty())
        return "LMSPARK_RUNTIME_ERROR" + LsConcatErrors();
      else
        return "LMSPARK_RUNTIME_ERROR";

    default:
      return "LMSPARK_UNDEFINED_ERROR_CODE";
  }
}

LsStatus LsGetCodeByError(const std::string& error_name) {
  static const LsStatus all_codes[] = {
      LsStatus::LMSPARK_SUCCESS,          LsStatus::LMSPARK_UNKNOWN_ERROR,
      LsStatus::LMSPARK_PARAM_ERROR,      LsStatus::LMSPARK_IO_ERROR,
      LsStatus::LMSPARK_MEMORY_ERROR,     LsStatus::LMSPARK_EXCEED_LIMIT_ERROR,
      LsStatus::LMSPARK_INVALID_CALL_ERROR};
  for (LsStatus code : all_codes) {
    // exception messages start with the status name
    if (error_name.rfind(LsGetErrorByCode(code), 0) == 0) return code;
  }
  if (error_name.rfind("LMSPARK_RUNTIME_ERROR", 0) == 0)
    return LsStatus::LMSPARK_RUNTIME_ERROR;
  return LsStatus::LMSPARK_UNKNOWN_ERROR;
}

void LsSaveError(const std::string& err_str) {
  std::lock_guard<std::mutex> guard(g_errors_lock);
  // one err_str per type is enough
  if (std::find(g_errors.begin(), g_errors.end(), err_str) == g_errors.end()) {
    g_errors.emplace_back(err_str);
  }
}

const std::string LsConcatErrors() {
  std::lock_guard<std::mutex> guard(g_errors_lock);
  std::stringstream ss;
  if (!g_errors.empty()) ss << "|";
  for (auto& err_str : g_errors) {
    ss << err_str << "#";
  }
  return ss.str();
}

void LsClearErrors() {
  std::lock_guard<std::mutex> guard(g_errors_lock);
  g_errors.clear();
}

}  // namespace lmspark
