/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    ls_check.h
 */

#pragma once

#include <glog/logging.h>
#include <interface/lmspark_check.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace lmspark {

inline void ConcatStringInternal(std::stringstream& ss) {}

template <typename T,
          typename std::enable_if<!std::is_enum<
              typename std::remove_reference<T>::type>::value>::type* = nullptr>
void ConcatStringInternal(std::stringstream& ss, T&& t) {
  ss << std::forward<T>(t);
}

template <typename T,
          typename std::enable_if<std::is_enum<
              typename std::remove_reference<T>::type>::value>::type* = nullptr>
void ConcatStringInternal(std::stringstream& ss, T&& t) {
  ss << static_cast<int>(t);
}

template <typename T, typename... Args>
void ConcatStringInternal(std::stringstream& ss, T&& t, Args&&... args) {
  ConcatStringInternal(ss, std::forward<T>(t));
  ConcatStringInternal(ss, std::forward<Args>(args)...);
}

template <typename... Args>
std::string ConcatString(Args&&... args) {
  std::stringstream ss;
  ConcatStringInternal(ss, std::forward<Args>(args)...);
  return std::string(ss.str());
}

#define LS_ENFORCE(condition, ...)                                  \
  do {                                                              \
    if (!(condition)) {                                             \
      LOG(ERROR) << __FILE__ << ":" << __LINE__                     \
                 << ", lmspark ENFORCE FAILED , "                   \
                 << lmspark::ConcatString(__VA_ARGS__);             \
      throw std::invalid_argument(lmspark::ConcatString(__VA_ARGS__)); \
    }                                                               \
  } while (false)

#define LS_CHECK_RETVAL(condition, retval, message) \
  do {                                              \
    if (!(condition)) {                             \
      LOG(ERROR) << message;                        \
      return retval;                                \
    }                                               \
  } while (0)

#define LS_STATUS_OK(status) (status == LsStatus::LMSPARK_SUCCESS)

#define LS_CHECK_STATUS(status)                       \
  do {                                                \
    LsStatus err_status = status;                     \
    if (not LS_STATUS_OK(err_status)) {               \
      LOG(ERROR) << "lmspark LS_CHECK_STATUS FAILED"; \
      return err_status;                              \
    }                                                 \
  } while (0)

#define LS_CHECK_STATUS_DO(status, cmd) \
  do {                                  \
    LsStatus err_status = status;       \
    if (not LS_STATUS_OK(err_status)) { \
      cmd;                              \
      return err_status;                \
    }                                   \
  } while (0)

#define LS_CHECK_EXCEPTION(expr)                                \
  do {                                                          \
    try {                                                       \
      expr;                                                     \
    } catch (std::exception & e) {                              \
      LOG(ERROR) << "Failed:  " << __FILE__ << ":" << __LINE__; \
      throw;                                                    \
    }                                                           \
  } while (0)

}  // namespace lmspark
