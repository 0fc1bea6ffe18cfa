/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    lmspark_check.h
 */

#pragma once

#include <exception>
#include <string>

class LsException : public std::exception {
 public:
  explicit LsException(const char* msg) : msg_(msg) {}
  explicit LsException(const std::string& err_str) : msg_(err_str) {}
  const char* what() const noexcept override { return msg_.c_str(); }

 private:
  std::string msg_;
};

class LsModelException : public LsException {
 public:
  explicit LsModelException(const char* msg) : LsException(msg) {}
  explicit LsModelException(const std::string& err_str)
      : LsException(err_str) {}
};

class LsModelIOException : public LsModelException {
 public:
  explicit LsModelIOException(const char* msg) : LsModelException(msg) {}
  explicit LsModelIOException(const std::string& err_str)
      : LsModelException(err_str) {}
};

#define LS_CHECK(status)                                       \
  do {                                                         \
    lmspark::LsStatus err_status = status;                     \
    if (err_status != lmspark::LsStatus::LMSPARK_SUCCESS) {    \
      printf("Failed: %s:%d '%s'\n", __FILE__, __LINE__,       \
             lmspark::LsGetErrorByCode(err_status).c_str());   \
      throw LsException(lmspark::LsGetErrorByCode(err_status)); \
    }                                                          \
  } while (0);

#define LS_THROW(status)                                        \
  do {                                                          \
    if (status != lmspark::LsStatus::LMSPARK_SUCCESS) {         \
      throw LsException(lmspark::LsGetErrorByCode(status));     \
    }                                                           \
  } while (0);

namespace lmspark {

// lmspark status code
enum class LsStatus : int {
  LMSPARK_SUCCESS = 0,

  LMSPARK_UNKNOWN_ERROR = 1,        // fallback
  LMSPARK_PARAM_ERROR = 2,          // bad argument value
  LMSPARK_IO_ERROR = 3,             // file access
  LMSPARK_MEMORY_ERROR = 4,         // allocation or out of bounds
  LMSPARK_RUNTIME_ERROR = 5,        // operator failure at runtime
  LMSPARK_EXCEED_LIMIT_ERROR = 7,   // argument or input over a limit
  LMSPARK_INVALID_CALL_ERROR = 8,   // call not valid in this state
};

const std::string LsGetErrorByCode(LsStatus error_code);
LsStatus LsGetCodeByError(const std::string& error_name);
void LsSaveError(const std::string& e);
const std::string LsConcatErrors();
void LsClearErrors();

}  // namespace lmspark
