/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    common.h
 */

#pragma once

#include <glog/logging.h>
#include <interface/lmspark_check.h>
#include <lmspark.pb.h>
#include <utility/ls_check.h>

#include <cctype>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace lmspark {

// Disable the copy and assignment operator for a class.
#ifndef DISABLE_COPY_AND_ASSIGN
#define DISABLE_COPY_AND_ASSIGN(classname) \
  classname(const classname&) = delete;    \
  classname& operator=(const classname&) = delete
#endif

template <typename... Args>
std::string string_format(const std::string& format, Args... args) {
  int size = snprintf(nullptr, 0, format.c_str(), args...) + 1;
  if (size <= 0) {
    throw std::runtime_error("Error during formatting.");
  }
  std::unique_ptr<char[]> buf(new char[size]);
  snprintf(buf.get(), size, format.c_str(), args...);
  return std::string(buf.get(), buf.get() + size - 1);
}

inline size_t SizeofType(DataType data_type) {
  switch (data_type) {
    case DataType::INT64:
      return 8;
    case DataType::FLOAT32:
    case DataType::INT32:
      return 4;
    case DataType::FLOAT16:
    case DataType::BFLOAT16:
    case DataType::INT16:
      return 2;
    case DataType::INT8:
    case DataType::UINT8:
    case DataType::BOOL:
      return 1;
    case DataType::DATATYPE_UNDEFINED:
      return 0;
    default:
      return 1;
  }
}

inline std::string DataTypeToString(DataType data_type) {
  switch (data_type) {
    case DataType::DATATYPE_UNDEFINED:
      return "DataType::DATATYPE_UNDEFINED";
    case DataType::FLOAT32:
      return "DataType::FLOAT32";
    case DataType::FLOAT16:
      return "DataType::FLOAT16";
    case DataType::INT8:
      return "DataType::INT8";
    case DataType::INT16:
      return "DataType::INT16";
    case DataType::INT32:
      return "DataType::INT32";
    case DataType::INT64:
      return "DataType::INT64";
    case DataType::BOOL:
      return "DataType::BOOL";
    case DataType::BFLOAT16:
      return "DataType::BFLOAT16";
    case DataType::UINT8:
      return "DataType::UINT8";
    default:
      return "UNKNOWN";
  }
}

inline std::string DeviceTypeToString(DeviceType device_type) {
  switch (device_type) {
    case DeviceType::DEVICETYPE_UNDEFINED:
      return "DEVICETYPE_UNDEFINED";
    case DeviceType::CPU:
      return "CPU";
    default:
      return "UNKNOWN";
  }
}

inline std::ostream& operator<<(std::ostream& os, LsStatus status) {
  return os << LsGetErrorByCode(status);
}

// "params.transformers.encoder.3.ffn.fc1.kernel" -> 3, -1 when no layer
inline int get_layer_num(const std::string& str) {
  std::stringstream ss(str);
  std::string temp;
  while (std::getline(ss, temp, '.')) {
    if (temp.empty()) continue;
    bool flag = true;
    for (char c : temp) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        flag = false;
        break;
      }
    }
    if (flag) {
      return std::stoi(temp);
    }
  }
  return -1;
}

}  // namespace lmspark
