/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    data.cpp
 */

#include "data.h"  // NOLINT

#include <device/cpu/cpu_allocator.h>

namespace lmspark {

// Data --------------------------- //
Data::Data(const std::string& name, DeviceType device_type)
    : name_(name), device_type_(device_type) {
  switch (device_type) {
    case DeviceType::CPU: {
      allocator_ = std::make_shared<CPUAllocator>();
      break;
    }
    default: {
      LOG(ERROR) << "DeviceType::" << DeviceTypeToString(device_type)
                 << " is not supported. Please check build option.";
      throw LsException("LMSPARK_PARAM_ERROR");
    }
  }
}

void* Data::GetRawData() const { return raw_data_; }

// DenseData ---------------------- //
DenseData::DenseData(const std::string& name, int64_t nbytes,
                     DeviceType device_type)
    : Data(name, device_type), nbytes_(nbytes), deleter_(nullptr) {
  if (nbytes) {
    LS_CHECK(allocator_->Alloc(&raw_data_, nbytes, name));
  }
}

DenseData::DenseData(const std::string& name, int64_t nbytes,
                     DeviceType device_type, void* raw_data, deleter_t deleter)
    : Data(name, device_type), nbytes_(nbytes), deleter_(deleter) {
  raw_data_ = raw_data;
}

DenseData::~DenseData() {
  if (raw_data_) {
    if (deleter_ != nullptr) {
      deleter_(raw_data_);
      deleter_ = nullptr;
    } else {
      allocator_->Free(raw_data_);
    }
  }
}

LsStatus DenseData::Resize(int64_t nbytes) {
  if (nbytes <= nbytes_) {
    return LsStatus::LMSPARK_SUCCESS;
  }
  if (raw_data_) {
    if (deleter_ != nullptr) {
      deleter_(raw_data_);
      deleter_ = nullptr;
    } else {
      LS_CHECK_STATUS(allocator_->Free(raw_data_));
    }
    raw_data_ = nullptr;
  }
  LS_CHECK_STATUS(allocator_->Alloc(&raw_data_, nbytes, name_));
  nbytes_ = nbytes;
  return LsStatus::LMSPARK_SUCCESS;
}

int64_t DenseData::GetSize() const { return nbytes_; }

}  // namespace lmspark
