/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    data.h
 */

#pragma once
#include <common/allocator.h>

#include <functional>
#include <memory>
#include <string>

namespace lmspark {

/*!
 * @brief Data base class
 */
class Data {
 public:
  explicit Data(const std::string& name,
                DeviceType device_type = DeviceType::CPU);
  virtual ~Data() = default;
  void* GetRawData() const;
  std::string GetName() const { return name_; };
  DeviceType GetDeviceType() const { return device_type_; };

 protected:
  void* raw_data_ = nullptr;
  std::shared_ptr<Allocator> allocator_;
  std::string name_;

 private:
  const DeviceType device_type_;
};

/*!
 * @brief DenseData
    feature below:
 *      > support construct from external data
 *      > support resize
 */
using deleter_t = std::function<void(void*)>;
class DenseData : public Data {
 public:
  // construct data from inner allocator
  explicit DenseData(const std::string& name, int64_t nbytes = 0,
                     DeviceType device_type = DeviceType::CPU);
  // construct data from external data, released through deleter
  explicit DenseData(const std::string& name, int64_t nbytes,
                     DeviceType device_type, void* raw_data, deleter_t deleter);

  ~DenseData();
  DISABLE_COPY_AND_ASSIGN(DenseData);
  LsStatus Resize(int64_t nbytes);
  int64_t GetSize() const;

 private:
  int64_t nbytes_ = 0;
  deleter_t deleter_;
};

}  // namespace lmspark
