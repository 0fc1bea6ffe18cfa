/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    tensor.h
 */

#pragma once

#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "data.h"   // NOLINT
#include "shape.h"  // NOLINT

namespace lmspark {

class DeviceContext;

void CopyData(void* dst_data, DeviceType dst_device, const void* src_data,
              DeviceType src_device, int64_t nbytes,
              const DeviceContext* device_context = nullptr);

class LsTensor {
 public:
  explicit LsTensor(const std::string& name = "",
                    DeviceType backend = DeviceType::CPU,
                    DataType dtype = DataType::DATATYPE_UNDEFINED,
                    DataMode mode = DataMode::DENSE, const Shape& shape = {});

  // tensor declared by an operator proto, storage allocated on SetShape
  explicit LsTensor(const TensorProto& tensor_proto,
                    DeviceType backend = DeviceType::CPU);

  // deep copy under a new name
  explicit LsTensor(std::string new_name, const LsTensor& src_tensor);

  const std::string& GetName() const;
  void SetName(const std::string& name);

  const Shape& GetShape() const;
  DataType GetDataType() const;
  DeviceType GetDeviceType() const;
  DataMode GetDataMode() const;
  void* GetDataPtr() const;
  Data* GetData() const;
  size_t GetSizeInByte() const;

  std::string ToString() const;
  std::string ToStringAll() const;

  void CopyDataFrom(const void* src_data, const size_t src_bytes,
                    DeviceType src_device,
                    const DeviceContext* device_ctx = nullptr);
  void CopyDataTo(void* dst_data, const size_t dst_bytes, DeviceType dst_device,
                  const DeviceContext* device_ctx = nullptr) const;

  // grows the storage when the new shape needs more bytes, never shrinks
  LsStatus SetShape(Shape&& shape);
  LsStatus SetDataType(DataType dtype);
  LsStatus Free();

 private:
  std::string GetDataString(bool all) const;
  std::string name_;
  DeviceType backend_;
  DataType dtype_;
  DataMode mode_;
  Shape shape_;
  std::shared_ptr<Data> data_;
};

inline std::ostream& operator<<(std::ostream& out, LsTensor const& data) {
  out << "LsTensor: name: " << data.GetName()
      << " dtype_: " << DataTypeToString(data.GetDataType()) << " "
      << data.GetShape() << " ptr: " << data.GetDataPtr();
  return out;
}

using TensorMap = std::unordered_map<std::string, std::shared_ptr<LsTensor>>;

template <typename T>
struct DataTypeTrait;
template <>
struct DataTypeTrait<float> {
  static constexpr DataType data_type = DataType::FLOAT32;
};
template <>
struct DataTypeTrait<int64_t> {
  static constexpr DataType data_type = DataType::INT64;
};
template <>
struct DataTypeTrait<int32_t> {
  static constexpr DataType data_type = DataType::INT32;
};
template <>
struct DataTypeTrait<uint16_t> {
  static constexpr DataType data_type = DataType::FLOAT16;
};

class TensorUtils {
 public:
  /**
   * set a tensor to special byte val.
   */
  static void Memset(LsTensor& t, char val);

  /**
   * Full synchronous copy, dst is reshaped and retyped after src.
   */
  static void DeepCopyWhole(LsTensor& dst, const LsTensor& src);

  /**
   * Copy a std::vector into a tensor of the given shape.
   */
  template <typename T>
  static void DeepCopyFromStdVector(LsTensor& dst, const Shape& shape,
                                    const std::vector<T>& src) {
    if (static_cast<int64_t>(src.size()) != shape.Count()) {
      LOG(ERROR) << "TensorUtils::DeepCopyFromStdVector: vector size "
                 << src.size() << " does not match shape " << shape;
      LS_THROW(LsStatus::LMSPARK_PARAM_ERROR);
    }
    LS_CHECK(dst.SetDataType(DataTypeTrait<T>::data_type));
    LS_CHECK(dst.SetShape(Shape(shape)));
    dst.CopyDataFrom(src.data(), src.size() * sizeof(T), DeviceType::CPU);
  }

  template <typename T>
  static std::vector<T> ToStdVector(const LsTensor& src) {
    if (src.GetDataType() != DataTypeTrait<T>::data_type) {
      LOG(ERROR) << "TensorUtils::ToStdVector: " << src.GetName()
                 << " has type " << DataTypeToString(src.GetDataType());
      LS_THROW(LsStatus::LMSPARK_PARAM_ERROR);
    }
    std::vector<T> out(src.GetShape().Count());
    src.CopyDataTo(out.data(), out.size() * sizeof(T), DeviceType::CPU);
    return out;
  }
};

}  // namespace lmspark
