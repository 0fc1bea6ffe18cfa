/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    tensor.cpp
 */

#include "tensor.h"  // NOLINT

#include <sstream>
#include <utility>

namespace lmspark {

void CopyData(void* dst_data, DeviceType dst_device, const void* src_data,
              DeviceType src_device, int64_t nbytes,
              const DeviceContext* device_context) {
  if (nbytes == 0) {
    return;
  }
  if (src_device == DeviceType::CPU && dst_device == DeviceType::CPU) {
    memcpy(dst_data, src_data, nbytes);
    return;
  }
  LOG(ERROR) << "CopyData: unsupported device pair "
             << DeviceTypeToString(src_device) << " -> "
             << DeviceTypeToString(dst_device);
  LS_THROW(LsStatus::LMSPARK_PARAM_ERROR);
}

// allocate memory
LsTensor::LsTensor(const std::string& name, const DeviceType backend,
                   const DataType dtype, const DataMode mode,
                   const Shape& shape)
    : name_(name), backend_(backend), dtype_(dtype), mode_(mode), shape_(shape) {
  if (mode_ != DataMode::DENSE) {
    LOG(ERROR) << "Unspported DataMode:" << int(mode_);
    throw LsException("LMSPARK_PARAM_ERROR");
  }
  int64_t nbytes = shape_.Count() * SizeofType(dtype);
  data_ = std::make_shared<DenseData>(name, nbytes, backend);
}

LsTensor::LsTensor(const TensorProto& tensor_proto, DeviceType backend)
    : name_(tensor_proto.name()),
      backend_(backend),
      dtype_(DataType::DATATYPE_UNDEFINED),
      mode_(DataMode::DENSE) {
  data_ = std::make_shared<DenseData>(name_, 0, backend);
}

LsTensor::LsTensor(std::string new_name, const LsTensor& src_tensor)
    : name_(std::move(new_name)),
      backend_(src_tensor.GetDeviceType()),
      dtype_(src_tensor.GetDataType()),
      mode_(src_tensor.GetDataMode()),
      shape_(src_tensor.GetShape()) {
  int64_t nbytes = shape_.Count() * SizeofType(dtype_);
  data_ = std::make_shared<DenseData>(name_, nbytes, backend_);
  CopyDataFrom(src_tensor.GetDataPtr(), nbytes, src_tensor.GetDeviceType());
}

const std::string& LsTensor::GetName() const { return name_; }
void LsTensor::SetName(const std::string& name) { name_ = name; }
const Shape& LsTensor::GetShape() const { return shape_; }
DataType LsTensor::GetDataType() const { return dtype_; }
DeviceType LsTensor::GetDeviceType() const { return backend_; }
DataMode LsTensor::GetDataMode() const { return mode_; }
Data* LsTensor::GetData() const { return data_.get(); }

void* LsTensor::GetDataPtr() const {
  return data_ == nullptr ? nullptr : data_->GetRawData();
}

size_t LsTensor::GetSizeInByte() const {
  return shape_.Count() * SizeofType(dtype_);
}

void LsTensor::CopyDataFrom(const void* src_data, const size_t src_bytes,
                            DeviceType src_device,
                            const DeviceContext* device_ctx) {
  if (src_bytes > GetSizeInByte()) {
    LOG(ERROR) << "CopyDataFrom: " << name_ << " holds " << GetSizeInByte()
               << " bytes, asked to copy " << src_bytes;
    LS_THROW(LsStatus::LMSPARK_EXCEED_LIMIT_ERROR);
  }
  CopyData(GetDataPtr(), backend_, src_data, src_device, src_bytes,
           device_ctx);
}

void LsTensor::CopyDataTo(void* dst_data, const size_t dst_bytes,
                          DeviceType dst_device,
                          const DeviceContext* device_ctx) const {
  if (dst_bytes > GetSizeInByte()) {
    LOG(ERROR) << "CopyDataTo: " << name_ << " holds " << GetSizeInByte()
               << " bytes, asked to copy " << dst_bytes;
    LS_THROW(LsStatus::LMSPARK_EXCEED_LIMIT_ERROR);
  }
  CopyData(dst_data, dst_device, GetDataPtr(), backend_, dst_bytes,
           device_ctx);
}

LsStatus LsTensor::SetShape(Shape&& shape) {
  int64_t nbytes = shape.Count() * SizeofType(dtype_);
  auto* dense_data = dynamic_cast<DenseData*>(data_.get());
  if (dense_data) {
    auto ret = dense_data->Resize(nbytes);
    if (ret != LsStatus::LMSPARK_SUCCESS) {
      LOG(ERROR) << "Tensor Resize failed, trying to allocate nbytes "
                 << nbytes << " shape: " << shape;
      return ret;
    }
  }
  shape_ = std::move(shape);
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LsTensor::SetDataType(DataType dtype) {
  dtype_ = dtype;
  // keep the storage large enough for the current shape
  return SetShape(Shape(shape_));
}

LsStatus LsTensor::Free() {
  data_ = std::make_shared<DenseData>(name_, 0, backend_);
  shape_ = Shape();
  return LsStatus::LMSPARK_SUCCESS;
}

std::string LsTensor::ToString() const {
  return string_format(
      "{ name: %s, device: %s, dtype: %s, shape: %s, addr: %p, val: %s }",
      name_.c_str(), DeviceType_Name(backend_).c_str(),
      DataType_Name(dtype_).c_str(), shape_.ToString().c_str(), GetDataPtr(),
      GetDataString(false).c_str());
}

std::string LsTensor::ToStringAll() const {
  return string_format("{ name: %s, device: %s, dtype: %s, shape: %s, val: %s }",
                       name_.c_str(), DeviceType_Name(backend_).c_str(),
                       DataType_Name(dtype_).c_str(),
                       shape_.ToString().c_str(),
                       GetDataString(true).c_str());
}

namespace {
template <typename T>
void PrintValues(std::stringstream& ss, const T* ptr, int64_t count,
                 bool all) {
  const int print_len = 8;
  if (count == 0) return;
  ss << ptr[0];
  if (all or count <= print_len) {
    for (int64_t i = 1; i < count; ++i) {
      ss << "," << ptr[i];
    }
  } else {
    for (int i = 1; i < print_len / 2; ++i) {
      ss << "," << ptr[i];
    }
    ss << ", ... ";
    for (int i = print_len / 2 - 1; i >= 0; --i) {
      ss << "," << ptr[count - 1 - i];
    }
  }
}
}  // namespace

std::string LsTensor::GetDataString(bool all) const {
  if (GetDataPtr() == nullptr) {
    return "(null)";
  }
  std::stringstream ss;
  int64_t count = shape_.Count();
  switch (dtype_) {
    case DataType::FLOAT32:
      ss.precision(6);
      ss.flags(std::ios_base::fixed);
      PrintValues(ss, static_cast<const float*>(GetDataPtr()), count, all);
      break;
    case DataType::INT64:
      PrintValues(ss, static_cast<const int64_t*>(GetDataPtr()), count, all);
      break;
    case DataType::INT32:
      PrintValues(ss, static_cast<const int32_t*>(GetDataPtr()), count, all);
      break;
    case DataType::FLOAT16:
      PrintValues(ss, static_cast<const uint16_t*>(GetDataPtr()), count, all);
      break;
    default:
      ss << "(unprintable)";
      break;
  }
  return ss.str();
}

void TensorUtils::Memset(LsTensor& t, char val) {
  if (t.GetDataPtr() == nullptr) return;
  memset(t.GetDataPtr(), val, t.GetSizeInByte());
}

void TensorUtils::DeepCopyWhole(LsTensor& dst, const LsTensor& src) {
  LS_CHECK(dst.SetDataType(src.GetDataType()));
  LS_CHECK(dst.SetShape(Shape(src.GetShape())));
  CopyData(dst.GetDataPtr(), dst.GetDeviceType(), src.GetDataPtr(),
           src.GetDeviceType(), src.GetSizeInByte());
}

}  // namespace lmspark
