/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    test_operator_utils.h
 */

#pragma once
#include <common/device_context.h>
#include <common/generate_context.h>
#include <core/operator/operator.h>
#include <core/tensor/tensor.h>
#include <device/cpu/cpu_context.h>
#include <gtest/gtest.h>
#include <test_common.h>
#include <utility/datatype_dispatcher.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace LS_UTEST {

/**
 * @brief Test Op Utils
 *
 * Builds an OperatorProto with its tensors and drives the registered
 * operator through Init, Reshape and Forward.
 */
class TestOpUtil {
 public:
  TestOpUtil() : device_context_(std::make_shared<lmspark::CPUContext>()) {}

  void SetOpType(const std::string op_type) { op_proto_.set_op_type(op_type); }
  void SetOpName(const std::string op_name) { op_proto_.set_op_name(op_name); }

  template <typename T>
  void SetOpAttribute(const std::string key, const T val) {
    auto& proto_map = *(op_proto_.mutable_attr());
    proto_map[key] =
        std::string(reinterpret_cast<const char*>(&val), sizeof(T));
  }

  template <typename T>
  void AddInput(const std::string tensor_name, const std::vector<int64_t> shape,
                const lmspark::DataType data_type, const std::vector<T>& src_data,
                const bool is_weight) {
    auto tensor = std::make_shared<lmspark::LsTensor>(
        tensor_name, lmspark::DeviceType::CPU, data_type,
        lmspark::DataMode::DENSE, lmspark::Shape(shape));
    tensor->CopyDataFrom(src_data.data(), src_data.size() * sizeof(T),
                         lmspark::DeviceType::CPU, device_context_.get());
    if (is_weight == true) {
      op_proto_.add_weights()->set_name(tensor_name);
      weight_map_[tensor_name] = tensor;
    } else {
      op_proto_.add_inputs()->set_name(tensor_name);
      tensor_map_[tensor_name] = tensor;
    }
  }

  // replaces the content and shape of an input between two runs
  template <typename T>
  void UpdateInput(const std::string tensor_name,
                   const std::vector<int64_t> shape,
                   const std::vector<T>& src_data) {
    lmspark::TensorUtils::DeepCopyFromStdVector(
        *tensor_map_.at(tensor_name), lmspark::Shape(shape), src_data);
  }

  // shape and type are set by the operator
  void AddOutput(const std::string tensor_name) {
    op_proto_.add_outputs()->set_name(tensor_name);
    tensor_map_[tensor_name] =
        std::make_shared<lmspark::LsTensor>(tensor_name);
  }

  std::unique_ptr<lmspark::LsOperator> CreateOp() {
    auto op = lmspark::OpFactory::getInstance().GetOperator(
        {op_proto_.op_type(), lmspark::DeviceType::CPU})();
    op->SetGenerateContext(&gen_ctx_);
    return op;
  }

  lmspark::LsStatus InitOp(lmspark::LsOperator* op) {
    return op->Init(op_proto_, *device_context_, weight_map_, &tensor_map_);
  }

  // Init, Reshape and Forward of a fresh operator
  lmspark::LsStatus RunOp() {
    op_ = CreateOp();
    lmspark::LsStatus status = InitOp(op_.get());
    if (status != lmspark::LsStatus::LMSPARK_SUCCESS) return status;
    return StepOp();
  }

  // Reshape and Forward of the operator created by RunOp
  lmspark::LsStatus StepOp() {
    lmspark::LsStatus status = op_->Reshape();
    if (status != lmspark::LsStatus::LMSPARK_SUCCESS) return status;
    status = op_->Forward();
    device_context_->Synchronize();
    return status;
  }

  template <typename T>
  std::vector<T> GetOutput(const std::string tensor_name) {
    return lmspark::TensorUtils::ToStdVector<T>(*tensor_map_.at(tensor_name));
  }

  lmspark::OperatorProto& GetOpProto() { return op_proto_; }

  lmspark::TensorMap& GetWeightMap() { return weight_map_; }

  lmspark::TensorMap& GetTensorMap() { return tensor_map_; }

  std::shared_ptr<lmspark::CPUContext>& GetDeviceContext() {
    return device_context_;
  }

 public:
  lmspark::OperatorProto op_proto_;
  std::shared_ptr<lmspark::CPUContext> device_context_ = nullptr;
  lmspark::GenerateContext gen_ctx_;
  std::unique_ptr<lmspark::LsOperator> op_;

  lmspark::TensorMap weight_map_;
  lmspark::TensorMap tensor_map_;
};

}  // namespace LS_UTEST
