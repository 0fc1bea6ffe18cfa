/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    layernorm_op.cpp
 */

#include "layernorm_op.h"  // NOLINT

#include <core/kernel/kernel.h>
#include <device/cpu/cpu_context.h>
#include <utility/datatype_dispatcher.h>
namespace lmspark {

LsStatus cpu_layernorm(DataType dtype, void* out, const void* input,
                       const void* bias, const void* gamma, const void* beta,
                       int m, int n, float eps, const DeviceContext* ctx) {
  DLOG(INFO) << "cpu_layernorm";
  auto functor = [&]<typename T>() {
    T* typed_out = static_cast<T*>(out);
    const T* typed_input = static_cast<const T*>(input);
    const T* typed_bias = static_cast<const T*>(bias);
    const T* typed_gamma = static_cast<const T*>(gamma);
    const T* typed_beta = static_cast<const T*>(beta);
    cpu::LayerNormKernel(typed_out, typed_input, typed_bias, typed_gamma,
                         typed_beta, m, n, eps);
  };
  DispatchCPU(dtype, functor);
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LayerNormOp::Init(const OperatorProto& op_proto,
                           const DeviceContext& ctx,
                           const TensorMap& weights_map,
                           TensorMap* tensor_map) {
  LS_CHECK_STATUS(LsOperator::Init(op_proto, ctx, weights_map, tensor_map));
  // check weight
  if (weights_.size() != 2) {
    LOG(ERROR) << "LayerNormOp has 2 weights [gamma], [beta]";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (weights_[0]->GetShape() != weights_[1]->GetShape() or
      weights_[0]->GetShape().Size() != 1) {
    LOG(ERROR) << "LayerNormOp : Invalid weight shape.";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  hidden_size_ = weights_[0]->GetShape()[0];
  // type inference
  DataType dtype = weights_[0]->GetDataType();
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetDataType(dtype));
  // attr
  auto& attr_map = op_proto.attr();
  if (attr_map.find("eps") == attr_map.end()) {
    LOG(ERROR) << "LayerNormOp : can't find eps attribute.";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  eps_ = *(float*)(attr_map.at("eps").c_str());
  DeviceType backend = ctx.GetDeviceType();
  switch (backend) {
    case DeviceType::CPU:
      kernel_launcher = cpu_layernorm;
      break;
    default:
      LOG(ERROR) << "LayerNorm Operator does not support "
                 << DeviceType_Name(backend) << " device type";
      return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LayerNormOp::Reshape() {
  Shape out_shape = tensor_map_->at(in_names_[0])->GetShape();
  if (out_shape.Size() == 0 or out_shape[out_shape.Size() - 1] != hidden_size_) {
    LOG(ERROR) << op_name_ << ": input " << out_shape
               << " does not end with hidden size " << hidden_size_;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  LS_CHECK_STATUS(
      tensor_map_->at(out_names_[0])->SetShape(std::move(out_shape)));
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LayerNormOp::Forward() {
  LsTensor* in_tensor = tensor_map_->at(in_names_[0]).get();
  void* in = in_tensor->GetDataPtr();
  void* out = tensor_map_->at(out_names_[0])->GetDataPtr();
  int64_t m = in_tensor->GetShape().Count() / hidden_size_;
  return kernel_launcher(in_tensor->GetDataType(), out, in, nullptr,
                         weights_[0]->GetDataPtr(), weights_[1]->GetDataPtr(),
                         m, hidden_size_, eps_, ctx_);
}

REGISTER_OP(LayerNorm, CPU, LayerNormOp)
}  // namespace lmspark
