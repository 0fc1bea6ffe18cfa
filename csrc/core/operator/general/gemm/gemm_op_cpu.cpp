/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    gemm_op_cpu.cpp
 */

#include "gemm_op_cpu.h"  // NOLINT

#include <core/kernel/kernel.h>
#include <device/cpu/cpu_context.h>
#include <utility/datatype_dispatcher.h>

namespace lmspark {

LsStatus GemmOpCPU::Init(const OperatorProto& op_proto,
                         const DeviceContext& ctx, const TensorMap& weights_map,
                         TensorMap* tensor_map) {
  LS_CHECK_STATUS(GemmOpBase::Init(op_proto, ctx, weights_map, tensor_map));
  if (ctx.GetDeviceType() != DeviceType::CPU) {
    LOG(ERROR) << "GemmOpCPU does not support "
               << DeviceType_Name(ctx.GetDeviceType()) << " device type";
    return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus GemmOpCPU::Reshape() { return GemmOpBase::Reshape(n_); }

LsStatus GemmOpCPU::Forward() {
  LsTensor* in_tensor = tensor_map_->at(in_names_[0]).get();
  void* in = in_tensor->GetDataPtr();
  void* out = tensor_map_->at(out_names_[0])->GetDataPtr();
  void* bias = (weights_.size() == 2) ? weights_[1]->GetDataPtr() : nullptr;
  auto functor = [&]<typename T>() {
    cpu::GemmWraper<T>(static_cast<T*>(out), static_cast<const T*>(in),
                       static_cast<const T*>(weights_[0]->GetDataPtr()),
                       static_cast<const T*>(bias), m_, n_, k_, false, transB_,
                       lda_, ldb_, ldc_, alpha_, 0.0f);
  };
  DispatchCPU(dtype_, functor);
  return LsStatus::LMSPARK_SUCCESS;
}

REGISTER_OP(Gemm, CPU, GemmOpCPU)
}  // namespace lmspark
