/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    gemm_op_cpu.h
 */

#pragma once
#include <core/operator/operator.h>

#include "gemm_op.h"

namespace lmspark {
class GemmOpCPU : public GemmOpBase {
 public:
  GemmOpCPU(const std::string& op_type = "") : GemmOpBase(op_type) {}

  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape() override;
  LsStatus Forward() override;
};
}  // namespace lmspark
