/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    layernorm_op.h
 */

#pragma once

#include <core/operator/operator.h>

namespace lmspark {

class LayerNormOp : public LsOperator {
 public:
  explicit LayerNormOp(const std::string& op_type = "") : LsOperator(op_type) {}
  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape() override;
  LsStatus Forward() override;

 private:
  int hidden_size_ = 768;
  float eps_ = 1e-5f;
  LsStatus (*kernel_launcher)(DataType dtype, void* out, const void* input,
                              const void* bias, const void* gamma,
                              const void* beta, int m, int n, float eps,
                              const DeviceContext* ctx) = nullptr;
};
}  // namespace lmspark
