/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    embedding_op.h
 */

#pragma once

#include <core/operator/operator.h>

namespace lmspark {

/* @brief: table lookup
 * inputs:
      ids: (batch, seq_len) int64
 * weights:
      table: (rows, width)
 * attr:
      scale: float, default 1
 * outputs:
      out: (batch, seq_len, width) = table[ids] * scale
 */
class EmbeddingOp : public LsOperator {
 public:
  explicit EmbeddingOp(const std::string& op_type = "")
      : LsOperator(op_type),
        width_(768),
        rows_(0),
        batch_size_(1),
        seq_len_(1),
        scale_(1.f) {}
  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape() override;
  LsStatus Forward() override;

 private:
  int width_;
  int64_t rows_;
  int batch_size_;
  int seq_len_;
  float scale_;
  LsStatus (*kernel_launcher)(DataType dtype, void* out, const void* ids,
                              const void* table, int64_t num_tokens, int width,
                              float scale, const DeviceContext* ctx) = nullptr;
};
}  // namespace lmspark
