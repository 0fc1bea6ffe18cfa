/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt_mha_op.h
 */

#pragma once

#include <core/operator/operator.h>

#include <memory>
#include <vector>

namespace lmspark {

/* @brief: causal self attention of one OPT decoder layer
 * inputs:
      qvk: (batch, seq_len, 3 * hidden_size), column (h * size_per_head + d)
           * 3 + j holds query (j = 0), value (j = 1), key (j = 2)
 * outputs:
      context: (batch, seq_len, hidden_size)
      probs: (batch, num_heads, seq_len, kv_len), optional second output,
             written when output_attentions is requested for the step
 * Without a cache kv_len is seq_len. With a cache, keys and values are
 * appended to the layer slot at its cursor and kv_len is the cache length.
 */
class OptMHAOp : public LsOperator {
 public:
  explicit OptMHAOp(const std::string& op_type = "")
      : LsOperator(op_type),
        batch_size_(1),
        seq_len_(1),
        hidden_size_(768),
        num_heads_(12),
        size_per_head_(64),
        layer_index_(0),
        kv_cap_(0),
        alpha_(-1.0f),
        output_attentions_(false) {}
  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape() override;
  LsStatus Forward() override;

 private:
  bool WriteProbs() const;

  DataType dtype_ = DATATYPE_UNDEFINED;
  int batch_size_;
  int seq_len_;
  int hidden_size_;
  int num_heads_;
  int size_per_head_;
  int layer_index_;
  int kv_cap_;
  float alpha_;
  bool output_attentions_;
  void (*kernel_launcher)(DataType dtype, void* out, void* probs,
                          const void* qvk, void* query, void* key, void* value,
                          const int* past_len, int batch_size, int seq_len,
                          int num_heads, int size_per_head, int kv_cap,
                          float alpha, const DeviceContext* ctx) = nullptr;
  std::unique_ptr<LsTensor> query_;
  // key / value workspace of the no-cache path
  std::unique_ptr<LsTensor> k_buf_;
  std::unique_ptr<LsTensor> v_buf_;
  std::vector<int> zero_past_;
};

}  // namespace lmspark
