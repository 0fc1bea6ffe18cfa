/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt_mha_op.cpp
 */

#include "opt_mha_op.h"  // NOLINT

#include <core/kernel/kernel.h>
#include <device/cpu/cpu_context.h>
#include <runtime/cache/attention_cache.h>
#include <utility/datatype_dispatcher.h>

#include <cmath>
#include <utility>

namespace lmspark {

void cpu_opt_mha(DataType dtype, void* out, void* probs, const void* qvk,
                 void* query, void* key, void* value, const int* past_len,
                 int batch_size, int seq_len, int num_heads, int size_per_head,
                 int kv_cap, float alpha, const DeviceContext* ctx) {
  DLOG(INFO) << "cpu_opt_mha";
  auto functor = [&]<typename T>() {
    cpu::SplitQVKLauncher((const T*)qvk, (T*)query, (T*)key, (T*)value,
                          past_len, batch_size, seq_len, num_heads,
                          size_per_head, kv_cap);
    cpu::CausalAttentionKernel((T*)out, (T*)probs, (const T*)query,
                               (const T*)key, (const T*)value, past_len,
                               batch_size, seq_len, num_heads, size_per_head,
                               kv_cap, alpha);
  };
  DispatchCPU(dtype, functor);
}

LsStatus OptMHAOp::Init(const OperatorProto& op_proto,
                        const DeviceContext& ctx, const TensorMap& weights_map,
                        TensorMap* tensor_map) {
  LS_CHECK_STATUS(LsOperator::Init(op_proto, ctx, weights_map, tensor_map));
  // type inference
  dtype_ = tensor_map_->at(in_names_[0])->GetDataType();
  for (auto& name : out_names_) {
    LS_CHECK_STATUS(tensor_map_->at(name)->SetDataType(dtype_));
  }
  // attr
  auto& attr_map = op_proto.attr();
  if (attr_map.find("num_heads") == attr_map.end()) {
    LOG(ERROR) << "OptMHAOp : can't find num_heads attribute.";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  num_heads_ = *(int*)(attr_map.at("num_heads").c_str());
  if (attr_map.find("layer_index") != attr_map.end()) {
    layer_index_ = *(int*)(attr_map.at("layer_index").c_str());
  }
  if (attr_map.find("output_attentions") != attr_map.end()) {
    output_attentions_ = *(bool*)(attr_map.at("output_attentions").c_str());
  }
  if (num_heads_ <= 0) {
    LOG(ERROR) << "OptMHAOp : num_heads must be positive, got " << num_heads_;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (output_attentions_ and out_names_.size() < 2) {
    LOG(ERROR) << "OptMHAOp : output_attentions needs a second output";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  DeviceType backend = ctx.GetDeviceType();
  switch (backend) {
    case DeviceType::CPU:
      kernel_launcher = cpu_opt_mha;
      break;
    default:
      LOG(ERROR) << "OptMHA Operator does not support "
                 << DeviceType_Name(backend) << " device type";
      return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
  query_ = std::make_unique<LsTensor>(op_name_ + ".query", backend, dtype_);
  k_buf_ = std::make_unique<LsTensor>(op_name_ + ".key", backend, dtype_);
  v_buf_ = std::make_unique<LsTensor>(op_name_ + ".value", backend, dtype_);
  return LsStatus::LMSPARK_SUCCESS;
}

bool OptMHAOp::WriteProbs() const {
  return output_attentions_ and gen_ctx_ != nullptr and
         gen_ctx_->output_attentions;
}

LsStatus OptMHAOp::Reshape() {
  const Shape& x_shape = tensor_map_->at(in_names_[0])->GetShape();
  if (x_shape.Size() != 3 or x_shape[2] % (3 * num_heads_) != 0) {
    LOG(ERROR) << op_name_ << ": qvk shape " << x_shape
               << " does not split into 3 x " << num_heads_ << " heads";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  batch_size_ = x_shape[0];
  seq_len_ = x_shape[1];
  hidden_size_ = x_shape[2] / 3;
  size_per_head_ = hidden_size_ / num_heads_;
  alpha_ = 1.0f / std::sqrt(static_cast<float>(size_per_head_));

  AttentionCache* cache = gen_ctx_ != nullptr ? gen_ctx_->cache : nullptr;
  if (cache != nullptr) {
    if (cache->BatchSize() != batch_size_ or
        cache->NumHeads() != num_heads_ or
        cache->SizePerHead() != size_per_head_ or
        layer_index_ >= cache->NumLayers()) {
      LOG(ERROR) << op_name_ << ": cache geometry (batch "
                 << cache->BatchSize() << ", heads " << cache->NumHeads()
                 << ", head_dim " << cache->SizePerHead() << ", layers "
                 << cache->NumLayers() << ") does not fit layer "
                 << layer_index_ << " with input " << x_shape;
      return LsStatus::LMSPARK_PARAM_ERROR;
    }
    kv_cap_ = cache->MaxLength();
  } else {
    kv_cap_ = seq_len_;
    Shape kv_shape({batch_size_, seq_len_, num_heads_, size_per_head_});
    LS_CHECK_STATUS(k_buf_->SetShape(Shape(kv_shape)));
    LS_CHECK_STATUS(v_buf_->SetShape(std::move(kv_shape)));
    zero_past_.assign(batch_size_, 0);
  }
  LS_CHECK_STATUS(query_->SetShape(
      Shape({batch_size_, seq_len_, num_heads_, size_per_head_})));
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetShape(
      Shape({batch_size_, seq_len_, hidden_size_})));
  if (WriteProbs()) {
    LS_CHECK_STATUS(tensor_map_->at(out_names_[1])->SetShape(
        Shape({batch_size_, num_heads_, seq_len_, kv_cap_})));
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus OptMHAOp::Forward() {
  void* qvk = tensor_map_->at(in_names_[0])->GetDataPtr();
  void* out = tensor_map_->at(out_names_[0])->GetDataPtr();
  void* probs =
      WriteProbs() ? tensor_map_->at(out_names_[1])->GetDataPtr() : nullptr;
  AttentionCache* cache = gen_ctx_ != nullptr ? gen_ctx_->cache : nullptr;
  if (cache == nullptr) {
    kernel_launcher(dtype_, out, probs, qvk, query_->GetDataPtr(),
                    k_buf_->GetDataPtr(), v_buf_->GetDataPtr(),
                    zero_past_.data(), batch_size_, seq_len_, num_heads_,
                    size_per_head_, kv_cap_, alpha_, ctx_);
    return LsStatus::LMSPARK_SUCCESS;
  }
  // nothing is written when the step does not fit
  LS_CHECK_STATUS(cache->CheckCapacity(layer_index_, seq_len_));
  const int* past_len =
      static_cast<const int*>(cache->Index(layer_index_)->GetDataPtr());
  kernel_launcher(dtype_, out, probs, qvk, query_->GetDataPtr(),
                  cache->Key(layer_index_)->GetDataPtr(),
                  cache->Value(layer_index_)->GetDataPtr(), past_len,
                  batch_size_, seq_len_, num_heads_, size_per_head_, kv_cap_,
                  alpha_, ctx_);
  return cache->Advance(layer_index_, seq_len_);
}

REGISTER_OP(OptMHA, CPU, OptMHAOp)
}  // namespace lmspark
