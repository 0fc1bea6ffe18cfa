/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    embedding_op.cpp
 */

#include "embedding_op.h"  // NOLINT

#include <core/kernel/kernel.h>
#include <device/cpu/cpu_context.h>
#include <utility/datatype_dispatcher.h>

#include <utility>

namespace lmspark {
LsStatus cpu_embedding(DataType dtype, void* out, const void* ids,
                       const void* table, int64_t num_tokens, int width,
                       float scale, const DeviceContext* ctx) {
  DLOG(INFO) << "cpu_embedding";
  auto functor = [&]<typename T>() {
    T* typed_out = static_cast<T*>(out);
    const int64_t* typed_ids = static_cast<const int64_t*>(ids);
    const T* typed_table = static_cast<const T*>(table);
    cpu::EmbeddingKernelLauncher(typed_out, typed_ids, typed_table,
                                 num_tokens, width, scale);
  };
  DispatchCPU(dtype, functor);
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus EmbeddingOp::Init(const OperatorProto& op_proto,
                           const DeviceContext& ctx,
                           const TensorMap& weights_map,
                           TensorMap* tensor_map) {
  LS_CHECK_STATUS(LsOperator::Init(op_proto, ctx, weights_map, tensor_map));
  auto& attr_map = op_proto.attr();
  if (attr_map.find("scale") != attr_map.end()) {
    scale_ = *(float*)(attr_map.at("scale").c_str());
  }
  // check weight
  if (weights_.size() != 1 or weights_[0]->GetShape().Size() != 2) {
    LOG(ERROR) << "EmbeddingOp has 1 weight [table] of rank 2";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  rows_ = weights_[0]->GetShape()[0];
  width_ = weights_[0]->GetShape()[1];
  // type inference
  DataType dtype = weights_[0]->GetDataType();
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetDataType(dtype));
  // kernel choose
  DeviceType backend = ctx.GetDeviceType();
  switch (backend) {
    case DeviceType::CPU:
      kernel_launcher = cpu_embedding;
      break;
    default:
      LOG(ERROR) << "Embedding Operator does not support "
                 << DeviceType_Name(backend) << " device type";
      return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus EmbeddingOp::Reshape() {
  const Shape& in_shape = tensor_map_->at(in_names_[0])->GetShape();
  if (in_shape.Size() != 2) {
    LOG(ERROR) << op_name_ << ": ids must be (batch, seq_len), got "
               << in_shape;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  batch_size_ = in_shape[0];
  seq_len_ = in_shape[1];
  Shape out_shape({batch_size_, seq_len_, width_});
  LS_CHECK_STATUS(
      tensor_map_->at(out_names_[0])->SetShape(std::move(out_shape)));
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus EmbeddingOp::Forward() {
  LsTensor* ids_tensor = tensor_map_->at(in_names_[0]).get();
  if (ids_tensor->GetDataType() != DataType::INT64) {
    LOG(ERROR) << op_name_ << ": ids must be INT64, got "
               << DataType_Name(ids_tensor->GetDataType());
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  int64_t num_tokens = static_cast<int64_t>(batch_size_) * seq_len_;
  const int64_t* ids = static_cast<const int64_t*>(ids_tensor->GetDataPtr());
  for (int64_t i = 0; i < num_tokens; i++) {
    if (ids[i] < 0 or ids[i] >= rows_) {
      LOG(ERROR) << op_name_ << ": id " << ids[i] << " at " << i
                 << " outside table of " << rows_ << " rows";
      return LsStatus::LMSPARK_EXCEED_LIMIT_ERROR;
    }
  }
  void* out = tensor_map_->at(out_names_[0])->GetDataPtr();
  return kernel_launcher(weights_[0]->GetDataType(), out, ids,
                         weights_[0]->GetDataPtr(), num_tokens, width_, scale_,
                         ctx_);
}

REGISTER_OP(Embedding, CPU, EmbeddingOp)
}  // namespace lmspark
