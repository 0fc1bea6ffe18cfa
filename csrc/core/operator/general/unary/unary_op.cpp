/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    unary_op.cpp
 */

#include "unary_op.h"  // NOLINT

#include <device/cpu/cpu_context.h>

#include <utility>
using dnnl::memory;

namespace lmspark {
LsStatus UnaryOp::Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                       const TensorMap& weights_map, TensorMap* tensor_map) {
  LS_CHECK_STATUS(LsOperator::Init(op_proto, ctx, weights_map, tensor_map));
  // type inference
  DataType dtype = tensor_map_->at(in_names_[0])->GetDataType();
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetDataType(dtype));
  // attr
  auto& attr_map = op_proto.attr();
  if (attr_map.find("unary_type") == attr_map.end()) {
    LOG(ERROR) << "UnaryOp : can't find unary_type attribute.";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  unary_type_ = *(UnaryType*)(attr_map.at("unary_type").c_str());
  DeviceType backend = ctx.GetDeviceType();
  switch (backend) {
    case DeviceType::CPU: {
      dnnl_op_ctx_ = std::make_unique<DNNLOpContext>();
      auto& algo_map = DNNLOpContext::unary_algo_map_;
      if (algo_map.find(unary_type_) == algo_map.end()) {
        LOG(ERROR) << "Unsupported unary type:" << UnaryType_Name(unary_type_);
        return LsStatus::LMSPARK_PARAM_ERROR;
      }
      dnnl_op_ctx_->algo_ = algo_map[unary_type_];
      dnnl_op_ctx_->pr_fwd_.resize(1);
      dnnl_op_ctx_->ins_.resize(1);
      dnnl_op_ctx_->outs_.resize(1);
      break;
    }
    default:
      LOG(ERROR) << "Unary Operator does not support "
                 << DeviceType_Name(backend) << " device type";
      return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus UnaryOp::Reshape() {
  Shape out_shape = tensor_map_->at(in_names_[0])->GetShape();
  const int64_t count = out_shape.Count();
  LS_CHECK_STATUS(
      tensor_map_->at(out_names_[0])->SetShape(std::move(out_shape)));
  auto eng = DNNLEngine::GetInstance().GetEngine();
  memory::desc data_desc({count}, memory::data_type::f32,
                         memory::format_tag::x);
  dnnl_op_ctx_->ins_[0] = std::make_unique<memory>(data_desc, eng, nullptr);
  dnnl_op_ctx_->outs_[0] = std::make_unique<memory>(data_desc, eng, nullptr);
  // swish is x * sigmoid(alpha * x)
  const float alpha = unary_type_ == UnaryType::SILU ? 1.f : 0.f;
  dnnl_op_ctx_->pr_fwd_[0] = std::make_unique<dnnl::eltwise_forward>(
      dnnl::eltwise_forward::primitive_desc{
          eng, dnnl::prop_kind::forward_inference, dnnl_op_ctx_->algo_,
          data_desc, data_desc, alpha, 0.f});
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus UnaryOp::Forward() {
  LsTensor* x_tensor = tensor_map_->at(in_names_[0]).get();
  LsTensor* y_tensor = tensor_map_->at(out_names_[0]).get();
  if (x_tensor->GetShape().Count() == 0) {
    return LsStatus::LMSPARK_SUCCESS;
  }
  dnnl::memory& in_mem = *(dnnl_op_ctx_->ins_[0]);
  dnnl::memory& out_mem = *(dnnl_op_ctx_->outs_[0]);
  const CPUContext* cpu_ctx = static_cast<const CPUContext*>(ctx_);
  in_mem.set_data_handle(x_tensor->GetDataPtr());
  out_mem.set_data_handle(y_tensor->GetDataPtr());
  std::unordered_map<int, memory> args{{DNNL_ARG_SRC, in_mem},
                                       {DNNL_ARG_DST, out_mem}};
  dnnl::stream stream = cpu_ctx->GetStream();
  dnnl_op_ctx_->pr_fwd_[0]->execute(stream, args);
  stream.wait();
  return LsStatus::LMSPARK_SUCCESS;
}

REGISTER_OP(Unary, CPU, UnaryOp)
}  // namespace lmspark
