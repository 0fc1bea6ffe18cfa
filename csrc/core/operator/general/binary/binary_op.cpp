/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    binary_op.cpp
 */

#include "binary_op.h"  // NOLINT

#include <device/cpu/cpu_context.h>

#include <utility>
using dnnl::memory;

namespace lmspark {
LsStatus BinaryOp::Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                        const TensorMap& weights_map, TensorMap* tensor_map) {
  LS_CHECK_STATUS(LsOperator::Init(op_proto, ctx, weights_map, tensor_map));
  if (in_names_.size() != 2) {
    LOG(ERROR) << "BinaryOp : needs 2 inputs, got " << in_names_.size();
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  // type inference
  DataType dtype = tensor_map_->at(in_names_[0])->GetDataType();
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetDataType(dtype));
  // attr
  auto& attr_map = op_proto.attr();
  if (attr_map.find("binary_type") == attr_map.end()) {
    LOG(ERROR) << "BinaryOp : can't find binary_type attribute.";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  binary_type_ = *(BinaryType*)(attr_map.at("binary_type").c_str());
  DeviceType backend = ctx.GetDeviceType();
  switch (backend) {
    case DeviceType::CPU: {
      dnnl_op_ctx_ = std::make_unique<DNNLOpContext>();
      auto& algo_map = DNNLOpContext::binary_algo_map_;
      if (algo_map.find(binary_type_) == algo_map.end()) {
        LOG(ERROR) << "Unsupported binary type:"
                   << BinaryType_Name(binary_type_);
        return LsStatus::LMSPARK_PARAM_ERROR;
      }
      dnnl_op_ctx_->algo_ = algo_map[binary_type_];
      dnnl_op_ctx_->pr_fwd_.resize(1);
      dnnl_op_ctx_->ins_.resize(2);
      dnnl_op_ctx_->outs_.resize(1);
      break;
    }
    default:
      LOG(ERROR) << "Binary Operator does not support "
                 << DeviceType_Name(backend) << " device type";
      return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus BinaryOp::Reshape() {
  Shape out_shape = tensor_map_->at(in_names_[0])->GetShape();
  const Shape& y_shape = tensor_map_->at(in_names_[1])->GetShape();
  if (!(out_shape == y_shape)) {
    LOG(ERROR) << op_name_ << ": shape mismatch " << out_shape << " vs "
               << y_shape;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  const int64_t count = out_shape.Count();
  LS_CHECK_STATUS(
      tensor_map_->at(out_names_[0])->SetShape(std::move(out_shape)));
  auto eng = DNNLEngine::GetInstance().GetEngine();
  memory::desc data_desc({count}, memory::data_type::f32,
                         memory::format_tag::x);
  dnnl_op_ctx_->ins_[0] = std::make_unique<memory>(data_desc, eng, nullptr);
  dnnl_op_ctx_->ins_[1] = std::make_unique<memory>(data_desc, eng, nullptr);
  dnnl_op_ctx_->outs_[0] = std::make_unique<memory>(data_desc, eng, nullptr);
  dnnl_op_ctx_->pr_fwd_[0] =
      std::make_unique<dnnl::binary>(dnnl::binary::primitive_desc{
          eng, dnnl_op_ctx_->algo_, data_desc, data_desc, data_desc});
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus BinaryOp::Forward() {
  LsTensor* x_tensor = tensor_map_->at(in_names_[0]).get();
  LsTensor* y_tensor = tensor_map_->at(in_names_[1]).get();
  LsTensor* z_tensor = tensor_map_->at(out_names_[0]).get();
  if (x_tensor->GetShape().Count() == 0) {
    return LsStatus::LMSPARK_SUCCESS;
  }
  dnnl::memory& in0_mem = *(dnnl_op_ctx_->ins_[0]);
  dnnl::memory& in1_mem = *(dnnl_op_ctx_->ins_[1]);
  dnnl::memory& out_mem = *(dnnl_op_ctx_->outs_[0]);
  const CPUContext* cpu_ctx = static_cast<const CPUContext*>(ctx_);
  in0_mem.set_data_handle(x_tensor->GetDataPtr());
  in1_mem.set_data_handle(y_tensor->GetDataPtr());
  out_mem.set_data_handle(z_tensor->GetDataPtr());
  std::unordered_map<int, memory> args{{DNNL_ARG_SRC_0, in0_mem},
                                       {DNNL_ARG_SRC_1, in1_mem},
                                       {DNNL_ARG_DST, out_mem}};
  dnnl::stream stream = cpu_ctx->GetStream();
  dnnl_op_ctx_->pr_fwd_[0]->execute(stream, args);
  stream.wait();
  return LsStatus::LMSPARK_SUCCESS;
}

REGISTER_OP(Binary, CPU, BinaryOp)
}  // namespace lmspark
