/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    model.cpp
 */

#include "model.h"  // NOLINT

#include <utility>

namespace lmspark {

LsModel::LsModel(const std::string& model_type)
    : model_type_(model_type), ctx_(nullptr) {}

LsStatus LsModel::Init(const GraphProto& graph, const DeviceContext& ctx,
                       const TensorMap& weights) {
  DLOG(INFO) << "LsModel::Init()";
  ctx_ = &ctx;
  DeviceType device_type = ctx.GetDeviceType();
  topo_ops_.clear();
  tensors_.clear();
  input_names_.clear();
  output_names_.clear();
  weights_ = weights;

  // parse io tensor
  for (auto& t : graph.inputs()) {
    tensors_.insert(
        std::make_pair(t.name(), std::make_shared<LsTensor>(t, device_type)));
    input_names_.emplace_back(t.name());
  }
  for (auto& t : graph.outputs()) {
    tensors_.insert(
        std::make_pair(t.name(), std::make_shared<LsTensor>(t, device_type)));
    output_names_.emplace_back(t.name());
  }

  for (auto& op_proto : graph.ops()) {
    OpRegistType op_type(op_proto.op_type(), device_type);
    std::unique_ptr<LsOperator> op;
    try {
      op = OpFactory::getInstance().GetOperator(op_type)();
    } catch (LsException& e) {
      LOG(ERROR) << "LsModel::Init: " << op_proto.op_name() << " "
                 << e.what();
      return LsStatus::LMSPARK_PARAM_ERROR;
    }
    LsStatus status;
    LS_CHECK_EXCEPTION(status = op->Init(op_proto, ctx, weights_, &tensors_));
    if (status != LsStatus::LMSPARK_SUCCESS) {
      LOG(ERROR) << "LsModel::Init: init of " << op_proto.op_type() << " "
                 << op_proto.op_name() << " failed";
      return status;
    }
    topo_ops_.emplace_back(std::move(op));
  }
  DLOG(INFO) << model_type_ << ": " << topo_ops_.size() << " ops, "
             << tensors_.size() << " tensors";
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LsModel::RunGraph(GenerateContext* gen_ctx) {
  for (auto& op : topo_ops_) {
    op->SetGenerateContext(gen_ctx);
    LS_CHECK_STATUS_DO(op->CallReshape(),
                       LOG(ERROR) << "Reshape of " << op->GetOpName()
                                  << " failed");
    LS_CHECK_STATUS_DO(op->CallForward(),
                       LOG(ERROR) << "Forward of " << op->GetOpName()
                                  << " failed");
  }
  ctx_->Synchronize();
  return LsStatus::LMSPARK_SUCCESS;
}

LsTensor* LsModel::GetTensor(const std::string& name) const {
  auto it = tensors_.find(name);
  return it == tensors_.end() ? nullptr : it->second.get();
}

}  // namespace lmspark
