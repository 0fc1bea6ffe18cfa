/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    operator.cpp
 */

#include "operator.h"  // NOLINT


namespace lmspark {

std::map<UnaryType, dnnl::algorithm> DNNLOpContext::unary_algo_map_ = {
    {UnaryType::TANH, dnnl::algorithm::eltwise_tanh},
    {UnaryType::GELU_ERF, dnnl::algorithm::eltwise_gelu_erf},
    {UnaryType::GELU_TANH, dnnl::algorithm::eltwise_gelu_tanh},
    {UnaryType::RELU, dnnl::algorithm::eltwise_relu},
    {UnaryType::SILU, dnnl::algorithm::eltwise_swish},
};
std::map<BinaryType, dnnl::algorithm> DNNLOpContext::binary_algo_map_ = {
    {BinaryType::ADD, dnnl::algorithm::binary_add},
    {BinaryType::MUL, dnnl::algorithm::binary_mul},
};

LsOperator::LsOperator(const std::string& op_type)
    : op_type_(op_type),
      tensor_map_(nullptr),
      ctx_(nullptr),
      gen_ctx_(nullptr) {}

void LsOperator::Synchronize() { ctx_->Synchronize(); }

LsStatus LsOperator::Init(const OperatorProto& op_proto,
                          const DeviceContext& ctx,
                          const TensorMap& weights_map, TensorMap* tensor_map) {
  tensor_map_ = tensor_map;
  op_name_ = op_proto.op_name();
  stage_ = op_proto.stage();
  in_names_.clear();
  out_names_.clear();
  weights_.clear();
  for (auto& t : op_proto.inputs()) {
    const std::string& t_name = t.name();
    if (tensor_map_->count(t_name) == 0) {
      tensor_map_->insert(std::make_pair(
          t_name, std::make_shared<LsTensor>(t, ctx.GetDeviceType())));
    }
    in_names_.emplace_back(t_name);
  }
  for (auto& t : op_proto.outputs()) {
    const std::string& t_name = t.name();
    if (tensor_map_->count(t_name) == 0) {
      tensor_map_->insert(std::make_pair(
          t_name, std::make_shared<LsTensor>(t, ctx.GetDeviceType())));
    }
    out_names_.emplace_back(t_name);
  }
  for (auto& t : op_proto.weights()) {
    const std::string& t_name = t.name();
    if (weights_map.count(t_name) == 0) {
      LOG(ERROR) << op_name_ << ": weight " << t_name << " not found";
      return LsStatus::LMSPARK_PARAM_ERROR;
    }
    weights_.emplace_back(weights_map.at(t_name).get());
  }
  ctx_ = &ctx;
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LsOperator::CallReshape() {
  try {
    return Reshape();
  } catch (LsException& e) {
    LOG(ERROR) << op_name_ << " Reshape failed: " << e.what();
    return LsGetCodeByError(e.what());
  } catch (dnnl::error& e) {
    LOG(ERROR) << op_name_ << " Reshape failed in dnnl: " << e.what();
    LsSaveError(op_name_ + ":" + e.what());
    return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
}

LsStatus LsOperator::CallForward() {
  try {
    return Forward();
  } catch (LsException& e) {
    LOG(ERROR) << op_name_ << " Forward failed: " << e.what();
    return LsGetCodeByError(e.what());
  } catch (dnnl::error& e) {
    LOG(ERROR) << op_name_ << " Forward failed in dnnl: " << e.what();
    LsSaveError(op_name_ + ":" + e.what());
    return LsStatus::LMSPARK_RUNTIME_ERROR;
  }
}

LsStatus LsOperator::Reshape() { return LsStatus::LMSPARK_SUCCESS; }

LsStatus LsOperator::Forward() { return LsStatus::LMSPARK_SUCCESS; }

OpFactory& OpFactory::getInstance() {
  static OpFactory op_factory;
  return op_factory;
}

OpConstructor OpFactory::GetOperator(const OpRegistType& op_reg_type) {
  if (op_set_.find(op_reg_type) == op_set_.end()) {
    LOG(ERROR) << "Unsupported op type: " << op_reg_type.op_type_str;
    throw LsException("LMSPARK_PARAM_ERROR: unsupported op type " +
                      op_reg_type.op_type_str);
  }
  return op_set_[op_reg_type];
}

void OpFactory::Register(const OpRegistType& op_reg_type,
                         OpConstructor op_constructor) {
  op_set_[op_reg_type] = op_constructor;
}

std::vector<std::string> LsOperator::GetInNames() { return in_names_; }

std::vector<std::string> LsOperator::GetOutNames() { return out_names_; }

// for debug only
TensorMap LsOperator::GetWeights() {
  TensorMap ret;
  for (auto& p : weights_) {
    ret[p->GetName()] = std::make_shared<LsTensor>(p->GetName() + ".copy", *p);
  }
  return ret;
}

std::string LsOperator::GetOpType() { return op_type_; }

}  // namespace lmspark
