/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    operator.h
 */

#pragma once

#include <common/device_context.h>
#include <common/generate_context.h>
#include <core/tensor/tensor.h>

#include <dnnl.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lmspark {

struct DNNLOpContext {
  std::vector<std::unique_ptr<dnnl::primitive>> pr_fwd_;
  std::vector<std::unique_ptr<dnnl::memory>> ins_;
  std::vector<std::unique_ptr<dnnl::memory>> outs_;
  dnnl::algorithm algo_;
  static std::map<UnaryType, dnnl::algorithm> unary_algo_map_;
  static std::map<BinaryType, dnnl::algorithm> binary_algo_map_;
};

/*!
 * @brief Operator base class
 */
class LsOperator {
 public:
  explicit LsOperator(const std::string& op_type = "");
  virtual ~LsOperator() = default;

  virtual LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                        const TensorMap& weights_map, TensorMap* tensor_map);
  virtual LsStatus Reshape();
  virtual LsStatus Forward();

  // model entry points, exceptions thrown by kernels become a status
  LsStatus CallReshape();
  LsStatus CallForward();

  void SetGenerateContext(GenerateContext* gen_ctx) { gen_ctx_ = gen_ctx; }
  void Synchronize();
  std::vector<std::string> GetInNames();
  std::vector<std::string> GetOutNames();
  TensorMap GetWeights();
  std::string GetOpType();
  std::string GetOpName() { return op_name_; }
  int GetStage() const { return stage_; }

 protected:
  std::string op_type_;
  std::string op_name_;
  std::vector<std::string> in_names_;
  std::vector<std::string> out_names_;
  std::vector<LsTensor*> weights_;
  TensorMap* tensor_map_;
  const DeviceContext* ctx_;
  GenerateContext* gen_ctx_;
  std::unique_ptr<DNNLOpContext> dnnl_op_ctx_;
  int stage_ = -1;
};

/*!
 * @brief Operator regist type class
 */
class OpRegistType {
 public:
  std::string op_type_str;
  DeviceType device_type;
  OpRegistType(std::string op_type_str, DeviceType device_type)
      : op_type_str(op_type_str), device_type(device_type) {}

  bool operator==(const OpRegistType& p) const {
    return op_type_str == p.op_type_str && device_type == p.device_type;
  }
};

class OpRegistTypeHashFunction {
 public:
  size_t operator()(const OpRegistType& p) const {
    size_t seed = 0;
    seed = std::hash<std::string>{}(p.op_type_str) + 0x9e3779b9 + (seed << 6) +
           (seed >> 2);
    seed = std::hash<int>{}(p.device_type) + 0x9e3779b9 + (seed << 6) +
           (seed >> 2);
    return seed;
  }
};

using OpConstructor = std::function<std::unique_ptr<LsOperator>()>;
using OpMap =
    std::unordered_map<OpRegistType, OpConstructor, OpRegistTypeHashFunction>;

/*!
 * @brief Operator factory class
 */
class OpFactory {
 public:
  static OpFactory& getInstance();
  OpConstructor GetOperator(const OpRegistType& op_reg_type);
  void Register(const OpRegistType& op_reg_type, OpConstructor op_constructor);

 private:
  OpFactory() = default;
  OpFactory(const OpFactory&) = delete;
  OpFactory(OpFactory&&) = delete;
  OpMap op_set_;
};

/*!
 * @brief Operator reflector class
 */
class OpRegisterHelper {
 public:
  OpRegisterHelper(const OpRegistType& op_reg_type,
                   OpConstructor op_constructor) {
    OpFactory::getInstance().Register(op_reg_type, op_constructor);
  }
};

#define REGISTER_OP(op_name, device_type, typed_class)                       \
  static OpRegisterHelper op_name##_##typed_class##Register##_##device_type( \
      OpRegistType(#op_name, DeviceType::device_type),                       \
      []() -> std::unique_ptr<LsOperator> {                                  \
        return std::make_unique<typed_class>(#op_name);                      \
      });

}  // namespace lmspark
