/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    unary_op.h
 */

#pragma once

#include <core/operator/operator.h>

#include <dnnl.hpp>

namespace lmspark {

class UnaryOp : public LsOperator {
 public:
  explicit UnaryOp(const std::string& op_type = "") : LsOperator(op_type) {}
  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape() override;
  LsStatus Forward() override;

 private:
  UnaryType unary_type_ = UNARYTYPE_UNDEFINED;
};

}  // namespace lmspark
