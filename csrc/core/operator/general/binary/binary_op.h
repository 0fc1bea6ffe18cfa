/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    binary_op.h
 */

#pragma once

#include <core/operator/operator.h>

#include <dnnl.hpp>

namespace lmspark {

// elementwise z = x (op) y over two tensors of the same shape
class BinaryOp : public LsOperator {
 public:
  explicit BinaryOp(const std::string& op_type = "") : LsOperator(op_type) {}
  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape() override;
  LsStatus Forward() override;

 private:
  BinaryType binary_type_ = BINARYTYPE_UNDEFINED;
};

}  // namespace lmspark
