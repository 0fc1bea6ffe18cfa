/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    gemm_op.h
 */

#pragma once
#include <core/operator/operator.h>

namespace lmspark {
/*!
 * @brief y = alpha * x @ w + bias
   x: (..., k), w: (k, n), or (n, k) with transB
   bias: (n), optional second weight
 */
class GemmOpBase : public LsOperator {
 public:
  explicit GemmOpBase(const std::string& op_type = "")
      : LsOperator(op_type),
        m_(0),
        n_(0),
        k_(0),
        transB_(false),
        lda_(0),
        ldb_(0),
        ldc_(0),
        alpha_(1.0f) {}
  LsStatus Init(const OperatorProto& op_proto, const DeviceContext& ctx,
                const TensorMap& weights_map, TensorMap* tensor_map) override;
  LsStatus Reshape(int yn);

 protected:
  int64_t m_;
  int64_t n_;
  int64_t k_;
  bool transB_;
  int lda_;
  int ldb_;
  int ldc_;
  float alpha_;
  DataType dtype_ = DATATYPE_UNDEFINED;
};
}  // namespace lmspark
