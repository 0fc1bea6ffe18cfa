/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    gemm_op.cpp
 */

#include "gemm_op.h"  // NOLINT

#include <utility>

namespace lmspark {

LsStatus GemmOpBase::Init(const OperatorProto& op_proto,
                          const DeviceContext& ctx,
                          const TensorMap& weights_map, TensorMap* tensor_map) {
  LS_CHECK_STATUS(LsOperator::Init(op_proto, ctx, weights_map, tensor_map));
  if (weights_.size() != 2 && weights_.size() != 1) {
    LOG(ERROR) << "GemmOpBase has 1~2 weights: [weight], (optional) [bias].";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  auto& attr_map = op_proto.attr();
  if (attr_map.find("transB") != attr_map.end()) {
    transB_ = *(bool*)(attr_map.at("transB").c_str());
  }
  if (attr_map.find("alpha") != attr_map.end()) {
    alpha_ = *(float*)(attr_map.at("alpha").c_str());
  }

  // set k_, n_
  const Shape& w_shape = weights_[0]->GetShape();
  if (w_shape.Size() != 2) {
    LOG(ERROR) << op_name_ << " : Invalid weight shape " << w_shape;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  k_ = transB_ ? w_shape[1] : w_shape[0];
  n_ = transB_ ? w_shape[0] : w_shape[1];
  if (weights_.size() == 2 &&
      (weights_[1]->GetShape().Size() != 1 || weights_[1]->GetShape()[0] != n_)) {
    LOG(ERROR) << op_name_ << " : bias shape " << weights_[1]->GetShape()
               << " does not match n = " << n_;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  lda_ = k_;
  ldb_ = transB_ ? k_ : n_;
  ldc_ = n_;
  dtype_ = weights_[0]->GetDataType();
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetDataType(dtype_));
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus GemmOpBase::Reshape(int yn) {
  const Shape& x_shape = tensor_map_->at(in_names_[0])->GetShape();
  int x_ndims = x_shape.Size();
  if (x_ndims < 1 || x_shape[x_ndims - 1] != k_) {
    LOG(ERROR) << op_name_ << " : input " << x_shape
               << " does not end with k = " << k_;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  Shape y_shape;
  m_ = x_shape.Count(0, x_ndims - 1);
  for (int i = 0; i < x_ndims - 1; ++i) {
    y_shape.Append(x_shape[i]);
  }
  y_shape.Append(yn);
  LS_CHECK_STATUS(tensor_map_->at(out_names_[0])->SetShape(std::move(y_shape)));
  return LsStatus::LMSPARK_SUCCESS;
}
}  // namespace lmspark
