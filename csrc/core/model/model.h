/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    model.h
 */

#pragma once

#include <common/common.h>
#include <common/generate_context.h>
#include <core/operator/operator.h>
#include <core/tensor/tensor.h>

#include <memory>
#include <string>
#include <vector>

namespace lmspark {

/*!
 * @brief Operator graph runner. Operators are created through OpFactory in
 * graph order and share the tensor map of the model. The weights passed to
 * Init are kept by the model, operators hold raw pointers into them.
 */
class LsModel {
 public:
  explicit LsModel(const std::string& model_type = "");
  virtual ~LsModel() = default;

  virtual LsStatus Init(const GraphProto& graph, const DeviceContext& ctx,
                        const TensorMap& weights);
  // Reshape then Forward of every operator, in graph order
  LsStatus RunGraph(GenerateContext* gen_ctx);

  // nullptr when the model has no tensor of that name
  LsTensor* GetTensor(const std::string& name) const;
  const std::string& GetModelType() const { return model_type_; }
  const std::vector<std::unique_ptr<LsOperator>>& GetTopoOps() const {
    return topo_ops_;
  }

 protected:
  std::string model_type_;
  std::vector<std::unique_ptr<LsOperator>> topo_ops_;
  TensorMap tensors_;
  // parameters bound by the operators, held for the lifetime of the model
  TensorMap weights_;
  std::vector<std::string> input_names_;
  std::vector<std::string> output_names_;
  const DeviceContext* ctx_;
};

}  // namespace lmspark
