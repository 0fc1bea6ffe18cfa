/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt.h
 */

#pragma once

#include <core/model/model.h>
#include <runtime/cache/attention_cache.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "opt_config.h"

namespace lmspark {

/*!
 * @brief OPT decoder-only language model.
 * inputs:
      input_ids: (batch, seq_len) INT64
      position_ids: (batch, seq_len) INT64
 * outputs:
      logits: (batch, seq_len, vocab_size)
      hidden_states.{k}: input of layer k, and the last layer output at
                         k = decoder_layers, when requested
      attentions.{i}: (batch, heads, seq_len, kv_len) of layer i, when
                      requested
 */
class OPTModel : public LsModel {
 public:
  explicit OPTModel(const std::string& model_type = "OPT")
      : LsModel(model_type) {}
  using LsModel::Init;

  // params are FLOAT32 tensors keyed by internal name, as produced by
  // LoadParams, and must cover ExpectedParamShapes(config)
  LsStatus Init(const OPTConfig& config, const DeviceContext& ctx,
                const TensorMap& params);

  // cache == nullptr runs the causal no-cache path
  LsStatus Forward(const LsTensor& input_ids, const LsTensor& position_ids,
                   AttentionCache* cache, TensorMap* outputs,
                   bool output_attentions = false,
                   bool output_hidden_states = false);
  LsStatus InferenceStepNoCache(const LsTensor& input_ids, TensorMap* outputs);
  LsStatus InferenceStepWithCache(const LsTensor& input_ids,
                                  AttentionCache* cache, TensorMap* outputs);

  // [begin, end) layer range of every pipeline stage, empty without a plan
  const std::vector<std::pair<int, int>>& StagePlan() const {
    return stage_plan_;
  }
  const OPTConfig& GetConfig() const { return config_; }

  static std::vector<std::pair<int, int>> MakeStagePlan(
      const OPTConfig& config);
  static GraphProto BuildGraph(const OPTConfig& config);

 private:
  LsStatus CheckParams(const TensorMap& params) const;

  OPTConfig config_;
  std::vector<std::pair<int, int>> stage_plan_;
  GenerateContext gen_ctx_;
};

// pos = cumsum(ids != pad) * (ids != pad) + pad, row by row
LsStatus BuildPositionIds(const LsTensor& input_ids, int64_t pad,
                          LsTensor* position_ids);

// zeroed cache of max_target_positions tokens; batch_size <= 0 takes the
// batch size of the config
std::unique_ptr<AttentionCache> BuildInitCache(const OPTConfig& config,
                                               int batch_size = 0);

}  // namespace lmspark
