/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    lmspark.h
 */

#pragma once

#include <core/model/opt/opt_config.h>
#include <core/tensor/tensor.h>

#include <memory>
#include <string>

#include "lmspark_check.h"  // NOLINT

namespace lmspark {

class LsEngineImpl;

// lmspark OPT inference engine interface
class LsEngine final {
 public:
  LsEngine();
  ~LsEngine();

  /**
   * Build model from a configuration. Drops any previously loaded
   * parameters and cache.
   */
  LsStatus BuildModel(const OPTConfig& config);
  /**
   * Build model from a size name ("125M", "1.3B", ...), see
   * GetOPTModelNames().
   */
  LsStatus BuildModelFromName(const std::string& name);
  /**
   * Build model from an OPTConfigProto text file.
   */
  LsStatus BuildModelFromConfigFile(const std::string& path);

  /**
   * Load checkpoint parameters, dispatching on the path suffix, and
   * initialise the operator graph. dummy fills seeded random values.
   */
  LsStatus LoadParams(const std::string& path, bool dummy = false);

  /**
   * Run the graph. use_cache feeds and advances the engine cache, which is
   * created for the input batch size on first use.
   * outputs receives "logits" plus "hidden_states.{k}" and
   * "attentions.{i}" when requested.
   */
  LsStatus Forward(const LsTensor& input_ids, const LsTensor& position_ids,
                   bool use_cache, TensorMap* outputs,
                   bool output_attentions = false,
                   bool output_hidden_states = false);
  LsStatus InferenceStepNoCache(const LsTensor& input_ids, TensorMap* outputs);
  LsStatus InferenceStepWithCache(const LsTensor& input_ids,
                                  TensorMap* outputs);

  // replace the cache by an empty one for batch_size sequences
  LsStatus ResetCache(int batch_size);

  std::string GetVersionFull();

 private:
  std::unique_ptr<LsEngineImpl> ls_engine_impl_;
};

}  // namespace lmspark
