/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt_config.h
 */

#pragma once

#include <common/common.h>

#include <string>
#include <vector>

namespace lmspark {

/*!
 * @brief Hyper parameters of an OPT decoder. Defaults describe the 125M
 * model.
 */
struct OPTConfig {
  int decoder_layers = 12;
  int max_target_positions = 2048;
  int decoder_embed_dim = 768;
  int decoder_attention_heads = 12;
  int decoder_input_dim = 768;
  int decoder_ffn_embed_dim = 3072;
  int batch_size = 1;
  int pad = 1;
  std::string activation_fn = "relu";
  bool fp16 = true;
  bool use_stable_embedding = false;
  bool no_scale_embedding = true;
  bool decoder_learned_pos = true;
  bool decoder_normalize_before = true;
  bool share_decoder_input_output_embed = true;
  int version = 1;
  int vocab_size = 50272;
  float layer_norm_eps = 1e-5f;
  // 0 when no stage plan is requested
  int num_pp_stages = 0;

  LsStatus Validate() const;
  // replace the fields present in the proto
  void MergeFrom(const OPTConfigProto& proto);
  std::string ToString() const;

  int HeadDim() const { return decoder_embed_dim / decoder_attention_heads; }
  float EmbedScale() const;
  int PositionTableSize() const { return max_target_positions + pad + 1; }
  bool HasProjectIn() const { return decoder_input_dim != decoder_embed_dim; }
  // activation_fn as a UnaryType, UNARYTYPE_UNDEFINED when unknown
  UnaryType ActivationType() const;
};

// known size names: 125M, 1.3B, 2.7B, 6.7B, 13B, 30B, 66B, 175B
std::vector<std::string> GetOPTModelNames();

LsStatus GetOPTConfig(const std::string& name, const OPTConfigProto& overrides,
                      OPTConfig* config);
inline LsStatus GetOPTConfig(const std::string& name, OPTConfig* config) {
  return GetOPTConfig(name, OPTConfigProto(), config);
}

// OPTConfigProto text file, the base size is its name field or 125M
LsStatus ParseOPTConfigFromTextFile(const std::string& path,
                                    OPTConfig* config);

}  // namespace lmspark
