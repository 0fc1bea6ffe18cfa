/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt_config.cpp
 */

#include "opt_config.h"  // NOLINT

#include <utility/file_util.h>

#include <cmath>
#include <map>
#include <sstream>

namespace lmspark {

namespace {

struct OPTSize {
  int layers;
  int embed_dim;
  int heads;
  int ffn_dim;
  int version;
};

const std::map<std::string, OPTSize>& OPTSizeTable() {
  static const std::map<std::string, OPTSize> sizes = {
      {"125M", {12, 768, 12, 3072, 1}},
      {"1.3B", {24, 2048, 32, 8192, 3}},
      {"2.7B", {32, 2560, 32, 10240, 3}},
      {"6.7B", {32, 4096, 32, 16384, 3}},
      {"13B", {40, 5120, 40, 20480, 3}},
      {"30B", {48, 7168, 56, 28672, 3}},
      {"66B", {64, 9216, 72, 36864, 3}},
      {"175B", {96, 12288, 96, 49152, 3}},
  };
  return sizes;
}

}  // namespace

UnaryType OPTConfig::ActivationType() const {
  static const std::map<std::string, UnaryType> act_map = {
      {"relu", UnaryType::RELU},       {"gelu", UnaryType::GELU_ERF},
      {"gelu_new", UnaryType::GELU_TANH}, {"silu", UnaryType::SILU},
      {"swish", UnaryType::SILU},
  };
  auto it = act_map.find(activation_fn);
  return it == act_map.end() ? UnaryType::UNARYTYPE_UNDEFINED : it->second;
}

float OPTConfig::EmbedScale() const {
  return no_scale_embedding
             ? 1.0f
             : std::sqrt(static_cast<float>(decoder_embed_dim));
}

LsStatus OPTConfig::Validate() const {
  if (decoder_layers <= 0 or max_target_positions <= 0 or
      decoder_embed_dim <= 0 or decoder_attention_heads <= 0 or
      decoder_input_dim <= 0 or decoder_ffn_embed_dim <= 0 or
      batch_size <= 0 or vocab_size <= 0 or pad < 0) {
    LOG(ERROR) << "OPTConfig: sizes must be positive\n" << ToString();
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (decoder_embed_dim % decoder_attention_heads != 0) {
    LOG(ERROR) << "OPTConfig: decoder_embed_dim " << decoder_embed_dim
               << " has to be a multiple of decoder_attention_heads "
               << decoder_attention_heads;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (not decoder_normalize_before or not decoder_learned_pos or
      use_stable_embedding) {
    LOG(ERROR) << "OPTConfig: only pre-norm decoders with learned positions "
                  "and without stable embedding are supported";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (ActivationType() == UnaryType::UNARYTYPE_UNDEFINED) {
    LOG(ERROR) << "OPTConfig: unsupported activation_fn " << activation_fn;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (num_pp_stages < 0 or
      (num_pp_stages > 0 and decoder_layers % num_pp_stages != 0)) {
    LOG(ERROR) << "OPTConfig: decoder_layers " << decoder_layers
               << " can't be divided into " << num_pp_stages << " stages";
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

void OPTConfig::MergeFrom(const OPTConfigProto& proto) {
#define LS_MERGE_FIELD(field) \
  if (proto.has_##field()) field = proto.field()
  LS_MERGE_FIELD(decoder_layers);
  LS_MERGE_FIELD(max_target_positions);
  LS_MERGE_FIELD(decoder_embed_dim);
  LS_MERGE_FIELD(decoder_attention_heads);
  LS_MERGE_FIELD(decoder_input_dim);
  LS_MERGE_FIELD(decoder_ffn_embed_dim);
  LS_MERGE_FIELD(batch_size);
  LS_MERGE_FIELD(pad);
  LS_MERGE_FIELD(activation_fn);
  LS_MERGE_FIELD(fp16);
  LS_MERGE_FIELD(use_stable_embedding);
  LS_MERGE_FIELD(no_scale_embedding);
  LS_MERGE_FIELD(decoder_learned_pos);
  LS_MERGE_FIELD(decoder_normalize_before);
  LS_MERGE_FIELD(share_decoder_input_output_embed);
  LS_MERGE_FIELD(version);
  LS_MERGE_FIELD(vocab_size);
  LS_MERGE_FIELD(layer_norm_eps);
  LS_MERGE_FIELD(num_pp_stages);
#undef LS_MERGE_FIELD
}

std::string OPTConfig::ToString() const {
  std::stringstream ss;
  ss << std::boolalpha << "decoder_layers: " << decoder_layers
     << ", max_target_positions: " << max_target_positions
     << ", decoder_embed_dim: " << decoder_embed_dim
     << ", decoder_attention_heads: " << decoder_attention_heads
     << ", decoder_input_dim: " << decoder_input_dim
     << ", decoder_ffn_embed_dim: " << decoder_ffn_embed_dim
     << ", batch_size: " << batch_size << ", pad: " << pad
     << ", activation_fn: " << activation_fn << ", fp16: " << fp16
     << ", use_stable_embedding: " << use_stable_embedding
     << ", no_scale_embedding: " << no_scale_embedding
     << ", decoder_learned_pos: " << decoder_learned_pos
     << ", decoder_normalize_before: " << decoder_normalize_before
     << ", share_decoder_input_output_embed: "
     << share_decoder_input_output_embed << ", version: " << version
     << ", vocab_size: " << vocab_size
     << ", layer_norm_eps: " << layer_norm_eps
     << ", num_pp_stages: " << num_pp_stages;
  return ss.str();
}

std::vector<std::string> GetOPTModelNames() {
  std::vector<std::string> names;
  for (auto& kv : OPTSizeTable()) {
    names.push_back(kv.first);
  }
  return names;
}

LsStatus GetOPTConfig(const std::string& name, const OPTConfigProto& overrides,
                      OPTConfig* config) {
  auto& sizes = OPTSizeTable();
  auto it = sizes.find(name);
  if (it == sizes.end()) {
    LOG(ERROR) << "Invalid model name: " << name;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  OPTConfig base;
  base.decoder_layers = it->second.layers;
  base.decoder_embed_dim = it->second.embed_dim;
  base.decoder_input_dim = it->second.embed_dim;
  base.decoder_attention_heads = it->second.heads;
  base.decoder_ffn_embed_dim = it->second.ffn_dim;
  base.version = it->second.version;
  base.MergeFrom(overrides);
  *config = base;
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus ParseOPTConfigFromTextFile(const std::string& path,
                                    OPTConfig* config) {
  OPTConfigProto proto;
  LS_CHECK_STATUS(util::ReadProtoFromTextFile(path, &proto));
  const std::string name = proto.has_name() ? proto.name() : "125M";
  return GetOPTConfig(name, proto, config);
}

}  // namespace lmspark
