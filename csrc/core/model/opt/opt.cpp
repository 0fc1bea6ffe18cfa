/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt.cpp
 */

#include "opt.h"  // NOLINT

#include <common/global_config.h>
#include <core/kernel/kernel.h>
#include <runtime/weight/checkpoint_loader.h>
#include <utility/timer.h>

namespace lmspark {

namespace {

template <typename T>
void SetAttr(OperatorProto* op, const std::string& key, T value) {
  (*op->mutable_attr())[key] =
      std::string(reinterpret_cast<const char*>(&value), sizeof(T));
}

OperatorProto* AddOp(GraphProto* graph, const std::string& op_type,
                     const std::string& op_name,
                     const std::vector<std::string>& inputs,
                     const std::vector<std::string>& outputs,
                     const std::vector<std::string>& weights, int stage) {
  OperatorProto* op = graph->add_ops();
  op->set_op_type(op_type);
  op->set_op_name(op_name);
  op->set_stage(stage);
  for (auto& name : inputs) op->add_inputs()->set_name(name);
  for (auto& name : outputs) op->add_outputs()->set_name(name);
  for (auto& name : weights) op->add_weights()->set_name(name);
  return op;
}

std::string P(const std::string& name) { return kParamPrefix + name; }

}  // namespace

std::vector<std::pair<int, int>> OPTModel::MakeStagePlan(
    const OPTConfig& config) {
  std::vector<std::pair<int, int>> plan;
  if (config.num_pp_stages <= 0) return plan;
  const int per_stage = config.decoder_layers / config.num_pp_stages;
  for (int s = 0; s < config.num_pp_stages; s++) {
    plan.emplace_back(s * per_stage, (s + 1) * per_stage);
  }
  return plan;
}

GraphProto OPTModel::BuildGraph(const OPTConfig& config) {
  GraphProto graph;
  graph.add_inputs()->set_name("input_ids");
  graph.add_inputs()->set_name("position_ids");
  graph.add_outputs()->set_name("logits");

  const bool staged = config.num_pp_stages > 0;
  const int per_stage =
      staged ? config.decoder_layers / config.num_pp_stages : 0;
  const int first_stage = staged ? 0 : -1;
  const int last_stage = staged ? config.num_pp_stages - 1 : -1;

  // embeddings
  OperatorProto* op = AddOp(
      &graph, "Embedding", "embeddings.word_embeddings", {"input_ids"},
      {"embeddings.inputs_embeds"},
      {P("embeddings.word_embeddings.embedding")}, first_stage);
  SetAttr<float>(op, "scale", config.EmbedScale());
  std::string inputs_embeds = "embeddings.inputs_embeds";
  if (config.HasProjectIn()) {
    AddOp(&graph, "Gemm", "embeddings.project_in", {inputs_embeds},
          {"embeddings.projected"}, {P("embeddings.project_in.kernel")},
          first_stage);
    inputs_embeds = "embeddings.projected";
  }
  op = AddOp(&graph, "Embedding", "embeddings.position_embeddings",
             {"position_ids"}, {"embeddings.position_embeds"},
             {P("embeddings.position_embeddings.embedding")}, first_stage);
  SetAttr<float>(op, "scale", 1.0f);
  op = AddOp(&graph, "Binary", "embeddings.add",
             {inputs_embeds, "embeddings.position_embeds"}, {"embeddings.out"},
             {}, first_stage);
  SetAttr<BinaryType>(op, "binary_type", BinaryType::ADD);

  // decoder layers
  std::string hidden = "embeddings.out";
  for (int i = 0; i < config.decoder_layers; i++) {
    const int stage = staged ? i / per_stage : -1;
    const std::string p = "encoder." + std::to_string(i) + ".";
    const std::string w = P(p);

    op = AddOp(&graph, "LayerNorm", p + "attention.layer_norm", {hidden},
               {p + "attention.ln_out"},
               {w + "attention.layer_norm.scale",
                w + "attention.layer_norm.bias"},
               stage);
    SetAttr<float>(op, "eps", config.layer_norm_eps);
    AddOp(&graph, "Gemm", p + "attention.self.qvk_combined",
          {p + "attention.ln_out"}, {p + "attention.qvk"},
          {w + "attention.self.qvk_combined.kernel",
           w + "attention.self.qvk_combined.bias"},
          stage);
    op = AddOp(&graph, "OptMHA", p + "attention.self", {p + "attention.qvk"},
               {p + "attention.context", p + "attention.probs"}, {}, stage);
    SetAttr<int>(op, "num_heads", config.decoder_attention_heads);
    SetAttr<int>(op, "layer_index", i);
    SetAttr<bool>(op, "output_attentions", true);
    AddOp(&graph, "Gemm", p + "attention.dense", {p + "attention.context"},
          {p + "attention.dense_out"},
          {w + "attention.dense.kernel", w + "attention.dense.bias"}, stage);
    op = AddOp(&graph, "Binary", p + "attention.residual",
               {p + "attention.dense_out", hidden}, {p + "attention.out"}, {},
               stage);
    SetAttr<BinaryType>(op, "binary_type", BinaryType::ADD);

    op = AddOp(&graph, "LayerNorm", p + "ffn.layer_norm",
               {p + "attention.out"}, {p + "ffn.ln_out"},
               {w + "ffn.layer_norm.scale", w + "ffn.layer_norm.bias"}, stage);
    SetAttr<float>(op, "eps", config.layer_norm_eps);
    AddOp(&graph, "Gemm", p + "ffn.fc1", {p + "ffn.ln_out"},
          {p + "ffn.fc1_out"}, {w + "ffn.fc1.kernel", w + "ffn.fc1.bias"},
          stage);
    op = AddOp(&graph, "Unary", p + "ffn.activation", {p + "ffn.fc1_out"},
               {p + "ffn.act_out"}, {}, stage);
    SetAttr<UnaryType>(op, "unary_type", config.ActivationType());
    AddOp(&graph, "Gemm", p + "ffn.fc2", {p + "ffn.act_out"},
          {p + "ffn.fc2_out"}, {w + "ffn.fc2.kernel", w + "ffn.fc2.bias"},
          stage);
    op = AddOp(&graph, "Binary", p + "ffn.residual",
               {p + "ffn.fc2_out", p + "attention.out"}, {p + "out"}, {},
               stage);
    SetAttr<BinaryType>(op, "binary_type", BinaryType::ADD);
    hidden = p + "out";
  }

  // head
  if (config.version > 2) {
    op = AddOp(&graph, "LayerNorm", "layer_norm", {hidden}, {"final_hidden"},
               {P("layer_norm.scale"), P("layer_norm.bias")}, last_stage);
    SetAttr<float>(op, "eps", config.layer_norm_eps);
    hidden = "final_hidden";
  }
  if (config.HasProjectIn()) {
    AddOp(&graph, "Gemm", "project_out", {hidden}, {"projected_hidden"},
          {P("project_out.kernel")}, last_stage);
    hidden = "projected_hidden";
  }
  if (config.share_decoder_input_output_embed) {
    op = AddOp(&graph, "Gemm", "decoder", {hidden}, {"logits"},
               {P("embeddings.word_embeddings.embedding")}, last_stage);
    SetAttr<bool>(op, "transB", true);
  } else {
    AddOp(&graph, "Gemm", "decoder", {hidden}, {"logits"},
          {P("decoder.kernel")}, last_stage);
  }
  return graph;
}

LsStatus OPTModel::CheckParams(const TensorMap& params) const {
  for (auto& kv : ExpectedParamShapes(config_)) {
    auto it = params.find(kv.first);
    if (it == params.end()) {
      LOG(ERROR) << "OPTModel: missing parameter " << kv.first;
      return LsStatus::LMSPARK_PARAM_ERROR;
    }
    const LsTensor& t = *it->second;
    if (t.GetDataType() != DataType::FLOAT32 or
        t.GetShape() != kv.second.shape) {
      LOG(ERROR) << "OPTModel: parameter " << kv.first << " is "
                 << DataTypeToString(t.GetDataType()) << " " << t.GetShape()
                 << ", expect FLOAT32 " << kv.second.shape;
      return LsStatus::LMSPARK_PARAM_ERROR;
    }
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus OPTModel::Init(const OPTConfig& config, const DeviceContext& ctx,
                        const TensorMap& params) {
  DLOG(INFO) << "OPTModel::Init()";
  util::Timer timer("build_graph");
  LS_CHECK_STATUS(config.Validate());
  config_ = config;
  LS_CHECK_STATUS(CheckParams(params));
  stage_plan_ = MakeStagePlan(config_);
  for (size_t s = 0; s < stage_plan_.size(); s++) {
    LOG(INFO) << "OPTModel: stage " << s << " holds layers ["
              << stage_plan_[s].first << ", " << stage_plan_[s].second << ")";
  }
  LS_CHECK_STATUS(LsModel::Init(BuildGraph(config_), ctx, params));
  if (GlobalConfig::Instance().print_compilation_time) {
    LOG(INFO) << "OPTModel: graph build time " << timer.elapsed() << " ms";
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus OPTModel::Forward(const LsTensor& input_ids,
                           const LsTensor& position_ids, AttentionCache* cache,
                           TensorMap* outputs, bool output_attentions,
                           bool output_hidden_states) {
  if (topo_ops_.empty()) {
    LOG(ERROR) << "OPTModel::Forward called before Init";
    return LsStatus::LMSPARK_INVALID_CALL_ERROR;
  }
  const Shape& ids_shape = input_ids.GetShape();
  if (input_ids.GetDataType() != DataType::INT64 or ids_shape.Size() != 2 or
      ids_shape[0] <= 0 or ids_shape[1] <= 0) {
    LOG(ERROR) << "OPTModel: input_ids must be non empty INT64 (batch, "
                  "seq_len), got "
               << DataTypeToString(input_ids.GetDataType()) << " "
               << ids_shape;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  if (position_ids.GetDataType() != DataType::INT64 or
      position_ids.GetShape() != ids_shape) {
    LOG(ERROR) << "OPTModel: position_ids must be INT64 " << ids_shape
               << ", got " << position_ids.GetShape();
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  const int batch_size = ids_shape[0];
  const int seq_len = ids_shape[1];
  if (cache != nullptr) {
    if (cache->NumLayers() != config_.decoder_layers or
        cache->BatchSize() != batch_size) {
      LOG(ERROR) << "OPTModel: cache of " << cache->NumLayers()
                 << " layers and batch " << cache->BatchSize()
                 << " does not fit input " << ids_shape;
      return LsStatus::LMSPARK_PARAM_ERROR;
    }
    // reject before any layer writes
    for (int i = 0; i < cache->NumLayers(); i++) {
      LS_CHECK_STATUS(cache->CheckCapacity(i, seq_len));
    }
  }

  TensorUtils::DeepCopyWhole(*tensors_.at("input_ids"), input_ids);
  TensorUtils::DeepCopyWhole(*tensors_.at("position_ids"), position_ids);
  gen_ctx_.batch_size = batch_size;
  gen_ctx_.seq_len = seq_len;
  gen_ctx_.cache = cache;
  gen_ctx_.output_attentions = output_attentions;
  LS_CHECK_STATUS(RunGraph(&gen_ctx_));

  outputs->clear();
  (*outputs)["logits"] =
      std::make_shared<LsTensor>("logits", *tensors_.at("logits"));
  if (output_hidden_states) {
    for (int k = 0; k <= config_.decoder_layers; k++) {
      const std::string src =
          k == 0 ? "embeddings.out"
                 : "encoder." + std::to_string(k - 1) + ".out";
      const std::string name = "hidden_states." + std::to_string(k);
      (*outputs)[name] = std::make_shared<LsTensor>(name, *tensors_.at(src));
    }
  }
  if (output_attentions) {
    for (int i = 0; i < config_.decoder_layers; i++) {
      const std::string src =
          "encoder." + std::to_string(i) + ".attention.probs";
      const std::string name = "attentions." + std::to_string(i);
      (*outputs)[name] = std::make_shared<LsTensor>(name, *tensors_.at(src));
    }
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus OPTModel::InferenceStepNoCache(const LsTensor& input_ids,
                                        TensorMap* outputs) {
  LsTensor position_ids("position_ids", DeviceType::CPU, DataType::INT64);
  LS_CHECK_STATUS(BuildPositionIds(input_ids, config_.pad, &position_ids));
  return Forward(input_ids, position_ids, nullptr, outputs);
}

LsStatus OPTModel::InferenceStepWithCache(const LsTensor& input_ids,
                                          AttentionCache* cache,
                                          TensorMap* outputs) {
  if (cache == nullptr) {
    LOG(ERROR) << "OPTModel::InferenceStepWithCache: no cache";
    return LsStatus::LMSPARK_INVALID_CALL_ERROR;
  }
  const Shape& ids_shape = input_ids.GetShape();
  if (ids_shape.Size() != 2 or ids_shape[0] != cache->BatchSize()) {
    LOG(ERROR) << "OPTModel: input_ids " << ids_shape
               << " does not fit cache batch " << cache->BatchSize();
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  const int batch_size = ids_shape[0];
  const int seq_len = ids_shape[1];
  std::vector<int64_t> positions(static_cast<size_t>(batch_size) * seq_len);
  for (int b = 0; b < batch_size; b++) {
    const int64_t cursor = cache->Cursor(0, b);
    for (int i = 0; i < seq_len; i++) {
      positions[b * seq_len + i] = cursor + i + config_.pad + 1;
    }
  }
  LsTensor position_ids("position_ids", DeviceType::CPU, DataType::INT64);
  TensorUtils::DeepCopyFromStdVector(position_ids, ids_shape, positions);
  return Forward(input_ids, position_ids, cache, outputs);
}

LsStatus BuildPositionIds(const LsTensor& input_ids, int64_t pad,
                          LsTensor* position_ids) {
  const Shape& shape = input_ids.GetShape();
  if (input_ids.GetDataType() != DataType::INT64 or shape.Size() != 2) {
    LOG(ERROR) << "BuildPositionIds: input_ids must be INT64 (batch, "
                  "seq_len), got "
               << DataTypeToString(input_ids.GetDataType()) << " " << shape;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  LS_CHECK_STATUS(position_ids->SetDataType(DataType::INT64));
  LS_CHECK_STATUS(position_ids->SetShape(Shape(shape)));
  cpu::PositionIdsKernel(static_cast<int64_t*>(position_ids->GetDataPtr()),
                         static_cast<const int64_t*>(input_ids.GetDataPtr()),
                         shape[0], shape[1], pad);
  return LsStatus::LMSPARK_SUCCESS;
}

std::unique_ptr<AttentionCache> BuildInitCache(const OPTConfig& config,
                                               int batch_size) {
  if (batch_size <= 0) batch_size = config.batch_size;
  return std::make_unique<AttentionCache>(
      config.decoder_layers, batch_size, config.max_target_positions,
      config.decoder_attention_heads, config.HeadDim());
}

}  // namespace lmspark
