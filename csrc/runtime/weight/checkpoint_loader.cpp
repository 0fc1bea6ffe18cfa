/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    checkpoint_loader.cpp
 */

#include "checkpoint_loader.h"  // NOLINT

#include <common/global_config.h>
#include <core/kernel/kernel.h>
#include <utility/file_util.h>
#include <utility/npz_util.h>
#include <utility/progress_bar.hpp>
#include <utility/string_util.h>
#include <utility/timer.h>

#include <algorithm>
#include <random>
#include <utility>
#include <vector>

namespace lmspark {

const char kParamPrefix[] = "params.transformers.";

namespace {

std::string Param(const std::string& name) { return kParamPrefix + name; }

std::string LayerParam(int i, const std::string& name) {
  return Param("encoder." + std::to_string(i) + "." + name);
}

[[noreturn]] void ThrowMismatch(const std::string& msg) {
  LOG(ERROR) << msg;
  throw LsModelIOException("LMSPARK_PARAM_ERROR: " + msg);
}

std::shared_ptr<LsTensor> NewFloat(const std::string& name,
                                   const Shape& shape) {
  return std::make_shared<LsTensor>(name, DeviceType::CPU, DataType::FLOAT32,
                                    DataMode::DENSE, shape);
}

// FLOAT16 and FLOAT32 arrays as float
std::shared_ptr<LsTensor> ToFloat(const std::shared_ptr<LsTensor>& src) {
  if (src->GetDataType() == DataType::FLOAT32) {
    return src;
  }
  auto dst = NewFloat(src->GetName(), src->GetShape());
  cpu::HalfToFloatKernel(static_cast<float*>(dst->GetDataPtr()),
                         static_cast<const uint16_t*>(src->GetDataPtr()),
                         src->GetShape().Count());
  return dst;
}

// [rows, cols] -> [cols, rows]
std::shared_ptr<LsTensor> Transpose(const std::shared_ptr<LsTensor>& src) {
  const int64_t rows = src->GetShape()[0];
  const int64_t cols = src->GetShape()[1];
  auto dst = NewFloat(src->GetName(), Shape({cols, rows}));
  const float* in = static_cast<const float*>(src->GetDataPtr());
  float* out = static_cast<float*>(dst->GetDataPtr());
  for (int64_t r = 0; r < rows; r++) {
    for (int64_t c = 0; c < cols; c++) {
      out[c * rows + r] = in[r * cols + c];
    }
  }
  return dst;
}

}  // namespace

ParamInfoMap ExpectedParamShapes(const OPTConfig& config) {
  const DataType dtype = config.fp16 ? DataType::FLOAT16 : DataType::FLOAT32;
  const int64_t dim = config.decoder_embed_dim;
  const int64_t in_dim = config.decoder_input_dim;
  const int64_t ffn = config.decoder_ffn_embed_dim;
  ParamInfoMap info;
  auto add = [&](const std::string& name, Shape shape) {
    info[name] = ParamInfo{std::move(shape), dtype};
  };
  add(Param("embeddings.word_embeddings.embedding"),
      Shape({config.vocab_size, in_dim}));
  add(Param("embeddings.position_embeddings.embedding"),
      Shape({config.PositionTableSize(), dim}));
  if (config.HasProjectIn()) {
    add(Param("embeddings.project_in.kernel"), Shape({in_dim, dim}));
    add(Param("project_out.kernel"), Shape({dim, in_dim}));
  }
  if (config.version > 2) {
    add(Param("layer_norm.scale"), Shape({dim}));
    add(Param("layer_norm.bias"), Shape({dim}));
  }
  if (not config.share_decoder_input_output_embed) {
    add(Param("decoder.kernel"), Shape({in_dim, config.vocab_size}));
  }
  for (int i = 0; i < config.decoder_layers; i++) {
    add(LayerParam(i, "attention.self.qvk_combined.kernel"),
        Shape({dim, 3 * dim}));
    add(LayerParam(i, "attention.self.qvk_combined.bias"), Shape({3 * dim}));
    add(LayerParam(i, "attention.dense.kernel"), Shape({dim, dim}));
    add(LayerParam(i, "attention.dense.bias"), Shape({dim}));
    add(LayerParam(i, "attention.layer_norm.scale"), Shape({dim}));
    add(LayerParam(i, "attention.layer_norm.bias"), Shape({dim}));
    add(LayerParam(i, "ffn.fc1.kernel"), Shape({dim, ffn}));
    add(LayerParam(i, "ffn.fc1.bias"), Shape({ffn}));
    add(LayerParam(i, "ffn.fc2.kernel"), Shape({ffn, dim}));
    add(LayerParam(i, "ffn.fc2.bias"), Shape({dim}));
    add(LayerParam(i, "ffn.layer_norm.scale"), Shape({dim}));
    add(LayerParam(i, "ffn.layer_norm.bias"), Shape({dim}));
  }
  return info;
}

std::shared_ptr<LsTensor> NpDirReader::Read(const std::string& key) {
  util::Path path = util::Path(dir_) / key;
  if (!util::IsExists(path.get_path()) or util::IsDirectory(path.get_path())) {
    path = util::Path(dir_) / (key + ".npy");
  }
  if (!util::IsExists(path.get_path())) {
    LOG(ERROR) << "NpDirReader: no file for " << key << " under " << dir_;
    throw LsModelIOException("LMSPARK_IO_ERROR: missing checkpoint array " +
                             key);
  }
  return util::npy_load(path.get_path(), key);
}

NpzReader::NpzReader(const std::string& file_path) : file_path_(file_path) {
  util::npz_load(file_path, arrays_);
  DLOG(INFO) << "NpzReader: " << arrays_.size() << " arrays in " << file_path;
}

std::shared_ptr<LsTensor> NpzReader::Read(const std::string& key) {
  auto it = arrays_.find(key);
  if (it == arrays_.end()) {
    LOG(ERROR) << "NpzReader: " << key << " not in " << file_path_;
    throw LsModelIOException("LMSPARK_IO_ERROR: missing checkpoint array " +
                             key);
  }
  return it->second;
}

CheckpointLoader::CheckpointLoader(const OPTConfig& config)
    : config_(config),
      expected_(ExpectedParamShapes(config)),
      ckpt_dtype_(config.fp16 ? DataType::FLOAT16 : DataType::FLOAT32) {}

std::shared_ptr<LsTensor> CheckpointLoader::ReadChecked(
    CheckpointReader* reader, const std::string& key, const Shape& shape) {
  std::shared_ptr<LsTensor> raw = reader->Read(key);
  if (raw->GetDataType() != ckpt_dtype_) {
    ThrowMismatch("checkpoint array " + key + " has dtype " +
                  DataTypeToString(raw->GetDataType()) + ", expect " +
                  DataTypeToString(ckpt_dtype_));
  }
  if (raw->GetShape() != shape) {
    ThrowMismatch("checkpoint array " + key + " has shape " +
                  raw->GetShape().ToString() + ", expect " + shape.ToString());
  }
  return ToFloat(raw);
}

void CheckpointLoader::Store(TensorMap* params, const std::string& name,
                             std::shared_ptr<LsTensor> tensor) {
  auto it = expected_.find(name);
  if (it == expected_.end()) {
    ThrowMismatch("unexpected parameter " + name);
  }
  if (tensor->GetShape() != it->second.shape) {
    ThrowMismatch("parameter " + name + " has shape " +
                  tensor->GetShape().ToString() + ", expect " +
                  it->second.shape.ToString());
  }
  tensor->SetName(name);
  (*params)[name] = std::move(tensor);
}

void CheckpointLoader::LoadLayer(CheckpointReader* reader, int i,
                                 TensorMap* params) {
  const int64_t dim = config_.decoder_embed_dim;
  const int64_t ffn = config_.decoder_ffn_embed_dim;
  const std::string src = "decoder.layers." + std::to_string(i) + ".";

  // kernel[k, c * 3 + j] = W_j[c, k] with W = [q, v, k]
  const char* qvk_names[3] = {"q_proj", "v_proj", "k_proj"};
  auto kernel = NewFloat("", Shape({dim, 3 * dim}));
  auto bias = NewFloat("", Shape({3 * dim}));
  float* kernel_ptr = static_cast<float*>(kernel->GetDataPtr());
  float* bias_ptr = static_cast<float*>(bias->GetDataPtr());
  for (int j = 0; j < 3; j++) {
    std::string proj = src + "self_attn." + qvk_names[j];
    auto w = ReadChecked(reader, proj + ".weight", Shape({dim, dim}));
    auto b = ReadChecked(reader, proj + ".bias", Shape({dim}));
    const float* w_ptr = static_cast<const float*>(w->GetDataPtr());
    const float* b_ptr = static_cast<const float*>(b->GetDataPtr());
    for (int64_t c = 0; c < dim; c++) {
      for (int64_t k = 0; k < dim; k++) {
        kernel_ptr[k * 3 * dim + c * 3 + j] = w_ptr[c * dim + k];
      }
      bias_ptr[c * 3 + j] = b_ptr[c];
    }
  }
  Store(params, LayerParam(i, "attention.self.qvk_combined.kernel"), kernel);
  Store(params, LayerParam(i, "attention.self.qvk_combined.bias"), bias);

  Store(params, LayerParam(i, "attention.dense.kernel"),
        Transpose(ReadChecked(reader, src + "self_attn.out_proj.weight",
                              Shape({dim, dim}))));
  Store(params, LayerParam(i, "attention.dense.bias"),
        ReadChecked(reader, src + "self_attn.out_proj.bias", Shape({dim})));
  Store(params, LayerParam(i, "attention.layer_norm.scale"),
        ReadChecked(reader, src + "self_attn_layer_norm.weight",
                    Shape({dim})));
  Store(params, LayerParam(i, "attention.layer_norm.bias"),
        ReadChecked(reader, src + "self_attn_layer_norm.bias", Shape({dim})));

  Store(params, LayerParam(i, "ffn.fc1.kernel"),
        Transpose(ReadChecked(reader, src + "fc1.weight", Shape({ffn, dim}))));
  Store(params, LayerParam(i, "ffn.fc1.bias"),
        ReadChecked(reader, src + "fc1.bias", Shape({ffn})));
  Store(params, LayerParam(i, "ffn.fc2.kernel"),
        Transpose(ReadChecked(reader, src + "fc2.weight", Shape({dim, ffn}))));
  Store(params, LayerParam(i, "ffn.fc2.bias"),
        ReadChecked(reader, src + "fc2.bias", Shape({dim})));
  Store(params, LayerParam(i, "ffn.layer_norm.scale"),
        ReadChecked(reader, src + "final_layer_norm.weight", Shape({dim})));
  Store(params, LayerParam(i, "ffn.layer_norm.bias"),
        ReadChecked(reader, src + "final_layer_norm.bias", Shape({dim})));
}

void CheckpointLoader::Load(CheckpointReader* reader, TensorMap* params) {
  const int64_t dim = config_.decoder_embed_dim;
  const int64_t in_dim = config_.decoder_input_dim;
  const int64_t vocab = config_.vocab_size;

  Store(params, Param("embeddings.word_embeddings.embedding"),
        ReadChecked(reader, "decoder.embed_tokens.weight",
                    Shape({vocab, in_dim})));
  Store(params, Param("embeddings.position_embeddings.embedding"),
        ReadChecked(reader, "decoder.embed_positions.weight",
                    Shape({config_.PositionTableSize(), dim})));
  if (config_.HasProjectIn()) {
    Store(params, Param("embeddings.project_in.kernel"),
          Transpose(ReadChecked(reader, "decoder.project_in_dim.weight",
                                Shape({dim, in_dim}))));
    Store(params, Param("project_out.kernel"),
          Transpose(ReadChecked(reader, "decoder.project_out_dim.weight",
                                Shape({in_dim, dim}))));
  }
  if (config_.version > 2) {
    Store(params, Param("layer_norm.scale"),
          ReadChecked(reader, "decoder.layer_norm.weight", Shape({dim})));
    Store(params, Param("layer_norm.bias"),
          ReadChecked(reader, "decoder.layer_norm.bias", Shape({dim})));
  }
  if (not config_.share_decoder_input_output_embed) {
    Store(params, Param("decoder.kernel"),
          Transpose(ReadChecked(reader, "decoder.output_projection.weight",
                                Shape({vocab, in_dim}))));
  }
  util::ProgressBar bar(config_.decoder_layers, "load layers");
  for (int i = 0; i < config_.decoder_layers; i++) {
    LoadLayer(reader, i, params);
    bar.Update(i + 1);
  }
}

void CheckpointLoader::FillDummy(TensorMap* params, int seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, 0.02f);
  for (auto& kv : expected_) {
    const std::string& name = kv.first;
    auto tensor = NewFloat(name, kv.second.shape);
    float* ptr = static_cast<float*>(tensor->GetDataPtr());
    const int64_t count = kv.second.shape.Count();
    if (util::StringUtil::EndsWith(name, "layer_norm.scale")) {
      std::fill(ptr, ptr + count, 1.0f);
    } else if (util::StringUtil::EndsWith(name, ".bias")) {
      std::fill(ptr, ptr + count, 0.0f);
    } else {
      for (int64_t i = 0; i < count; i++) {
        ptr[i] = dist(gen);
      }
    }
    (*params)[name] = tensor;
  }
}

namespace {

template <typename MakeReader>
LsStatus LoadWith(const OPTConfig& config, bool dummy, TensorMap* params,
                  MakeReader make_reader) {
  GlobalConfig& global = GlobalConfig::Instance();
  util::Timer timer("load_params");
  try {
    CheckpointLoader loader(config);
    TensorMap loaded;
    if (dummy or global.use_dummy_value_for_benchmarking) {
      loader.FillDummy(&loaded, global.runtime_random_seed);
    } else {
      std::unique_ptr<CheckpointReader> reader = make_reader();
      loader.Load(reader.get(), &loaded);
    }
    *params = std::move(loaded);
  } catch (LsException& e) {
    LOG(ERROR) << "load params failed: " << e.what();
    return LsGetCodeByError(e.what());
  }
  if (global.print_compilation_time) {
    LOG(INFO) << "load params time: " << timer.elapsed() << " ms";
  }
  return LsStatus::LMSPARK_SUCCESS;
}

}  // namespace

LsStatus LoadNpParams(const OPTConfig& config, const std::string& path,
                      bool dummy, TensorMap* params) {
  return LoadWith(config, dummy, params, [&]() {
    if (!util::IsDirectory(path)) {
      LOG(ERROR) << "LoadNpParams: " << path << " is not a directory";
      throw LsModelIOException("LMSPARK_IO_ERROR: not a directory " + path);
    }
    return std::unique_ptr<CheckpointReader>(new NpDirReader(path));
  });
}

LsStatus LoadNpzParams(const OPTConfig& config, const std::string& path,
                       bool dummy, TensorMap* params) {
  return LoadWith(config, dummy, params, [&]() {
    return std::unique_ptr<CheckpointReader>(new NpzReader(path));
  });
}

LsStatus LoadParams(const OPTConfig& config, const std::string& path,
                    bool dummy, TensorMap* params) {
  // strip trailing slashes of a directory path
  std::string trimmed = path;
  while (trimmed.size() > 1 and trimmed.back() == '/') trimmed.pop_back();
  if (util::StringUtil::EndsWith(trimmed, "npz")) {
    return LoadNpzParams(config, trimmed, dummy, params);
  }
  if (util::StringUtil::EndsWith(trimmed, "np")) {
    return LoadNpParams(config, trimmed, dummy, params);
  }
  if (util::StringUtil::EndsWith(trimmed, "ts")) {
    LOG(ERROR) << "LoadParams: tensorstore checkpoints are not supported: "
               << path;
    return LsStatus::LMSPARK_INVALID_CALL_ERROR;
  }
  LOG(ERROR) << "Invalid path: " << path
             << ", expect a suffix of np, npz or ts";
  return LsStatus::LMSPARK_PARAM_ERROR;
}

}  // namespace lmspark
