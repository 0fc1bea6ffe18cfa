/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    attention_cache.cpp
 */

#include "attention_cache.h"  // NOLINT

#include <string>

namespace lmspark {

AttentionCache::AttentionCache(int num_layers, int batch_size, int max_len,
                               int num_heads, int size_per_head)
    : batch_size_(batch_size),
      max_len_(max_len),
      num_heads_(num_heads),
      size_per_head_(size_per_head) {
  if (num_layers <= 0 or batch_size <= 0 or max_len <= 0 or num_heads <= 0 or
      size_per_head <= 0) {
    LOG(ERROR) << "AttentionCache: invalid geometry layers=" << num_layers
               << " batch=" << batch_size << " max_len=" << max_len
               << " heads=" << num_heads << " head_dim=" << size_per_head;
    throw LsException("LMSPARK_PARAM_ERROR: invalid attention cache geometry");
  }
  layers_.resize(num_layers);
  Shape kv_shape({batch_size, max_len, num_heads, size_per_head});
  for (int i = 0; i < num_layers; i++) {
    std::string prefix = "cache." + std::to_string(i);
    layers_[i].key = std::make_unique<LsTensor>(
        prefix + ".key", DeviceType::CPU, DataType::FLOAT32, DataMode::DENSE,
        kv_shape);
    layers_[i].value = std::make_unique<LsTensor>(
        prefix + ".value", DeviceType::CPU, DataType::FLOAT32, DataMode::DENSE,
        kv_shape);
    layers_[i].index = std::make_unique<LsTensor>(
        prefix + ".index", DeviceType::CPU, DataType::INT32, DataMode::DENSE,
        Shape({batch_size}));
  }
  Reset();
  DLOG(INFO) << "AttentionCache: " << num_layers << " layers of "
             << kv_shape.ToString();
}

LsStatus AttentionCache::CheckLayer(int layer) const {
  LS_CHECK_RETVAL(layer >= 0 and layer < NumLayers(),
                  LsStatus::LMSPARK_PARAM_ERROR,
                  "AttentionCache: layer " << layer << " out of range [0, "
                                           << NumLayers() << ")");
  return LsStatus::LMSPARK_SUCCESS;
}

LsTensor* AttentionCache::Key(int layer) const {
  LS_CHECK(CheckLayer(layer));
  return layers_[layer].key.get();
}

LsTensor* AttentionCache::Value(int layer) const {
  LS_CHECK(CheckLayer(layer));
  return layers_[layer].value.get();
}

LsTensor* AttentionCache::Index(int layer) const {
  LS_CHECK(CheckLayer(layer));
  return layers_[layer].index.get();
}

int AttentionCache::Cursor(int layer, int batch_idx) const {
  LS_CHECK(CheckLayer(layer));
  LS_ENFORCE(batch_idx >= 0 and batch_idx < batch_size_, "batch index ",
             batch_idx, " out of range");
  return static_cast<const int*>(
      layers_[layer].index->GetDataPtr())[batch_idx];
}

LsStatus AttentionCache::CheckCapacity(int layer, int num_new) const {
  LS_CHECK_STATUS(CheckLayer(layer));
  LS_CHECK_RETVAL(num_new >= 0, LsStatus::LMSPARK_PARAM_ERROR,
                  "AttentionCache: negative token count " << num_new);
  const int* cursor = static_cast<const int*>(layers_[layer].index->GetDataPtr());
  for (int b = 0; b < batch_size_; b++) {
    if (cursor[b] + num_new > max_len_) {
      LOG(ERROR) << "AttentionCache: layer " << layer << " row " << b
                 << " holds " << cursor[b] << " tokens, " << num_new
                 << " more exceed max length " << max_len_;
      return LsStatus::LMSPARK_EXCEED_LIMIT_ERROR;
    }
  }
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus AttentionCache::Advance(int layer, int num_new) {
  LS_CHECK_STATUS(CheckCapacity(layer, num_new));
  int* cursor = static_cast<int*>(layers_[layer].index->GetDataPtr());
  for (int b = 0; b < batch_size_; b++) {
    cursor[b] += num_new;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

void AttentionCache::Reset() {
  for (auto& layer : layers_) {
    TensorUtils::Memset(*layer.key, 0);
    TensorUtils::Memset(*layer.value, 0);
    TensorUtils::Memset(*layer.index, 0);
  }
}

}  // namespace lmspark
