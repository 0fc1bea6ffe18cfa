/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    attention_cache.h
 */

#pragma once

#include <common/common.h>
#include <core/tensor/tensor.h>

#include <memory>
#include <vector>

namespace lmspark {

/*!
 * @brief Key / value history of every decoder layer for incremental
 * decoding. Layer i holds key and value [batch, max_len, heads, head_dim]
 * and an int32 write cursor per batch row.
 */
class AttentionCache {
 public:
  AttentionCache(int num_layers, int batch_size, int max_len, int num_heads,
                 int size_per_head);
  DISABLE_COPY_AND_ASSIGN(AttentionCache);

  int NumLayers() const { return static_cast<int>(layers_.size()); }
  int BatchSize() const { return batch_size_; }
  int MaxLength() const { return max_len_; }
  int NumHeads() const { return num_heads_; }
  int SizePerHead() const { return size_per_head_; }

  LsTensor* Key(int layer) const;
  LsTensor* Value(int layer) const;
  LsTensor* Index(int layer) const;
  int Cursor(int layer, int batch_idx) const;

  LsStatus CheckCapacity(int layer, int num_new) const;
  LsStatus Advance(int layer, int num_new);
  void Reset();

 private:
  struct LayerCache {
    std::unique_ptr<LsTensor> key;
    std::unique_ptr<LsTensor> value;
    std::unique_ptr<LsTensor> index;
  };
  LsStatus CheckLayer(int layer) const;

  std::vector<LayerCache> layers_;
  int batch_size_;
  int max_len_;
  int num_heads_;
  int size_per_head_;
};

}  // namespace lmspark
