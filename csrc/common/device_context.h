/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    device_context.h
 */

#pragma once

#include <memory>

#include "common/common.h"

namespace lmspark {

// base device context interface
class DeviceContext {
  DeviceContext(const DeviceContext&) = delete;
  DeviceContext(DeviceContext&&) = delete;
  DeviceContext& operator=(const DeviceContext&) = delete;
  DeviceContext& operator=(DeviceContext&&) = delete;

 public:
  DeviceContext() = default;
  virtual ~DeviceContext() {}
  virtual DeviceType GetDeviceType() const = 0;
  virtual void SetNumThreads(int num_threads) = 0;
  virtual int GetNumThread() const = 0;
  virtual void Synchronize() const = 0;

  void SetModelMaxLength(int max_length) { engine_max_length_ = max_length; }
  int GetModelMaxLength() const { return engine_max_length_; }
  void SetModelMaxBatch(int max_batch) { engine_max_batch_ = max_batch; }
  int GetModelMaxBatch() const { return engine_max_batch_; }
  void SetNumberHeads(int num_heads) { num_heads_ = num_heads; }
  int GetNumberHeads() const { return num_heads_; }
  void SetDecoderLayer(int dec_layer) { dec_layer_ = dec_layer; }
  int GetDecoderLayer() const { return dec_layer_; }
  void SetSizePerHead(int size_per_head) { size_per_head_ = size_per_head; }
  int GetSizePerHead() const { return size_per_head_; }

 private:
  int engine_max_length_ = 0;
  int engine_max_batch_ = 0;
  int num_heads_ = 0;
  int dec_layer_ = 0;
  int size_per_head_ = 0;
};

}  // namespace lmspark
