/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    checkpoint_loader.h
 */
#pragma once
#include <common/common.h>
#include <core/model/opt/opt_config.h>
#include <core/tensor/tensor.h>

#include <map>
#include <memory>
#include <string>

namespace lmspark {

// every internal parameter name starts with this prefix
extern const char kParamPrefix[];

struct ParamInfo {
  Shape shape;
  DataType dtype;
};

// internal name -> shape and checkpoint dtype, sorted by name
using ParamInfoMap = std::map<std::string, ParamInfo>;

/**
 * Parameter tree of an OPT model, in the layout the operators consume.
 * dtype is FLOAT16 for fp16 checkpoints, FLOAT32 otherwise.
 */
ParamInfoMap ExpectedParamShapes(const OPTConfig& config);

/**
 * Source of raw checkpoint arrays, keyed by fairseq names such as
 * decoder.layers.0.fc1.weight. Read throws LsModelIOException when the
 * key can't be read.
 */
class CheckpointReader {
 public:
  virtual ~CheckpointReader() = default;
  virtual std::shared_ptr<LsTensor> Read(const std::string& key) = 0;
};

// directory with one .npy file per key, named key or key.npy
class NpDirReader : public CheckpointReader {
 public:
  explicit NpDirReader(const std::string& dir) : dir_(dir) {}
  std::shared_ptr<LsTensor> Read(const std::string& key) override;

 private:
  std::string dir_;
};

// single stored .npz archive, read once on construction
class NpzReader : public CheckpointReader {
 public:
  explicit NpzReader(const std::string& file_path);
  std::shared_ptr<LsTensor> Read(const std::string& key) override;

 private:
  std::string file_path_;
  TensorMap arrays_;
};

/**
 * Remaps a fairseq OPT checkpoint into the internal parameter tree.
 * Every array must match ExpectedParamShapes after its transform, both in
 * shape and dtype; a mismatch throws LsModelIOException with a
 * LMSPARK_PARAM_ERROR message. Output tensors are FLOAT32.
 */
class CheckpointLoader {
 public:
  explicit CheckpointLoader(const OPTConfig& config);

  void Load(CheckpointReader* reader, TensorMap* params);
  // seeded values in place of the checkpoint, no file is read
  void FillDummy(TensorMap* params, int seed);

 private:
  std::shared_ptr<LsTensor> ReadChecked(CheckpointReader* reader,
                                        const std::string& key,
                                        const Shape& shape);
  void Store(TensorMap* params, const std::string& name,
             std::shared_ptr<LsTensor> tensor);
  void LoadLayer(CheckpointReader* reader, int i, TensorMap* params);

  OPTConfig config_;
  ParamInfoMap expected_;
  DataType ckpt_dtype_;
};

LsStatus LoadNpParams(const OPTConfig& config, const std::string& path,
                      bool dummy, TensorMap* params);
LsStatus LoadNpzParams(const OPTConfig& config, const std::string& path,
                       bool dummy, TensorMap* params);
/**
 * Dispatch on the path suffix: "np" a directory of .npy files, "npz" an
 * archive. "ts" (tensorstore) gives LMSPARK_INVALID_CALL_ERROR, anything
 * else LMSPARK_PARAM_ERROR.
 */
LsStatus LoadParams(const OPTConfig& config, const std::string& path,
                    bool dummy, TensorMap* params);

}  // namespace lmspark
