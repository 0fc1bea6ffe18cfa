/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    ls_engine.cpp
 */

#include <common/global_config.h>
#include <core/model/opt/opt.h>
#include <device/cpu/cpu_context.h>
#include <interface/lmspark.h>
#include <runtime/weight/checkpoint_loader.h>
#include <utility/lmspark_logging.h>

#include <cstdio>
#include <exception>

#ifndef LMSPARK_VERSION_MAJOR
#define LMSPARK_VERSION_MAJOR "0"
#endif
#ifndef LMSPARK_VERSION_MINOR
#define LMSPARK_VERSION_MINOR "0"
#endif
#ifndef LMSPARK_VERSION_PATCH
#define LMSPARK_VERSION_PATCH "0"
#endif

// converts an exception escaping the engine into a status
#define LS_ENGINE_CATCH(func_name)                                     \
  catch (LsException & e) {                                            \
    LOG(ERROR) << func_name << " failed with exception: " << e.what(); \
    return LsGetCodeByError(e.what());                                 \
  }                                                                    \
  catch (std::invalid_argument & e) {                                  \
    LOG(ERROR) << func_name << " invalid argument: " << e.what();      \
    return LsStatus::LMSPARK_PARAM_ERROR;                              \
  }                                                                    \
  catch (std::bad_alloc & e) {                                         \
    LOG(ERROR) << func_name << " out of memory: " << e.what();         \
    return LsStatus::LMSPARK_MEMORY_ERROR;                             \
  }                                                                    \
  catch (std::exception & e) {                                         \
    LOG(ERROR) << func_name << " failed with exception: " << e.what(); \
    return LsStatus::LMSPARK_UNKNOWN_ERROR;                            \
  }

namespace lmspark {

class LsEngineImpl final {
 public:
  LsEngineImpl();
  ~LsEngineImpl() = default;

  LsStatus BuildModel(const OPTConfig& config);
  LsStatus LoadParams(const std::string& path, bool dummy);
  LsStatus Forward(const LsTensor& input_ids, const LsTensor& position_ids,
                   bool use_cache, TensorMap* outputs, bool output_attentions,
                   bool output_hidden_states);
  LsStatus InferenceStepNoCache(const LsTensor& input_ids, TensorMap* outputs);
  LsStatus InferenceStepWithCache(const LsTensor& input_ids,
                                  TensorMap* outputs);
  LsStatus ResetCache(int batch_size);
  std::string GetVersionFull();

 private:
  LsStatus CheckModelReady(const char* func_name) const;
  AttentionCache* CacheFor(const LsTensor& input_ids);

  std::unique_ptr<CPUContext> device_ctx_;
  std::unique_ptr<OPTConfig> config_;
  std::unique_ptr<OPTModel> model_;
  std::unique_ptr<AttentionCache> cache_;
};

LsEngineImpl::LsEngineImpl() : device_ctx_(std::make_unique<CPUContext>()) {
  util::ls_init_log();
  LOG(INFO) << "lmspark init with version: " << GetVersionFull();
}

std::string LsEngineImpl::GetVersionFull() {
  char buf[64];
  snprintf(buf, sizeof(buf), "%s.%s.%s", LMSPARK_VERSION_MAJOR,
           LMSPARK_VERSION_MINOR, LMSPARK_VERSION_PATCH);
  return std::string(buf);
}

LsStatus LsEngineImpl::BuildModel(const OPTConfig& config) {
  DLOG(INFO) << "LsEngineImpl::BuildModel()";
  LS_CHECK_STATUS(config.Validate());
  config_ = std::make_unique<OPTConfig>(config);
  model_.reset();
  cache_.reset();
  LOG(INFO) << "Build model: " << config_->ToString();
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LsEngineImpl::LoadParams(const std::string& path, bool dummy) {
  DLOG(INFO) << "LsEngineImpl::LoadParams()";
  if (!config_) {
    LOG(ERROR) << "LoadParams called before BuildModel";
    return LsStatus::LMSPARK_INVALID_CALL_ERROR;
  }
  TensorMap params;
  LS_CHECK_STATUS(lmspark::LoadParams(*config_, path, dummy, &params));
  auto model = std::make_unique<OPTModel>();
  LS_CHECK_STATUS(model->Init(*config_, *device_ctx_, params));
  model_ = std::move(model);
  cache_.reset();
  return LsStatus::LMSPARK_SUCCESS;
}

LsStatus LsEngineImpl::CheckModelReady(const char* func_name) const {
  if (!model_) {
    LOG(ERROR) << func_name << " called before LoadParams";
    return LsStatus::LMSPARK_INVALID_CALL_ERROR;
  }
  return LsStatus::LMSPARK_SUCCESS;
}

AttentionCache* LsEngineImpl::CacheFor(const LsTensor& input_ids) {
  if (!cache_) {
    const Shape& shape = input_ids.GetShape();
    const int batch_size = shape.Size() > 0 ? shape[0] : config_->batch_size;
    cache_ = BuildInitCache(*config_, batch_size);
  }
  return cache_.get();
}

LsStatus LsEngineImpl::Forward(const LsTensor& input_ids,
                               const LsTensor& position_ids, bool use_cache,
                               TensorMap* outputs, bool output_attentions,
                               bool output_hidden_states) {
  LS_CHECK_STATUS(CheckModelReady("Forward"));
  AttentionCache* cache = use_cache ? CacheFor(input_ids) : nullptr;
  return model_->Forward(input_ids, position_ids, cache, outputs,
                         output_attentions, output_hidden_states);
}

LsStatus LsEngineImpl::InferenceStepNoCache(const LsTensor& input_ids,
                                            TensorMap* outputs) {
  LS_CHECK_STATUS(CheckModelReady("InferenceStepNoCache"));
  return model_->InferenceStepNoCache(input_ids, outputs);
}

LsStatus LsEngineImpl::InferenceStepWithCache(const LsTensor& input_ids,
                                              TensorMap* outputs) {
  LS_CHECK_STATUS(CheckModelReady("InferenceStepWithCache"));
  return model_->InferenceStepWithCache(input_ids, CacheFor(input_ids),
                                        outputs);
}

LsStatus LsEngineImpl::ResetCache(int batch_size) {
  if (!config_) {
    LOG(ERROR) << "ResetCache called before BuildModel";
    return LsStatus::LMSPARK_INVALID_CALL_ERROR;
  }
  if (batch_size <= 0) {
    LOG(ERROR) << "ResetCache: invalid batch size " << batch_size;
    return LsStatus::LMSPARK_PARAM_ERROR;
  }
  cache_ = BuildInitCache(*config_, batch_size);
  return LsStatus::LMSPARK_SUCCESS;
}

LsEngine::LsEngine() : ls_engine_impl_(std::make_unique<LsEngineImpl>()) {}
LsEngine::~LsEngine() = default;

LsStatus LsEngine::BuildModel(const OPTConfig& config) {
  try {
    return ls_engine_impl_->BuildModel(config);
  }
  LS_ENGINE_CATCH("BuildModel")
}

LsStatus LsEngine::BuildModelFromName(const std::string& name) {
  try {
    OPTConfig config;
    LS_CHECK_STATUS(GetOPTConfig(name, &config));
    return ls_engine_impl_->BuildModel(config);
  }
  LS_ENGINE_CATCH("BuildModelFromName")
}

LsStatus LsEngine::BuildModelFromConfigFile(const std::string& path) {
  try {
    OPTConfig config;
    LS_CHECK_STATUS(ParseOPTConfigFromTextFile(path, &config));
    return ls_engine_impl_->BuildModel(config);
  }
  LS_ENGINE_CATCH("BuildModelFromConfigFile")
}

LsStatus LsEngine::LoadParams(const std::string& path, bool dummy) {
  try {
    return ls_engine_impl_->LoadParams(path, dummy);
  }
  LS_ENGINE_CATCH("LoadParams")
}

LsStatus LsEngine::Forward(const LsTensor& input_ids,
                           const LsTensor& position_ids, bool use_cache,
                           TensorMap* outputs, bool output_attentions,
                           bool output_hidden_states) {
  try {
    return ls_engine_impl_->Forward(input_ids, position_ids, use_cache,
                                    outputs, output_attentions,
                                    output_hidden_states);
  }
  LS_ENGINE_CATCH("Forward")
}

LsStatus LsEngine::InferenceStepNoCache(const LsTensor& input_ids,
                                        TensorMap* outputs) {
  try {
    return ls_engine_impl_->InferenceStepNoCache(input_ids, outputs);
  }
  LS_ENGINE_CATCH("InferenceStepNoCache")
}

LsStatus LsEngine::InferenceStepWithCache(const LsTensor& input_ids,
                                          TensorMap* outputs) {
  try {
    return ls_engine_impl_->InferenceStepWithCache(input_ids, outputs);
  }
  LS_ENGINE_CATCH("InferenceStepWithCache")
}

LsStatus LsEngine::ResetCache(int batch_size) {
  try {
    return ls_engine_impl_->ResetCache(batch_size);
  }
  LS_ENGINE_CATCH("ResetCache")
}

std::string LsEngine::GetVersionFull() {
  return ls_engine_impl_->GetVersionFull();
}

}  // namespace lmspark
