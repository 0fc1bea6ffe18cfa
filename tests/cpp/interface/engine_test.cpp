/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    engine_test.cpp
 */

#include <core/model/opt/opt.h>
#include <interface/lmspark.h>
#include <test_common.h>

namespace LS_UTEST {

using lmspark::LsStatus;

static lmspark::OPTConfig EngineConfig() {
  lmspark::OPTConfig config;
  config.decoder_layers = 2;
  config.max_target_positions = 8;
  config.decoder_embed_dim = 8;
  config.decoder_attention_heads = 2;
  config.decoder_input_dim = 8;
  config.decoder_ffn_embed_dim = 16;
  config.vocab_size = 20;
  config.fp16 = false;
  config.version = 3;
  return config;
}

static lmspark::LsTensor Int64Tensor(const std::string& name,
                                     const std::vector<int64_t>& v, int batch,
                                     int seq) {
  lmspark::LsTensor t(name);
  lmspark::TensorUtils::DeepCopyFromStdVector(t, lmspark::Shape({batch, seq}),
                                              v);
  return t;
}

TEST(LsEngine, CallOrder) {
  lmspark::LsEngine engine;
  lmspark::TensorMap out;
  EXPECT_EQ(engine.LoadParams("ckpt.npz", true),
            LsStatus::LMSPARK_INVALID_CALL_ERROR);
  EXPECT_EQ(engine.ResetCache(1), LsStatus::LMSPARK_INVALID_CALL_ERROR);
  EXPECT_EQ(engine.InferenceStepNoCache(Int64Tensor("ids", {2}, 1, 1), &out),
            LsStatus::LMSPARK_INVALID_CALL_ERROR);
  EXPECT_FALSE(engine.GetVersionFull().empty());
}

TEST(LsEngine, BuildErrors) {
  lmspark::LsEngine engine;
  EXPECT_EQ(engine.BuildModelFromName("3B"), LsStatus::LMSPARK_PARAM_ERROR);
  EXPECT_EQ(engine.BuildModelFromConfigFile("/nonexistent/opt.prototxt"),
            LsStatus::LMSPARK_IO_ERROR);
  lmspark::OPTConfig config = EngineConfig();
  config.decoder_attention_heads = 3;
  EXPECT_EQ(engine.BuildModel(config), LsStatus::LMSPARK_PARAM_ERROR);
  ASSERT_EQ(engine.BuildModel(EngineConfig()), LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(engine.LoadParams("ckpt.pt", false), LsStatus::LMSPARK_PARAM_ERROR);
  EXPECT_EQ(engine.LoadParams("ckpt.ts", false),
            LsStatus::LMSPARK_INVALID_CALL_ERROR);
}

TEST(LsEngine, DummyRun) {
  lmspark::LsEngine engine;
  ASSERT_EQ(engine.BuildModel(EngineConfig()), LsStatus::LMSPARK_SUCCESS);
  ASSERT_EQ(engine.LoadParams("dummy.npz", true), LsStatus::LMSPARK_SUCCESS);

  std::vector<int64_t> ids = {3, 4, 5, 6, 7, 8};
  lmspark::TensorMap full;
  ASSERT_EQ(engine.InferenceStepNoCache(Int64Tensor("ids", ids, 2, 3), &full),
            LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(full["logits"]->GetShape(), lmspark::Shape({2, 3, 20}));
  auto full_logits =
      lmspark::TensorUtils::ToStdVector<float>(*full["logits"]);

  ASSERT_EQ(engine.ResetCache(2), LsStatus::LMSPARK_SUCCESS);
  lmspark::TensorMap step;
  ASSERT_EQ(engine.InferenceStepWithCache(
                Int64Tensor("ids", {3, 4, 6, 7}, 2, 2), &step),
            LsStatus::LMSPARK_SUCCESS);
  ASSERT_EQ(
      engine.InferenceStepWithCache(Int64Tensor("ids", {5, 8}, 2, 1), &step),
      LsStatus::LMSPARK_SUCCESS);
  auto last = lmspark::TensorUtils::ToStdVector<float>(*step["logits"]);
  std::vector<float> expect;
  for (int b = 0; b < 2; b++) {
    auto row = full_logits.begin() + (b * 3 + 2) * 20;
    expect.insert(expect.end(), row, row + 20);
  }
  EXPECT_LT(MaxDiff(last, expect), 1e-4f);

  // 3 cached tokens + 6 new exceed max_target_positions
  std::vector<int64_t> too_long(12, 3);
  std::vector<int64_t> pos(12, 2);
  lmspark::TensorMap out;
  EXPECT_EQ(engine.Forward(Int64Tensor("ids", too_long, 2, 6),
                           Int64Tensor("pos", pos, 2, 6), true, &out),
            LsStatus::LMSPARK_EXCEED_LIMIT_ERROR);
}

TEST(LsEngine, ForwardOutputs) {
  lmspark::LsEngine engine;
  ASSERT_EQ(engine.BuildModel(EngineConfig()), LsStatus::LMSPARK_SUCCESS);
  ASSERT_EQ(engine.LoadParams("dummy_np", true), LsStatus::LMSPARK_SUCCESS);
  std::vector<int64_t> ids = {1, 4, 5, 6};
  lmspark::LsTensor pos("pos");
  ASSERT_EQ(lmspark::BuildPositionIds(Int64Tensor("ids", ids, 1, 4), 1, &pos),
            LsStatus::LMSPARK_SUCCESS);
  lmspark::TensorMap out;
  ASSERT_EQ(engine.Forward(Int64Tensor("ids", ids, 1, 4), pos, false, &out,
                           true, true),
            LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(out.size(), 1u + 3u + 2u);
  EXPECT_EQ(out["attentions.1"]->GetShape(), lmspark::Shape({1, 2, 4, 4}));

  // input_ids must be INT64
  lmspark::LsTensor ids32("ids");
  lmspark::TensorUtils::DeepCopyFromStdVector(
      ids32, lmspark::Shape({1, 4}), std::vector<int32_t>{1, 4, 5, 6});
  EXPECT_EQ(engine.Forward(ids32, pos, false, &out),
            LsStatus::LMSPARK_PARAM_ERROR);
}

}  // namespace LS_UTEST
