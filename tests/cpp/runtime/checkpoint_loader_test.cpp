/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    checkpoint_loader_test.cpp
 */

#include <common/global_config.h>
#include <runtime/weight/checkpoint_loader.h>
#include <test_common.h>
#include <sys/stat.h>
#include <utility/npz_util.h>

namespace LS_UTEST {

using lmspark::DataType;
using lmspark::LsStatus;
using lmspark::LsTensor;
using lmspark::Shape;
using lmspark::TensorMap;

static lmspark::OPTConfig LoaderConfig() {
  lmspark::OPTConfig config;
  config.decoder_layers = 2;
  config.max_target_positions = 8;
  config.decoder_embed_dim = 8;
  config.decoder_attention_heads = 2;
  config.decoder_input_dim = 8;
  config.decoder_ffn_embed_dim = 16;
  config.vocab_size = 12;
  config.fp16 = false;
  config.version = 3;
  return config;
}

// fairseq checkpoint arrays, element i of the n-th array holds n * 1000 + i
static TensorMap FairseqCheckpoint(const lmspark::OPTConfig& config) {
  TensorMap ckpt;
  int counter = 0;
  auto add = [&](const std::string& key, Shape shape) {
    auto t = std::make_shared<LsTensor>(key, lmspark::DeviceType::CPU,
                                        DataType::FLOAT32,
                                        lmspark::DataMode::DENSE, shape);
    float* p = static_cast<float*>(t->GetDataPtr());
    for (int64_t i = 0; i < shape.Count(); i++) p[i] = counter * 1000.f + i;
    counter++;
    ckpt[key] = t;
  };
  const int64_t dim = config.decoder_embed_dim;
  const int64_t in_dim = config.decoder_input_dim;
  const int64_t ffn = config.decoder_ffn_embed_dim;
  add("decoder.embed_tokens.weight", Shape({config.vocab_size, in_dim}));
  add("decoder.embed_positions.weight",
      Shape({config.PositionTableSize(), dim}));
  if (config.HasProjectIn()) {
    add("decoder.project_in_dim.weight", Shape({dim, in_dim}));
    add("decoder.project_out_dim.weight", Shape({in_dim, dim}));
  }
  if (config.version > 2) {
    add("decoder.layer_norm.weight", Shape({dim}));
    add("decoder.layer_norm.bias", Shape({dim}));
  }
  if (not config.share_decoder_input_output_embed) {
    add("decoder.output_projection.weight", Shape({config.vocab_size, in_dim}));
  }
  for (int i = 0; i < config.decoder_layers; i++) {
    const std::string p = "decoder.layers." + std::to_string(i) + ".";
    for (const char* proj : {"q_proj", "k_proj", "v_proj", "out_proj"}) {
      add(p + "self_attn." + proj + ".weight", Shape({dim, dim}));
      add(p + "self_attn." + proj + ".bias", Shape({dim}));
    }
    add(p + "self_attn_layer_norm.weight", Shape({dim}));
    add(p + "self_attn_layer_norm.bias", Shape({dim}));
    add(p + "fc1.weight", Shape({ffn, dim}));
    add(p + "fc1.bias", Shape({ffn}));
    add(p + "fc2.weight", Shape({dim, ffn}));
    add(p + "fc2.bias", Shape({dim}));
    add(p + "final_layer_norm.weight", Shape({dim}));
    add(p + "final_layer_norm.bias", Shape({dim}));
  }
  return ckpt;
}

static void SaveNpDir(const std::string& dir, const TensorMap& ckpt) {
  for (auto& kv : ckpt) {
    lmspark::util::npy_save(dir + "/" + kv.first + ".npy", *kv.second);
  }
}

static const float* F(const TensorMap& m, const std::string& name) {
  return static_cast<const float*>(m.at(name)->GetDataPtr());
}

class CheckpointLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override { tmp_dir_ = MakeTempDir("ckpt"); }
  void TearDown() override { RemoveTree(tmp_dir_); }

  // every parameter present with its expected shape, as FLOAT32
  void CheckTree(const lmspark::OPTConfig& config, const TensorMap& params) {
    auto expected = lmspark::ExpectedParamShapes(config);
    EXPECT_EQ(params.size(), expected.size());
    for (auto& kv : expected) {
      auto it = params.find(kv.first);
      ASSERT_NE(it, params.end()) << kv.first;
      EXPECT_EQ(it->second->GetShape(), kv.second.shape) << kv.first;
      EXPECT_EQ(it->second->GetDataType(), DataType::FLOAT32) << kv.first;
    }
  }

  // q / v / k columns interleaved, other kernels transposed
  void CheckRemap(const lmspark::OPTConfig& config, const TensorMap& ckpt,
                  const TensorMap& params) {
    const std::string pre = lmspark::kParamPrefix;
    const int dim = config.decoder_embed_dim;
    const int ffn = config.decoder_ffn_embed_dim;
    for (int i = 0; i < config.decoder_layers; i++) {
      const std::string src = "decoder.layers." + std::to_string(i) + ".";
      const std::string dst = pre + "encoder." + std::to_string(i) + ".";
      const float* kernel =
          F(params, dst + "attention.self.qvk_combined.kernel");
      const float* bias = F(params, dst + "attention.self.qvk_combined.bias");
      const char* order[3] = {"q_proj", "v_proj", "k_proj"};
      for (int j = 0; j < 3; j++) {
        const float* w = F(ckpt, src + "self_attn." + order[j] + ".weight");
        const float* b = F(ckpt, src + "self_attn." + order[j] + ".bias");
        for (int c = 0; c < dim; c++) {
          for (int k = 0; k < dim; k++) {
            ASSERT_EQ(kernel[k * 3 * dim + c * 3 + j], w[c * dim + k])
                << "layer " << i << " " << order[j] << " c=" << c
                << " k=" << k;
          }
          ASSERT_EQ(bias[c * 3 + j], b[c]);
        }
      }
      const float* fc1 = F(params, dst + "ffn.fc1.kernel");
      const float* fc1_w = F(ckpt, src + "fc1.weight");
      for (int o = 0; o < ffn; o++) {
        for (int k = 0; k < dim; k++) {
          ASSERT_EQ(fc1[k * ffn + o], fc1_w[o * dim + k]);
        }
      }
      const float* dense = F(params, dst + "attention.dense.kernel");
      const float* out_w = F(ckpt, src + "self_attn.out_proj.weight");
      EXPECT_EQ(dense[1 * dim + 0], out_w[0 * dim + 1]);
      EXPECT_EQ(F(params, dst + "ffn.layer_norm.scale")[3],
                F(ckpt, src + "final_layer_norm.weight")[3]);
    }
    EXPECT_EQ(F(params, pre + "embeddings.word_embeddings.embedding")[5],
              F(ckpt, "decoder.embed_tokens.weight")[5]);
    EXPECT_EQ(F(params, pre + "layer_norm.bias")[2],
              F(ckpt, "decoder.layer_norm.bias")[2]);
  }

  std::string tmp_dir_;
};

TEST_F(CheckpointLoaderTest, NpDirectory) {
  auto config = LoaderConfig();
  auto ckpt = FairseqCheckpoint(config);
  const std::string dir = tmp_dir_ + "/opt_np";
  ASSERT_EQ(mkdir(dir.c_str(), 0755), 0);
  SaveNpDir(dir, ckpt);

  TensorMap params;
  ASSERT_EQ(lmspark::LoadParams(config, dir + "/", false, &params),
            LsStatus::LMSPARK_SUCCESS);
  CheckTree(config, params);
  CheckRemap(config, ckpt, params);
}

TEST_F(CheckpointLoaderTest, NpzArchive) {
  auto config = LoaderConfig();
  config.decoder_input_dim = 4;
  config.share_decoder_input_output_embed = false;
  auto ckpt = FairseqCheckpoint(config);
  const std::string path = tmp_dir_ + "/opt.npz";
  lmspark::util::npz_save(path, ckpt);

  TensorMap params;
  ASSERT_EQ(lmspark::LoadParams(config, path, false, &params),
            LsStatus::LMSPARK_SUCCESS);
  CheckTree(config, params);
  CheckRemap(config, ckpt, params);
  // [vocab, in_dim] -> [in_dim, vocab]
  const std::string pre = lmspark::kParamPrefix;
  EXPECT_EQ(F(params, pre + "decoder.kernel")[2 * config.vocab_size + 7],
            F(ckpt, "decoder.output_projection.weight")[7 * 4 + 2]);
  EXPECT_EQ(F(params, pre + "embeddings.project_in.kernel")[1 * 8 + 3],
            F(ckpt, "decoder.project_in_dim.weight")[3 * 4 + 1]);
}

TEST_F(CheckpointLoaderTest, Fp16CheckpointIsWidened) {
  auto config = LoaderConfig();
  config.fp16 = true;
  TensorMap ckpt;
  for (auto& kv : FairseqCheckpoint(config)) {
    // 0x3C00 is 1.0, 0xC000 is -2.0
    std::vector<uint16_t> half(kv.second->GetShape().Count());
    for (size_t i = 0; i < half.size(); i++) {
      half[i] = i % 2 ? 0xC000 : 0x3C00;
    }
    auto t = std::make_shared<LsTensor>(kv.first);
    lmspark::TensorUtils::DeepCopyFromStdVector(*t, kv.second->GetShape(),
                                                half);
    ckpt[kv.first] = t;
  }
  const std::string path = tmp_dir_ + "/half.npz";
  lmspark::util::npz_save(path, ckpt);

  TensorMap params;
  ASSERT_EQ(lmspark::LoadParams(config, path, false, &params),
            LsStatus::LMSPARK_SUCCESS);
  CheckTree(config, params);
  const float* emb = F(params, std::string(lmspark::kParamPrefix) +
                                   "embeddings.word_embeddings.embedding");
  EXPECT_EQ(emb[0], 1.f);
  EXPECT_EQ(emb[1], -2.f);
}

TEST_F(CheckpointLoaderTest, DtypeMismatch) {
  auto config = LoaderConfig();
  config.fp16 = true;
  const std::string path = tmp_dir_ + "/float.npz";
  lmspark::util::npz_save(path, FairseqCheckpoint(config));
  TensorMap params;
  EXPECT_EQ(lmspark::LoadParams(config, path, false, &params),
            LsStatus::LMSPARK_PARAM_ERROR);
}

TEST_F(CheckpointLoaderTest, ShapeMismatch) {
  auto config = LoaderConfig();
  auto ckpt = FairseqCheckpoint(config);
  ckpt["decoder.layers.1.fc1.weight"] = std::make_shared<LsTensor>(
      "decoder.layers.1.fc1.weight", lmspark::DeviceType::CPU,
      DataType::FLOAT32, lmspark::DataMode::DENSE, Shape({8, 16}));
  const std::string path = tmp_dir_ + "/bad.npz";
  lmspark::util::npz_save(path, ckpt);
  TensorMap params;
  EXPECT_EQ(lmspark::LoadParams(config, path, false, &params),
            LsStatus::LMSPARK_PARAM_ERROR);
}

TEST_F(CheckpointLoaderTest, MissingArray) {
  auto config = LoaderConfig();
  auto ckpt = FairseqCheckpoint(config);
  ckpt.erase("decoder.layers.0.self_attn.k_proj.bias");
  const std::string dir = tmp_dir_ + "/partial_np";
  ASSERT_EQ(mkdir(dir.c_str(), 0755), 0);
  SaveNpDir(dir, ckpt);
  TensorMap params;
  EXPECT_EQ(lmspark::LoadNpParams(config, dir, false, &params),
            LsStatus::LMSPARK_IO_ERROR);
}

TEST_F(CheckpointLoaderTest, MissingArchive) {
  TensorMap params;
  EXPECT_EQ(lmspark::LoadParams(LoaderConfig(), tmp_dir_ + "/none.npz", false,
                                &params),
            LsStatus::LMSPARK_IO_ERROR);
}

TEST_F(CheckpointLoaderTest, PathSuffixDispatch) {
  TensorMap params;
  EXPECT_EQ(lmspark::LoadParams(LoaderConfig(), tmp_dir_ + "/ckpt.ts", false,
                                &params),
            LsStatus::LMSPARK_INVALID_CALL_ERROR);
  EXPECT_EQ(lmspark::LoadParams(LoaderConfig(), tmp_dir_ + "/ckpt.bin", false,
                                &params),
            LsStatus::LMSPARK_PARAM_ERROR);
}

TEST_F(CheckpointLoaderTest, DummyReadsNothing) {
  auto config = LoaderConfig();
  TensorMap params;
  ASSERT_EQ(lmspark::LoadParams(config, tmp_dir_ + "/nowhere_np", true,
                                &params),
            LsStatus::LMSPARK_SUCCESS);
  CheckTree(config, params);
  const std::string pre = lmspark::kParamPrefix;
  EXPECT_EQ(F(params, pre + "encoder.0.ffn.layer_norm.scale")[0], 1.f);
  EXPECT_EQ(F(params, pre + "encoder.1.ffn.fc1.bias")[0], 0.f);
}

TEST_F(CheckpointLoaderTest, GlobalDummyFlagSkipsReading) {
  lmspark::GlobalConfigProto proto;
  proto.set_use_dummy_value_for_benchmarking(true);
  lmspark::GlobalConfig& global = lmspark::GlobalConfig::Instance();
  ASSERT_EQ(global.MergeFrom(proto), LsStatus::LMSPARK_SUCCESS);
  auto config = LoaderConfig();
  TensorMap params;
  LsStatus status = lmspark::LoadParams(config, tmp_dir_ + "/absent.npz",
                                        false, &params);
  global.use_dummy_value_for_benchmarking = false;
  ASSERT_EQ(status, LsStatus::LMSPARK_SUCCESS);
  CheckTree(config, params);
  EXPECT_EQ(lmspark::LoadParams(config, tmp_dir_ + "/absent.npz", false,
                                &params),
            LsStatus::LMSPARK_IO_ERROR);
}

TEST(ExpectedParamShapes, FollowsConfig) {
  auto config = LoaderConfig();
  auto shared = lmspark::ExpectedParamShapes(config);
  EXPECT_EQ(shared.size(), 4u + 2u * 12u);
  const std::string pre = lmspark::kParamPrefix;
  EXPECT_EQ(shared.at(pre + "encoder.0.attention.self.qvk_combined.kernel")
                .shape,
            Shape({8, 24}));
  EXPECT_EQ(shared.at(pre + "embeddings.position_embeddings.embedding").shape,
            Shape({10, 8}));
  EXPECT_EQ(shared.count(pre + "decoder.kernel"), 0u);

  config.version = 2;
  config.decoder_input_dim = 4;
  config.share_decoder_input_output_embed = false;
  config.fp16 = true;
  auto full = lmspark::ExpectedParamShapes(config);
  EXPECT_EQ(full.count(pre + "layer_norm.scale"), 0u);
  EXPECT_EQ(full.at(pre + "decoder.kernel").shape, Shape({4, 12}));
  EXPECT_EQ(full.at(pre + "embeddings.project_in.kernel").shape,
            Shape({4, 8}));
  EXPECT_EQ(full.at(pre + "project_out.kernel").shape, Shape({8, 4}));
  EXPECT_EQ(full.at(pre + "decoder.kernel").dtype, DataType::FLOAT16);
}

}  // namespace LS_UTEST
