/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    opt_config_test.cpp
 */

#include <core/model/opt/opt_config.h>
#include <test_common.h>

#include <fstream>

namespace LS_UTEST {

using lmspark::LsStatus;
using lmspark::OPTConfig;

TEST(OPTConfig, KnownNames) {
  auto names = lmspark::GetOPTModelNames();
  for (const char* name : {"125M", "1.3B", "2.7B", "6.7B", "30B", "175B"}) {
    EXPECT_NE(std::find(names.begin(), names.end(), name), names.end())
        << name;
  }
  for (auto& name : names) {
    OPTConfig config;
    ASSERT_EQ(lmspark::GetOPTConfig(name, &config), LsStatus::LMSPARK_SUCCESS);
    EXPECT_EQ(config.Validate(), LsStatus::LMSPARK_SUCCESS) << name;
  }
}

TEST(OPTConfig, SizeTable) {
  OPTConfig config;
  ASSERT_EQ(lmspark::GetOPTConfig("125M", &config), LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(config.decoder_layers, 12);
  EXPECT_EQ(config.decoder_embed_dim, 768);
  EXPECT_EQ(config.decoder_attention_heads, 12);
  EXPECT_EQ(config.decoder_ffn_embed_dim, 3072);
  EXPECT_EQ(config.version, 1);
  EXPECT_EQ(config.HeadDim(), 64);
  EXPECT_EQ(config.PositionTableSize(), 2050);

  ASSERT_EQ(lmspark::GetOPTConfig("175B", &config), LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(config.decoder_layers, 96);
  EXPECT_EQ(config.decoder_embed_dim, 12288);
  EXPECT_EQ(config.decoder_attention_heads, 96);
  EXPECT_EQ(config.decoder_input_dim, 12288);
  EXPECT_EQ(config.version, 3);
}

TEST(OPTConfig, UnknownName) {
  OPTConfig config;
  EXPECT_EQ(lmspark::GetOPTConfig("7B", &config),
            LsStatus::LMSPARK_PARAM_ERROR);
}

TEST(OPTConfig, Overrides) {
  lmspark::OPTConfigProto overrides;
  overrides.set_decoder_layers(2);
  overrides.set_fp16(false);
  overrides.set_activation_fn("gelu");
  OPTConfig config;
  ASSERT_EQ(lmspark::GetOPTConfig("1.3B", overrides, &config),
            LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(config.decoder_layers, 2);
  EXPECT_EQ(config.decoder_embed_dim, 2048);
  EXPECT_FALSE(config.fp16);
  EXPECT_EQ(config.ActivationType(), lmspark::UnaryType::GELU_ERF);
}

TEST(OPTConfig, Validate) {
  OPTConfig config;
  EXPECT_EQ(config.Validate(), LsStatus::LMSPARK_SUCCESS);

  OPTConfig bad_heads = config;
  bad_heads.decoder_attention_heads = 7;
  EXPECT_EQ(bad_heads.Validate(), LsStatus::LMSPARK_PARAM_ERROR);

  OPTConfig post_ln = config;
  post_ln.decoder_normalize_before = false;
  EXPECT_EQ(post_ln.Validate(), LsStatus::LMSPARK_PARAM_ERROR);

  OPTConfig bad_act = config;
  bad_act.activation_fn = "softplus";
  EXPECT_EQ(bad_act.Validate(), LsStatus::LMSPARK_PARAM_ERROR);

  OPTConfig bad_stages = config;
  bad_stages.num_pp_stages = 5;
  EXPECT_EQ(bad_stages.Validate(), LsStatus::LMSPARK_PARAM_ERROR);
  bad_stages.num_pp_stages = 4;
  EXPECT_EQ(bad_stages.Validate(), LsStatus::LMSPARK_SUCCESS);
}

TEST(OPTConfig, EmbedScale) {
  OPTConfig config;
  EXPECT_FLOAT_EQ(config.EmbedScale(), 1.f);
  config.no_scale_embedding = false;
  config.decoder_embed_dim = 64;
  EXPECT_FLOAT_EQ(config.EmbedScale(), 8.f);
}

TEST(OPTConfig, ParseTextFile) {
  std::string dir = MakeTempDir("opt_config");
  std::string path = dir + "/opt.prototxt";
  {
    std::ofstream out(path);
    out << "name: \"2.7B\"\n"
        << "decoder_layers: 4\n"
        << "max_target_positions: 512\n"
        << "num_pp_stages: 2\n";
  }
  OPTConfig config;
  ASSERT_EQ(lmspark::ParseOPTConfigFromTextFile(path, &config),
            LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(config.decoder_layers, 4);
  EXPECT_EQ(config.decoder_embed_dim, 2560);
  EXPECT_EQ(config.max_target_positions, 512);
  EXPECT_EQ(config.num_pp_stages, 2);

  {
    std::ofstream out(path);
    out << "name: \"9B\"\n";
  }
  EXPECT_EQ(lmspark::ParseOPTConfigFromTextFile(path, &config),
            LsStatus::LMSPARK_PARAM_ERROR);
  RemoveTree(dir);
}

}  // namespace LS_UTEST
