/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    operator_opt_mha_test.cpp
 */

#include <runtime/cache/attention_cache.h>

#include "../test_operator_utils.h"

namespace LS_UTEST {

// causal attention over an interleaved qvk projection, column
// (h * hd + d) * 3 + j holds q (j = 0), v (j = 1) and k (j = 2)
static void CausalMHARef(const std::vector<float>& qvk, std::vector<float>& out,
                         std::vector<float>& probs, int batch, int seq,
                         int heads, int hd) {
  const int dim = heads * hd;
  const float alpha = 1.f / std::sqrt(static_cast<float>(hd));
  auto at = [&](int b, int t, int h, int d, int j) {
    return qvk[(static_cast<size_t>(b) * seq + t) * 3 * dim +
               (h * hd + d) * 3 + j];
  };
  out.assign(static_cast<size_t>(batch) * seq * dim, 0.f);
  probs.assign(static_cast<size_t>(batch) * heads * seq * seq, 0.f);
  for (int b = 0; b < batch; b++) {
    for (int h = 0; h < heads; h++) {
      for (int i = 0; i < seq; i++) {
        std::vector<double> score(i + 1);
        double max_s = -1e30;
        for (int t = 0; t <= i; t++) {
          double s = 0.0;
          for (int d = 0; d < hd; d++) s += at(b, i, h, d, 0) * at(b, t, h, d, 2);
          score[t] = s * alpha;
          max_s = std::max(max_s, score[t]);
        }
        double sum = 0.0;
        for (int t = 0; t <= i; t++) {
          score[t] = std::exp(score[t] - max_s);
          sum += score[t];
        }
        for (int t = 0; t <= i; t++) {
          float p = static_cast<float>(score[t] / sum);
          probs[((static_cast<size_t>(b) * heads + h) * seq + i) * seq + t] = p;
          for (int d = 0; d < hd; d++) {
            out[(static_cast<size_t>(b) * seq + i) * dim + h * hd + d] +=
                p * at(b, t, h, d, 1);
          }
        }
      }
    }
  }
}

// rows [begin, end) of every batch of a [b, s, w] buffer
static std::vector<float> SliceSeq(const std::vector<float>& x, int batch,
                                   int seq, int width, int begin, int end) {
  std::vector<float> y;
  for (int b = 0; b < batch; b++) {
    for (int t = begin; t < end; t++) {
      auto row = x.begin() + (static_cast<size_t>(b) * seq + t) * width;
      y.insert(y.end(), row, row + width);
    }
  }
  return y;
}

TEST(OptMHACPU, NoCacheMatchesReference) {
  const int batch = 2, seq = 5, heads = 2, hd = 4, dim = heads * hd;
  std::vector<float> qvk, ref_out, ref_probs;
  generate_random_data<float>(qvk, batch * seq * 3 * dim, -1.f, 1.f, 41);
  CausalMHARef(qvk, ref_out, ref_probs, batch, seq, heads, hd);

  TestOpUtil tu;
  tu.SetOpType("OptMHA");
  tu.SetOpName("attention.self");
  tu.SetOpAttribute<int>("num_heads", heads);
  tu.SetOpAttribute<bool>("output_attentions", true);
  tu.AddInput("qvk", {batch, seq, 3 * dim}, lmspark::DataType::FLOAT32, qvk,
              false);
  tu.AddOutput("context");
  tu.AddOutput("probs");
  tu.gen_ctx_.batch_size = batch;
  tu.gen_ctx_.seq_len = seq;
  tu.gen_ctx_.output_attentions = true;
  ASSERT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_SUCCESS);

  EXPECT_EQ(tu.GetTensorMap()["context"]->GetShape(),
            lmspark::Shape({batch, seq, dim}));
  EXPECT_EQ(tu.GetTensorMap()["probs"]->GetShape(),
            lmspark::Shape({batch, heads, seq, seq}));
  EXPECT_LT(MaxDiff(tu.GetOutput<float>("context"), ref_out), 1e-5f);
  EXPECT_LT(MaxDiff(tu.GetOutput<float>("probs"), ref_probs), 1e-5f);
}

TEST(OptMHACPU, CachedStepsMatchFullSequence) {
  const int batch = 2, seq = 6, heads = 2, hd = 4, dim = heads * hd;
  const int max_len = 8;
  std::vector<float> qvk, ref_out, ref_probs;
  generate_random_data<float>(qvk, batch * seq * 3 * dim, -1.f, 1.f, 42);
  CausalMHARef(qvk, ref_out, ref_probs, batch, seq, heads, hd);

  lmspark::AttentionCache cache(1, batch, max_len, heads, hd);
  TestOpUtil tu;
  tu.SetOpType("OptMHA");
  tu.SetOpName("attention.self");
  tu.SetOpAttribute<int>("num_heads", heads);
  tu.SetOpAttribute<int>("layer_index", 0);
  tu.AddInput("qvk", {batch, 3, 3 * dim}, lmspark::DataType::FLOAT32,
              SliceSeq(qvk, batch, seq, 3 * dim, 0, 3), false);
  tu.AddOutput("context");
  tu.gen_ctx_.batch_size = batch;
  tu.gen_ctx_.cache = &cache;

  // prompt of three tokens, then one token at a time
  tu.gen_ctx_.seq_len = 3;
  ASSERT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_SUCCESS);
  EXPECT_LT(MaxDiff(tu.GetOutput<float>("context"),
                    SliceSeq(ref_out, batch, seq, dim, 0, 3)),
            1e-5f);
  for (int t = 3; t < seq; t++) {
    tu.UpdateInput<float>("qvk", {batch, 1, 3 * dim},
                          SliceSeq(qvk, batch, seq, 3 * dim, t, t + 1));
    tu.gen_ctx_.seq_len = 1;
    ASSERT_EQ(tu.StepOp(), lmspark::LsStatus::LMSPARK_SUCCESS);
    EXPECT_LT(MaxDiff(tu.GetOutput<float>("context"),
                      SliceSeq(ref_out, batch, seq, dim, t, t + 1)),
              1e-5f)
        << "step " << t;
  }
  for (int b = 0; b < batch; b++) EXPECT_EQ(cache.Cursor(0, b), seq);
}

TEST(OptMHACPU, CacheOverflowLeavesCacheUntouched) {
  const int batch = 1, heads = 1, hd = 4, dim = heads * hd, max_len = 4;
  std::vector<float> qvk;
  generate_random_data<float>(qvk, batch * 3 * 3 * dim, -1.f, 1.f, 43);

  lmspark::AttentionCache cache(1, batch, max_len, heads, hd);
  TestOpUtil tu;
  tu.SetOpType("OptMHA");
  tu.SetOpAttribute<int>("num_heads", heads);
  tu.AddInput("qvk", {batch, 3, 3 * dim}, lmspark::DataType::FLOAT32, qvk,
              false);
  tu.AddOutput("context");
  tu.gen_ctx_.batch_size = batch;
  tu.gen_ctx_.seq_len = 3;
  tu.gen_ctx_.cache = &cache;
  ASSERT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_SUCCESS);
  ASSERT_EQ(cache.Cursor(0, 0), 3);
  auto keys_before = lmspark::TensorUtils::ToStdVector<float>(*cache.Key(0));

  // 3 + 2 > 4
  std::vector<float> step;
  generate_random_data<float>(step, batch * 2 * 3 * dim, -1.f, 1.f, 44);
  tu.UpdateInput<float>("qvk", {batch, 2, 3 * dim}, step);
  tu.gen_ctx_.seq_len = 2;
  EXPECT_EQ(tu.StepOp(), lmspark::LsStatus::LMSPARK_EXCEED_LIMIT_ERROR);
  EXPECT_EQ(cache.Cursor(0, 0), 3);
  EXPECT_EQ(MaxDiff(lmspark::TensorUtils::ToStdVector<float>(*cache.Key(0)),
                    keys_before),
            0.f);
}

TEST(OptMHACPU, CacheGeometryMismatch) {
  std::vector<float> qvk(1 * 1 * 3 * 8, 0.f);
  lmspark::AttentionCache cache(1, 1, 4, 4, 2);
  TestOpUtil tu;
  tu.SetOpType("OptMHA");
  tu.SetOpAttribute<int>("num_heads", 2);
  tu.AddInput("qvk", {1, 1, 24}, lmspark::DataType::FLOAT32, qvk, false);
  tu.AddOutput("context");
  tu.gen_ctx_.cache = &cache;
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_PARAM_ERROR);
}

TEST(OptMHACPU, MissingNumHeads) {
  std::vector<float> qvk(24, 0.f);
  TestOpUtil tu;
  tu.SetOpType("OptMHA");
  tu.AddInput("qvk", {1, 1, 24}, lmspark::DataType::FLOAT32, qvk, false);
  tu.AddOutput("context");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_PARAM_ERROR);
}

}  // namespace LS_UTEST
