/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    operator_layernorm_test.cpp
 */

#include "../test_operator_utils.h"

namespace LS_UTEST {

static void LayerNormRef(const std::vector<float>& in,
                         const std::vector<float>& gamma,
                         const std::vector<float>& beta,
                         std::vector<float>& out, int m, int n, float eps) {
  out.resize(in.size());
  for (int i = 0; i < m; i++) {
    double mean = 0.0, var = 0.0;
    for (int j = 0; j < n; j++) mean += in[i * n + j];
    mean /= n;
    for (int j = 0; j < n; j++) {
      double d = in[i * n + j] - mean;
      var += d * d;
    }
    var /= n;
    double rstd = 1.0 / std::sqrt(var + eps);
    for (int j = 0; j < n; j++) {
      out[i * n + j] =
          static_cast<float>((in[i * n + j] - mean) * rstd * gamma[j] + beta[j]);
    }
  }
}

TEST(LayerNormCPU, Basic) {
  const int batch = 2, seq = 3, hidden = 16;
  const float eps = 1e-5f;
  std::vector<float> in, gamma, beta, ref;
  generate_random_data<float>(in, batch * seq * hidden, -2.f, 2.f, 1);
  generate_random_data<float>(gamma, hidden, 0.5f, 1.5f, 2);
  generate_random_data<float>(beta, hidden, -0.5f, 0.5f, 3);
  LayerNormRef(in, gamma, beta, ref, batch * seq, hidden, eps);

  TestOpUtil tu;
  tu.SetOpType("LayerNorm");
  tu.SetOpName("ln");
  tu.SetOpAttribute<float>("eps", eps);
  tu.AddInput("input", {batch, seq, hidden}, lmspark::DataType::FLOAT32, in,
              false);
  tu.AddInput("gamma", {hidden}, lmspark::DataType::FLOAT32, gamma, true);
  tu.AddInput("beta", {hidden}, lmspark::DataType::FLOAT32, beta, true);
  tu.AddOutput("output");
  ASSERT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_SUCCESS);

  auto out_tensor = tu.GetTensorMap()["output"];
  EXPECT_EQ(out_tensor->GetShape(), lmspark::Shape({batch, seq, hidden}));
  EXPECT_LT(MaxDiff(tu.GetOutput<float>("output"), ref), 1e-4f);
}

TEST(LayerNormCPU, MissingEps) {
  std::vector<float> ones(8, 1.f);
  TestOpUtil tu;
  tu.SetOpType("LayerNorm");
  tu.AddInput("input", {1, 8}, lmspark::DataType::FLOAT32, ones, false);
  tu.AddInput("gamma", {8}, lmspark::DataType::FLOAT32, ones, true);
  tu.AddInput("beta", {8}, lmspark::DataType::FLOAT32, ones, true);
  tu.AddOutput("output");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_PARAM_ERROR);
}

TEST(LayerNormCPU, HiddenMismatch) {
  std::vector<float> in(12, 1.f), w(8, 1.f);
  TestOpUtil tu;
  tu.SetOpType("LayerNorm");
  tu.SetOpAttribute<float>("eps", 1e-5f);
  tu.AddInput("input", {1, 12}, lmspark::DataType::FLOAT32, in, false);
  tu.AddInput("gamma", {8}, lmspark::DataType::FLOAT32, w, true);
  tu.AddInput("beta", {8}, lmspark::DataType::FLOAT32, w, true);
  tu.AddOutput("output");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_PARAM_ERROR);
}

}  // namespace LS_UTEST
