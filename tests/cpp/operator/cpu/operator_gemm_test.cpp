/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    operator_gemm_test.cpp
 */

#include "../test_operator_utils.h"

namespace LS_UTEST {

// C[m, n] = A[m, k] * B + bias, B is [k, n] or [n, k] when transB
static void GemmRef(const std::vector<float>& A, const std::vector<float>& B,
                    const std::vector<float>* bias, std::vector<float>& C,
                    int M, int N, int K, bool transB) {
  C.assign(static_cast<size_t>(M) * N, 0.f);
  for (int mi = 0; mi < M; ++mi) {
    for (int ni = 0; ni < N; ++ni) {
      float sum_t = bias ? (*bias)[ni] : 0.f;
      for (int ki = 0; ki < K; ++ki) {
        float b = transB ? B[ni * K + ki] : B[ki * N + ni];
        sum_t += A[mi * K + ki] * b;
      }
      C[mi * N + ni] = sum_t;
    }
  }
}

static void TestGemm(const int BS, const int M, const int N, const int K,
                     bool transB, bool with_bias, const float EPS = 1e-4) {
  std::vector<float> Ahost, Bhost, bias, ChostRef;
  generate_random_data<float>(Ahost, BS * M * K, -1.f, 1.f, 11);
  generate_random_data<float>(Bhost, N * K, -1.f, 1.f, 12);
  generate_random_data<float>(bias, N, -1.f, 1.f, 13);
  GemmRef(Ahost, Bhost, with_bias ? &bias : nullptr, ChostRef, BS * M, N, K,
          transB);

  TestOpUtil tu;
  tu.SetOpType("Gemm");
  tu.SetOpName("gemm");
  if (transB) tu.SetOpAttribute<bool>("transB", true);
  std::vector<int64_t> BShape =
      transB ? std::vector<int64_t>{N, K} : std::vector<int64_t>{K, N};
  tu.AddInput("input", {BS, M, K}, lmspark::DataType::FLOAT32, Ahost, false);
  tu.AddInput("weight", BShape, lmspark::DataType::FLOAT32, Bhost, true);
  if (with_bias) {
    tu.AddInput("bias", {N}, lmspark::DataType::FLOAT32, bias, true);
  }
  tu.AddOutput("output");
  ASSERT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_SUCCESS);

  auto out_tensor = tu.GetTensorMap()["output"];
  EXPECT_EQ(out_tensor->GetShape(), lmspark::Shape({BS, M, N}));
  float max_diff = MaxDiff(tu.GetOutput<float>("output"), ChostRef);
  EXPECT_LT(max_diff, EPS);
}

TEST(GemmCPU, Bias) { TestGemm(2, 3, 24, 16, false, true); }

TEST(GemmCPU, NoBias) { TestGemm(1, 5, 8, 32, false, false); }

TEST(GemmCPU, TransB) { TestGemm(2, 4, 40, 16, true, false); }

TEST(GemmCPU, InnerDimMismatch) {
  std::vector<float> A(2 * 12, 1.f), B(16 * 4, 1.f);
  TestOpUtil tu;
  tu.SetOpType("Gemm");
  tu.AddInput("input", {2, 12}, lmspark::DataType::FLOAT32, A, false);
  tu.AddInput("weight", {16, 4}, lmspark::DataType::FLOAT32, B, true);
  tu.AddOutput("output");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_PARAM_ERROR);
}

TEST(GemmCPU, BadBiasShape) {
  std::vector<float> A(16, 1.f), B(16 * 4, 1.f), bias(5, 0.f);
  TestOpUtil tu;
  tu.SetOpType("Gemm");
  tu.AddInput("input", {1, 16}, lmspark::DataType::FLOAT32, A, false);
  tu.AddInput("weight", {16, 4}, lmspark::DataType::FLOAT32, B, true);
  tu.AddInput("bias", {5}, lmspark::DataType::FLOAT32, bias, true);
  tu.AddOutput("output");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_PARAM_ERROR);
}

}  // namespace LS_UTEST
