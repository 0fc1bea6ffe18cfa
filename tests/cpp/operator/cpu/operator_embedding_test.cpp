/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    operator_embedding_test.cpp
 */

#include "../test_operator_utils.h"

namespace LS_UTEST {

TEST(EmbeddingCPU, LookupAndScale) {
  const int vocab = 10, width = 6;
  const float scale = 2.5f;
  std::vector<float> table;
  generate_random_data<float>(table, vocab * width, -1.f, 1.f, 31);
  std::vector<int64_t> ids = {0, 3, 9, 3, 1, 7};

  std::vector<float> ref;
  for (int64_t id : ids) {
    for (int j = 0; j < width; j++) ref.push_back(table[id * width + j] * scale);
  }

  TestOpUtil tu;
  tu.SetOpType("Embedding");
  tu.SetOpName("embedding");
  tu.SetOpAttribute<float>("scale", scale);
  tu.AddInput("ids", {2, 3}, lmspark::DataType::INT64, ids, false);
  tu.AddInput("table", {vocab, width}, lmspark::DataType::FLOAT32, table,
              true);
  tu.AddOutput("output");
  ASSERT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_SUCCESS);
  EXPECT_EQ(tu.GetTensorMap()["output"]->GetShape(),
            lmspark::Shape({2, 3, width}));
  EXPECT_LT(MaxDiff(tu.GetOutput<float>("output"), ref), 1e-6f);
}

TEST(EmbeddingCPU, IdOutOfRange) {
  std::vector<float> table(4 * 2, 0.f);
  std::vector<int64_t> ids = {1, 4};
  TestOpUtil tu;
  tu.SetOpType("Embedding");
  tu.AddInput("ids", {1, 2}, lmspark::DataType::INT64, ids, false);
  tu.AddInput("table", {4, 2}, lmspark::DataType::FLOAT32, table, true);
  tu.AddOutput("output");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_EXCEED_LIMIT_ERROR);
}

TEST(EmbeddingCPU, NegativeId) {
  std::vector<float> table(4 * 2, 0.f);
  std::vector<int64_t> ids = {-1};
  TestOpUtil tu;
  tu.SetOpType("Embedding");
  tu.AddInput("ids", {1, 1}, lmspark::DataType::INT64, ids, false);
  tu.AddInput("table", {4, 2}, lmspark::DataType::FLOAT32, table, true);
  tu.AddOutput("output");
  EXPECT_EQ(tu.RunOp(), lmspark::LsStatus::LMSPARK_EXCEED_LIMIT_ERROR);
}

}  // namespace LS_UTEST
