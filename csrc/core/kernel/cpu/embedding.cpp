/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    embedding.cpp
 */

#include "cpu_common.h"
#include "cpu_kernel.h"
namespace lmspark {
namespace cpu {

template <typename T>
void EmbeddingKernelLauncher(T* out_tensor, const int64_t* ids,
                             const T* table, int64_t num_tokens, int width,
                             float scale) {
  int64_t N = num_tokens * width;
  parallel_for(N, [&](int64_t idx) {
    int64_t row_idx = idx / width;
    int64_t col_idx = idx % width;
    out_tensor[idx] = table[ids[row_idx] * width + col_idx] * scale;
  });
}

template void EmbeddingKernelLauncher<float>(float* out_tensor,
                                             const int64_t* ids,
                                             const float* table,
                                             int64_t num_tokens, int width,
                                             float scale);

void PositionIdsKernel(int64_t* position_ids, const int64_t* input_ids,
                       int batch_size, int seq_len, int64_t pad) {
  parallel_for(batch_size, [&](int b) {
    int64_t cumsum = 0;
    for (int i = 0; i < seq_len; i++) {
      int64_t idx = static_cast<int64_t>(b) * seq_len + i;
      int64_t mask = input_ids[idx] != pad ? 1 : 0;
      cumsum += mask;
      position_ids[idx] = cumsum * mask + pad;
    }
  });
}

}  // namespace cpu
}  // namespace lmspark
