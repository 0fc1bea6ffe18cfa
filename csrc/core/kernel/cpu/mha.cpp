/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    mha.cpp
 */

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "cpu_common.h"
#include "cpu_kernel.h"
namespace lmspark {
namespace cpu {

void vSoftmax(int n, float* vector) {
  float fmax = -std::numeric_limits<float>::max();
  for (int i = 0; i < n; i++) {
    fmax = std::max(fmax, vector[i]);
  }
  float fsum = 0.f;
  for (int i = 0; i < n; i++) {
    vector[i] = expf(vector[i] - fmax);
    fsum += vector[i];
  }
  float scale = 1.f / fsum;
  for (int i = 0; i < n; i++) {
    vector[i] *= scale;
  }
}

template <typename T>
void SplitQVKLauncher(const T* qvk, T* query, T* key_dst, T* value_dst,
                      const int* past_len, int batch_size, int seq_len,
                      int num_heads, int size_per_head, int kv_cap) {
  const int hidden_size = num_heads * size_per_head;
  const int64_t N = static_cast<int64_t>(batch_size) * seq_len * hidden_size;
  parallel_for(N, [&](int64_t idx) {
    int64_t row = idx / hidden_size;  // b * seq_len + i
    int col = idx % hidden_size;      // h * size_per_head + d
    int b = row / seq_len;
    int i = row % seq_len;
    const T* src = qvk + row * hidden_size * 3 + static_cast<int64_t>(col) * 3;
    int64_t kv_row = static_cast<int64_t>(b) * kv_cap + past_len[b] + i;
    query[idx] = src[0];
    value_dst[kv_row * hidden_size + col] = src[1];
    key_dst[kv_row * hidden_size + col] = src[2];
  });
}

template <typename T>
void CausalAttentionKernel(T* out, T* probs, const T* query, const T* key,
                           const T* value, const int* past_len,
                           int batch_size, int seq_len, int num_heads,
                           int size_per_head, int kv_cap, float alpha) {
  const int hidden_size = num_heads * size_per_head;
  const int64_t N = static_cast<int64_t>(batch_size) * num_heads * seq_len;
  parallel_for(N, [&](int64_t idx) {
    int i = idx % seq_len;
    int h = (idx / seq_len) % num_heads;
    int b = idx / (static_cast<int64_t>(seq_len) * num_heads);
    int visible = past_len[b] + i + 1;

    std::vector<float> score(kv_cap, 0.f);
    const T* q_ptr = query +
                     (static_cast<int64_t>(b) * seq_len + i) * hidden_size +
                     h * size_per_head;
    for (int j = 0; j < visible; j++) {
      const T* k_ptr = key +
                       (static_cast<int64_t>(b) * kv_cap + j) * hidden_size +
                       h * size_per_head;
      float dot = 0.f;
      for (int d = 0; d < size_per_head; d++) {
        dot += static_cast<float>(q_ptr[d]) * static_cast<float>(k_ptr[d]);
      }
      score[j] = dot * alpha;
    }
    vSoftmax(visible, score.data());

    T* o_ptr = out + (static_cast<int64_t>(b) * seq_len + i) * hidden_size +
               h * size_per_head;
    for (int d = 0; d < size_per_head; d++) {
      o_ptr[d] = 0;
    }
    for (int j = 0; j < visible; j++) {
      const T* v_ptr = value +
                       (static_cast<int64_t>(b) * kv_cap + j) * hidden_size +
                       h * size_per_head;
      for (int d = 0; d < size_per_head; d++) {
        o_ptr[d] += score[j] * v_ptr[d];
      }
    }
    if (probs != nullptr) {
      T* p_ptr = probs + idx * kv_cap;
      for (int j = 0; j < kv_cap; j++) {
        p_ptr[j] = score[j];
      }
    }
  });
}

template void SplitQVKLauncher<float>(const float* qvk, float* query,
                                      float* key_dst, float* value_dst,
                                      const int* past_len, int batch_size,
                                      int seq_len, int num_heads,
                                      int size_per_head, int kv_cap);
template void CausalAttentionKernel<float>(
    float* out, float* probs, const float* query, const float* key,
    const float* value, const int* past_len, int batch_size, int seq_len,
    int num_heads, int size_per_head, int kv_cap, float alpha);

}  // namespace cpu
}  // namespace lmspark
