/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    cpu_kernel.h
 */

#pragma once
#include <stdint.h>

namespace lmspark {
namespace cpu {

// out[t, :] = table[ids[t], :] * scale, ids already range checked
template <typename T>
void EmbeddingKernelLauncher(T* out_tensor, const int64_t* ids,
                             const T* table, int64_t num_tokens, int width,
                             float scale);

template <typename T>
void LayerNormKernel(T* data_out, const T* data_in, const T* bias,
                     const T* gamma, const T* beta, int m, int n, float eps);

template <typename T>
void GemmWraper(T* matrix_C, const T* matrix_A, const T* matrix_B,
                const T* bias, int m, int n, int k, bool transA, bool transB,
                int lda, int ldb, int ldc, float alpha, float beta);

/**
 * Split the interleaved projection [b, s, heads * size_per_head * 3] into
 * query [b, s, heads, size_per_head] and key / value rows of a
 * [b, kv_cap, heads, size_per_head] buffer starting at row past_len[b].
 * Column (h * size_per_head + d) * 3 + j holds query (j = 0), value (j = 1)
 * and key (j = 2).
 */
template <typename T>
void SplitQVKLauncher(const T* qvk, T* query, T* key_dst, T* value_dst,
                      const int* past_len, int batch_size, int seq_len,
                      int num_heads, int size_per_head, int kv_cap);

/**
 * Causal attention over a key / value buffer. Query i of batch b sees
 * keys [0, past_len[b] + i]. probs, when not null, receives the softmax
 * weights as [b, heads, seq_len, kv_cap] with zeros on masked keys.
 */
template <typename T>
void CausalAttentionKernel(T* out, T* probs, const T* query, const T* key,
                           const T* value, const int* past_len,
                           int batch_size, int seq_len, int num_heads,
                           int size_per_head, int kv_cap, float alpha);

// in place softmax over n values
void vSoftmax(int n, float* vector);

// pos = cumsum(ids != pad) * (ids != pad) + pad, row by row
void PositionIdsKernel(int64_t* position_ids, const int64_t* input_ids,
                       int batch_size, int seq_len, int64_t pad);

// IEEE binary16 bits to float
void HalfToFloatKernel(float* out, const uint16_t* in, int64_t count);

}  // namespace cpu
}  // namespace lmspark
