/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    gemm.cpp
 */

#include <cblas.h>
#include <memory.h>

#include "cpu_common.h"
#include "cpu_kernel.h"
namespace lmspark {
namespace cpu {

template <>
void GemmWraper<float>(float* matrix_C, const float* matrix_A,
                       const float* matrix_B, const float* bias, int m, int n,
                       int k, bool transA, bool transB, int lda, int ldb,
                       int ldc, float alpha, float beta) {
  CBLAS_TRANSPOSE transA_ = transA ? CblasTrans : CblasNoTrans;
  CBLAS_TRANSPOSE transB_ = transB ? CblasTrans : CblasNoTrans;
  // bias is prefilled into C, accumulated with beta = 1
  if (bias) {
    parallel_for(m, [&](int j) {
      memcpy(matrix_C + static_cast<int64_t>(j) * ldc, bias,
             n * sizeof(float));
    });
    beta = 1.f;
  }
  cblas_sgemm(CblasRowMajor, transA_, transB_, m, n, k, alpha, matrix_A, lda,
              matrix_B, ldb, beta, matrix_C, ldc);
}

}  // namespace cpu
}  // namespace lmspark
