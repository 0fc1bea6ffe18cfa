/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    cpu_allocator.h
 */

#pragma once
#include <common/allocator.h>

#include <cstdlib>

namespace lmspark {
// one AVX-512 cache line pair, also satisfies dnnl's alignment hint
#define TENSOR_ALIGN_IN_BYTES (256)
class CPUAllocator : public Allocator {
 public:
  LsStatus Alloc(void** ptr, int64_t nbytes, const std::string& name) override {
    if (nbytes == 0) {
      *ptr = nullptr;
      return LsStatus::LMSPARK_SUCCESS;
    }
    // posix_memalign wants a size that is a multiple of the alignment
    int64_t rounded = (nbytes + TENSOR_ALIGN_IN_BYTES - 1) /
                      TENSOR_ALIGN_IN_BYTES * TENSOR_ALIGN_IN_BYTES;
    int ret = posix_memalign(ptr, TENSOR_ALIGN_IN_BYTES, rounded);
    if (ret != 0) {
      LOG(ERROR) << "Alloc cpu memory failed, tensor: " << name
                 << " size : " << nbytes;
      return LsStatus::LMSPARK_MEMORY_ERROR;
    }
    DLOG(INFO) << "CPU alloc " << name << ", size:" << nbytes;
    return LsStatus::LMSPARK_SUCCESS;
  }

  LsStatus Free(void* ptr) override {
    free(ptr);
    return LsStatus::LMSPARK_SUCCESS;
  }
};

}  // namespace lmspark
