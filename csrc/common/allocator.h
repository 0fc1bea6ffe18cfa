/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    allocator.h
 */

#pragma once
#include <common/common.h>

#include <string>

namespace lmspark {

// base allocator interface
class Allocator {
 public:
  virtual ~Allocator() = default;
  virtual LsStatus Alloc(void** ptr, int64_t nbytes,
                         const std::string& name) = 0;
  virtual LsStatus Free(void* ptr) = 0;
};

}  // namespace lmspark
