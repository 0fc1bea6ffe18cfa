/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    datatype_dispatcher.h
 */

#pragma once
#include <common/common.h>

namespace lmspark {

template <typename Functor, typename... Args>
void DispatchCPU(DataType dtype, Functor&& F, Args&&... args) {
  switch (dtype) {
    case DataType::FLOAT32: {
      std::forward<Functor>(F).template operator()<float>(
          std::forward<Args>(args)...);
      break;
    }
    default: {
      LOG(ERROR) << "unsupported datatype " << DataType_Name(dtype)
                 << " for CPU dispatch";
      throw LsException("LMSPARK_RUNTIME_ERROR");
    }
  }
}

}  // namespace lmspark
