/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    lmspark_logging.h
 */

#pragma once
#include <glog/logging.h>
namespace lmspark {
namespace util {
void ls_init_log();
}  // namespace util
}  // namespace lmspark
