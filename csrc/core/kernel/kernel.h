/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    kernel.h
 */

#pragma once
#include <core/kernel/cpu/cpu_kernel.h>
