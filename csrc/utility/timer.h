/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    timer.h
 */
#pragma once

#include <chrono>
#include <utility>
#include <string>

namespace lmspark {

namespace util {
class Timer {
 public:
  Timer() : m_begin(std::chrono::steady_clock::now()) {}
  explicit Timer(std::string str)
      : m_begin(std::chrono::steady_clock::now()), name(std::move(str)) {}

  void reset() { m_begin = std::chrono::steady_clock::now(); }

  // default using milliseconds.
  int64_t elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - m_begin)
        .count();
  }

  int64_t elapsed_micro() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now() - m_begin)
        .count();
  }

  const std::string& get_name() const { return name; }

 private:
  std::chrono::time_point<std::chrono::steady_clock> m_begin;
  std::string name = "default_timer";
};
}  // namespace util
}  // namespace lmspark
