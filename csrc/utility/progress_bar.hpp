/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    progress_bar.hpp
 */
#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace lmspark {

namespace util {

// single line text bar, redrawn in place on every Update
class ProgressBar {
 public:
  explicit ProgressBar(size_t total_iterations, std::string title = "",
                       size_t bar_width = 50, std::ostream& os = std::cerr)
      : total_iterations_(total_iterations),
        bar_width_(bar_width),
        title_(std::move(title)),
        os_(os),
        start_time_(std::chrono::steady_clock::now()) {}

  ~ProgressBar() {
    if (drawn_) os_ << "\n";
  }

  void Update(size_t current_iteration) {
    if (total_iterations_ == 0) return;
    drawn_ = true;
    double progress =
        static_cast<double>(current_iteration) / total_iterations_;

    auto elapsed_time = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);
    int eta_seconds =
        progress > 0 ? (elapsed_time.count() / progress) - elapsed_time.count()
                     : 0;

    size_t bar_position = static_cast<size_t>(progress * bar_width_);
    if (!title_.empty()) os_ << title_ << " ";
    os_ << "[";
    for (size_t i = 0; i < bar_width_; ++i) {
      os_ << (i < bar_position ? "#" : " ");
    }
    os_ << "] " << current_iteration << "/" << total_iterations_ << " "
        << std::fixed << std::setprecision(1) << progress * 100 << "% ";

    if (eta_seconds > 0) {
      os_ << "ETA: ";
      if (eta_seconds >= 60) {
        os_ << eta_seconds / 60 << "m ";
        eta_seconds %= 60;
      }
      os_ << eta_seconds << "s";
    }
    os_ << "\r" << std::flush;
  }

 private:
  size_t total_iterations_;
  size_t bar_width_;
  std::string title_;
  std::ostream& os_;
  bool drawn_ = false;
  std::chrono::time_point<std::chrono::steady_clock> start_time_;
};
}  // namespace util
}  // namespace lmspark
