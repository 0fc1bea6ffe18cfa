/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    example_opt.cpp
 */
#include <interface/lmspark.h>

#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace lmspark;

static std::vector<int64_t> parse_tokens(const std::string& text) {
  std::vector<int64_t> tokens;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) tokens.push_back(std::stoll(item));
  }
  return tokens;
}

static LsTensor make_ids(const std::vector<int64_t>& ids) {
  LsTensor t("input_ids");
  TensorUtils::DeepCopyFromStdVector(
      t, Shape({1, static_cast<dim_t>(ids.size())}), ids);
  return t;
}

// index of the largest logit of every position of a [1, s, vocab] tensor
static std::vector<int64_t> argmax_rows(const LsTensor& logits) {
  const Shape& shape = logits.GetShape();
  const int64_t vocab = shape[2];
  std::vector<float> v = TensorUtils::ToStdVector<float>(logits);
  std::vector<int64_t> out;
  for (int64_t r = 0; r < shape[0] * shape[1]; r++) {
    auto row = v.begin() + r * vocab;
    out.push_back(std::max_element(row, row + vocab) - row);
  }
  return out;
}

static std::string join(const std::vector<int64_t>& v) {
  std::stringstream ss;
  for (size_t i = 0; i < v.size(); i++) ss << (i ? "," : "") << v[i];
  return ss.str();
}

int main(int argc, char** argv) {
  std::string model_name = "125M";
  std::string config_file;
  std::string params_path;
  std::string prompt = "2,100,200,300";
  std::string follow = "400,500";
  bool dummy = false;

  // parse arguments.
  CLI::App app{"lmspark example: load and run an OPT model on CPU."};
  app.add_option("--model,-m", model_name,
                 "model size name, like 125M, 1.3B, 2.7B");
  app.add_option("--config,-c", config_file,
                 "OPTConfigProto text file, overrides --model");
  app.add_option("--params,-p", params_path,
                 "checkpoint path, a .npz archive or a directory ending "
                 "with np");
  app.add_option("--prompt", prompt, "comma separated prompt token ids");
  app.add_option("--follow", follow,
                 "comma separated token ids fed one by one after the prompt");
  app.add_flag("--dummy", dummy, "use seeded random parameters");

  CLI11_PARSE(app, argc, argv);

  if (params_path.empty() and not dummy) {
    std::cerr << "Error: either --params or --dummy is required" << std::endl;
    return 1;
  }
  if (dummy and params_path.empty()) params_path = "dummy.npz";

  LsEngine engine;
  std::cout << "lmspark version: " << engine.GetVersionFull() << std::endl;
  if (!config_file.empty()) {
    LS_CHECK(engine.BuildModelFromConfigFile(config_file));
  } else {
    LS_CHECK(engine.BuildModelFromName(model_name));
  }

  auto t0 = std::chrono::steady_clock::now();
  LS_CHECK(engine.LoadParams(params_path, dummy));
  auto t1 = std::chrono::steady_clock::now();
  std::cout << "load params: "
            << std::chrono::duration<double>(t1 - t0).count() << " s"
            << std::endl;

  std::vector<int64_t> prompt_ids = parse_tokens(prompt);
  if (prompt_ids.empty()) {
    std::cerr << "Error: empty prompt" << std::endl;
    return 1;
  }

  // whole prompt without cache
  TensorMap outputs;
  LS_CHECK(engine.InferenceStepNoCache(make_ids(prompt_ids), &outputs));
  std::cout << "no cache top-1: " << join(argmax_rows(*outputs["logits"]))
            << std::endl;

  // same prompt through the cache, then the follow-up tokens one by one
  LS_CHECK(engine.ResetCache(1));
  LS_CHECK(engine.InferenceStepWithCache(make_ids(prompt_ids), &outputs));
  std::cout << "cached top-1:   " << join(argmax_rows(*outputs["logits"]))
            << std::endl;
  for (int64_t token : parse_tokens(follow)) {
    auto s0 = std::chrono::steady_clock::now();
    LS_CHECK(engine.InferenceStepWithCache(make_ids({token}), &outputs));
    auto s1 = std::chrono::steady_clock::now();
    std::cout << "token " << token << " -> top-1 "
              << argmax_rows(*outputs["logits"])[0] << " ("
              << std::chrono::duration<double, std::milli>(s1 - s0).count()
              << " ms)" << std::endl;
  }
  return 0;
}
