/*!
 * Copyright (c) Alibaba, Inc. and its affiliates.
 * @file    test_common.cpp
 */

#include <dirent.h>
#include <sys/stat.h>
#include <test_common.h>
#include <unistd.h>
#include <utility/lmspark_logging.h>

#include <cstdlib>

namespace LS_UTEST {

std::string MakeTempDir(const std::string& tag) {
  const char* tmp = std::getenv("TMPDIR");
  std::string templ = std::string(tmp ? tmp : "/tmp") + "/lmspark_" + tag +
                      "_XXXXXX";
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    ADD_FAILURE() << "mkdtemp failed for " << templ;
    return "";
  }
  return std::string(buf.data());
}

void RemoveTree(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    unlink(path.c_str());
    return;
  }
  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    std::string name = entry->d_name;
    if (name == "." or name == "..") continue;
    RemoveTree(path + "/" + name);
  }
  closedir(dir);
  rmdir(path.c_str());
}

}  // namespace LS_UTEST

int main(int argc, char* argv[]) {
  testing::InitGoogleTest(&argc, argv);
  lmspark::util::ls_init_log();
  return RUN_ALL_TESTS();
}
