#include <glog/logging.h>
#include <signal.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 写入已经退出的子进程的管道时不能杀死测试进程
    signal(SIGPIPE, SIG_IGN);
  }
  virtual void TearDown() {
    google::FlushLogFiles(google::GLOG_INFO);
  }
};

int main(int argc, char *argv[]) {
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = google::GLOG_WARNING;
  google::InitGoogleLogging(argv[0]);
  ::testing::AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
