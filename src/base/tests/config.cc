#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "base/config.h"

namespace dxfer {
namespace base {
namespace tests {

namespace {
const char *TEMP_FILE = "/tmp/" PACKAGE_NAME ".test-config";

void WriteConfig(const std::string &contents) {
  std::ofstream f(TEMP_FILE, std::ofstream::out | std::ofstream::trunc);
  f << contents;
}

class ConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    unlink(TEMP_FILE);

    Config::set_transfer_concurrency(50);
    Config::set_server_timeout_min_in_s(10);
    Config::set_server_timeout_max_in_s(11);
    Config::set_ack_jobs_after_report(false);
    Config::set_job_queue_name("jobqueue");
  }
};
}  // namespace

TEST(Config, LoadFromInvalidFile) {
  EXPECT_THROW(Config::Init("/tmp/this shouldn't be a file"),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadEmptyFile) {
  WriteConfig("");

  EXPECT_NO_THROW(Config::Init(TEMP_FILE));
  EXPECT_EQ(50, Config::transfer_concurrency());
  EXPECT_EQ(50000, Config::max_committable_units());
  EXPECT_EQ("highthroughputblob", Config::default_object_name());
  EXPECT_EQ(0, Config::finalize_timeout_in_s());
  EXPECT_FALSE(Config::ack_jobs_after_report());
}

TEST_F(ConfigTest, LoadValues) {
  WriteConfig(
      "# comment\n"
      "transfer_concurrency = 16\n"
      "  job_queue_name=jobs-a   # trailing comment\n"
      "ack_jobs_after_report = yes\n"
      "\n"
      "server_timeout_min_in_s = 20\n"
      "server_timeout_max_in_s = 30\n");

  Config::Init(TEMP_FILE);

  EXPECT_EQ(16, Config::transfer_concurrency());
  EXPECT_EQ("jobs-a", Config::job_queue_name());
  EXPECT_TRUE(Config::ack_jobs_after_report());
  EXPECT_EQ(20, Config::server_timeout_min_in_s());
  EXPECT_EQ(30, Config::server_timeout_max_in_s());
}

TEST_F(ConfigTest, UnknownKey) {
  WriteConfig("no_such_key = something\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, MissingEquals) {
  WriteConfig("transfer_concurrency 16\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, MalformedValue) {
  WriteConfig("transfer_concurrency = lots\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);

  WriteConfig("ack_jobs_after_report = maybe\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, ConstraintViolated) {
  WriteConfig("transfer_concurrency = 0\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);

  WriteConfig(
      "transfer_concurrency = 4\n"
      "server_timeout_min_in_s = 20\n"
      "server_timeout_max_in_s = 10\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

}  // namespace tests
}  // namespace base
}  // namespace dxfer
