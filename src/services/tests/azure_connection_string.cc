#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <stdexcept>

#include "base/config.h"
#include "crypto/private_file.h"
#include "services/azure/connection_string.h"

namespace dxfer {
namespace services {
namespace azure {
namespace tests {

TEST(ConnectionString, Standard) {
  auto cs = ConnectionString::Parse(
      "DefaultEndpointsProtocol=https;AccountName=myacct;"
      "AccountKey=abc/def+ghi==;EndpointSuffix=core.windows.net");

  EXPECT_EQ("myacct", cs.account_name);
  EXPECT_EQ("abc/def+ghi==", cs.account_key);
  EXPECT_EQ("https://myacct.blob.core.windows.net", cs.blob_endpoint);
  EXPECT_EQ("https://myacct.queue.core.windows.net", cs.queue_endpoint);
}

TEST(ConnectionString, Defaults) {
  auto cs = ConnectionString::Parse("AccountName=a;AccountKey=Zm9v");

  EXPECT_EQ("https://a.blob.core.windows.net", cs.blob_endpoint);
  EXPECT_EQ("https://a.queue.core.windows.net", cs.queue_endpoint);
}

TEST(ConnectionString, ExplicitEndpoints) {
  auto cs = ConnectionString::Parse(
      " AccountName = a ; AccountKey=Zm9v;"
      "BlobEndpoint=http://localhost:10000/a/;"
      "QueueEndpoint=http://localhost:10001/a;");

  EXPECT_EQ("a", cs.account_name);
  EXPECT_EQ("http://localhost:10000/a", cs.blob_endpoint);
  EXPECT_EQ("http://localhost:10001/a", cs.queue_endpoint);
}

TEST(ConnectionString, DevelopmentStorage) {
  auto cs = ConnectionString::Parse("UseDevelopmentStorage=true");

  EXPECT_EQ("devstoreaccount1", cs.account_name);
  EXPECT_FALSE(cs.account_key.empty());
  EXPECT_EQ("http://127.0.0.1:10000/devstoreaccount1", cs.blob_endpoint);
  EXPECT_EQ("http://127.0.0.1:10001/devstoreaccount1", cs.queue_endpoint);
}

TEST(ConnectionString, MissingFields) {
  EXPECT_THROW(ConnectionString::Parse("AccountName=a"), std::runtime_error);
  EXPECT_THROW(ConnectionString::Parse("AccountKey=Zm9v"), std::runtime_error);
  EXPECT_THROW(ConnectionString::Parse(""), std::runtime_error);
  EXPECT_THROW(ConnectionString::Parse("AccountName"), std::runtime_error);
}

TEST(ConnectionString, LoadFromPrivateFile) {
  const char *TEMP_FILE = "/tmp/" PACKAGE_NAME ".test-connection-string";

  crypto::PrivateFile::Write(TEMP_FILE,
                             "AccountName=fromfile;AccountKey=Zm9v\r\n"
                             "ignored second line\n",
                             crypto::PrivateFile::WriteMode::OVERWRITE);

  base::Config::set_azure_connection_string_file(TEMP_FILE);
  auto cs = ConnectionString::Load();
  EXPECT_EQ("fromfile", cs.account_name);

  // anyone else able to read the key is an error
  chmod(TEMP_FILE, 0644);
  EXPECT_THROW(ConnectionString::Load(), std::runtime_error);

  // an existing file isn't clobbered by default
  EXPECT_THROW(crypto::PrivateFile::Write(TEMP_FILE, "x"), std::runtime_error);

  // overwriting restores owner-only access
  crypto::PrivateFile::Write(TEMP_FILE, "AccountName=again;AccountKey=Zm9v",
                             crypto::PrivateFile::WriteMode::OVERWRITE);
  EXPECT_EQ("again", ConnectionString::Load().account_name);

  unlink(TEMP_FILE);
  base::Config::set_azure_connection_string_file("");
}

TEST(ConnectionString, LoadFromEnvironment) {
  base::Config::set_azure_connection_string_file("");

  setenv("storageconnectionstring", "AccountName=fromenv;AccountKey=Zm9v", 1);
  EXPECT_EQ("fromenv", ConnectionString::Load().account_name);

  unsetenv("storageconnectionstring");
  EXPECT_THROW(ConnectionString::Load(), std::runtime_error);
}

}  // namespace tests
}  // namespace azure
}  // namespace services
}  // namespace dxfer
