#include <errno.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "services/azure/blob_store.h"
#include "services/azure/queue.h"

namespace dxfer {
namespace services {
namespace azure {
namespace tests {

TEST(AzureBlobStore, BlockListXml) {
  EXPECT_EQ(
      "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>"
      "<Latest>AAAAAA==</Latest><Latest>AQAAAA==</Latest>"
      "<Latest>AgAAAA==</Latest></BlockList>",
      BlobStore::BuildBlockListXml({"AAAAAA==", "AQAAAA==", "AgAAAA=="}));
}

TEST(AzureBlobStore, EmptyBlockListXml) {
  EXPECT_EQ(
      "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList></BlockList>",
      BlobStore::BuildBlockListXml(std::vector<std::string>()));
}

TEST(AzureQueue, PutMessageXml) {
  EXPECT_EQ(
      "<QueueMessage><MessageText>aGVsbG8gd29ybGQh</MessageText>"
      "</QueueMessage>",
      Queue::BuildPutMessageXml("hello world!"));
}

TEST(AzureQueue, ParseMessage) {
  const std::string xml =
      "<?xml version=\"1.0\" encoding=\"utf-8\"?><QueueMessagesList>"
      "<QueueMessage><MessageId>5974b586-0df3-4e2d-ad0c-18e3892bfca2"
      "</MessageId><InsertionTime>Fri, 09 Oct 2009 21:04:30 GMT"
      "</InsertionTime><ExpirationTime>Fri, 16 Oct 2009 21:04:30 GMT"
      "</ExpirationTime><PopReceipt>YzQ4Yzg1MDItYTc0Ny00OWNjLTkxYTUtZGM0MDFi"
      "ZDAwYzEw</PopReceipt><TimeNextVisible>Fri, 09 Oct 2009 23:29:20 GMT"
      "</TimeNextVisible><DequeueCount>1</DequeueCount>"
      "<MessageText>aGVsbG8gd29ybGQh</MessageText></QueueMessage>"
      "</QueueMessagesList>";
  QueueMessage m;

  ASSERT_EQ(0, Queue::ParseGetMessagesXml(xml, &m));
  EXPECT_EQ("5974b586-0df3-4e2d-ad0c-18e3892bfca2", m.id);
  EXPECT_EQ("YzQ4Yzg1MDItYTc0Ny00OWNjLTkxYTUtZGM0MDFiZDAwYzEw", m.receipt);
  EXPECT_EQ("hello world!", m.body);
}

TEST(AzureQueue, ParseEmptyList) {
  QueueMessage m;

  EXPECT_EQ(-ENOENT,
            Queue::ParseGetMessagesXml(
                "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
                "<QueueMessagesList />",
                &m));
}

TEST(AzureQueue, ParseMessageWithoutReceipt) {
  QueueMessage m;

  EXPECT_EQ(-EIO, Queue::ParseGetMessagesXml(
                      "<QueueMessagesList><QueueMessage><MessageId>x"
                      "</MessageId><MessageText>eA==</MessageText>"
                      "</QueueMessage></QueueMessagesList>",
                      &m));
}

TEST(AzureQueue, ParseGarbage) {
  QueueMessage m;

  EXPECT_EQ(-EIO, Queue::ParseGetMessagesXml("this is not xml", &m));
}

}  // namespace tests
}  // namespace azure
}  // namespace services
}  // namespace dxfer
