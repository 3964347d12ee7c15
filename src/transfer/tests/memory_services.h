#ifndef DXFER_TRANSFER_TESTS_MEMORY_SERVICES_H
#define DXFER_TRANSFER_TESTS_MEMORY_SERVICES_H

#include <errno.h>

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "base/config.h"
#include "services/blob_store.h"
#include "services/message_queue.h"
#include "threads/pool.h"

namespace dxfer {
namespace transfer {
namespace tests {

class MemoryQueue : public services::MessageQueue {
 public:
  int CreateIfMissing(base::Request *, const std::string &queue) override {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[queue];
    return 0;
  }

  int Put(base::Request *, const std::string &queue,
          const std::string &body) override {
    std::lock_guard<std::mutex> lock(mutex_);

    if (put_failures_ > 0) {
      put_failures_--;
      return -EIO;
    }

    auto &q = queues_[queue];

    if (++q.puts == q.fail_put) {
      q.fail_put = 0;
      return -EIO;
    }

    services::QueueMessage m;
    m.id = "msg-" + std::to_string(++next_id_);
    m.body = body;
    q.visible.push_back(m);
    return 0;
  }

  int GetOne(base::Request *, const std::string &queue,
             services::QueueMessage *message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &q = queues_[queue];

    if (q.visible.empty()) return -ENOENT;

    *message = q.visible.front();
    message->receipt = "receipt-" + std::to_string(++next_id_);
    q.visible.pop_front();
    q.in_flight[message->id] = *message;
    return 0;
  }

  int Delete(base::Request *, const std::string &queue,
             const services::QueueMessage &message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &q = queues_[queue];
    auto iter = q.in_flight.find(message.id);

    if (iter == q.in_flight.end() || iter->second.receipt != message.receipt)
      return -ENOENT;

    q.in_flight.erase(iter);
    deleted_.push_back(message.id);
    return 0;
  }

  void PutRaw(const std::string &queue, const std::string &body) {
    Put(nullptr, queue, body);
  }

  // Makes in-flight messages visible again, as a lapsed visibility timeout
  // would.
  void ExpireInFlight(const std::string &queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &q = queues_[queue];

    for (auto &m : q.in_flight) q.visible.push_back(m.second);
    q.in_flight.clear();
  }

  std::vector<std::string> Bodies(const std::string &queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> bodies;

    for (const auto &m : queues_[queue].visible) bodies.push_back(m.body);
    return bodies;
  }

  size_t visible(const std::string &queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_[queue].visible.size();
  }

  size_t in_flight(const std::string &queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_[queue].in_flight.size();
  }

  size_t deleted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return deleted_.size();
  }

  // Fails the nth Put (counting from 1) to this queue once.
  void FailPut(const std::string &queue, int nth) {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[queue].fail_put = nth;
  }

  void set_put_failures(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    put_failures_ = n;
  }

 private:
  struct Queue {
    std::deque<services::QueueMessage> visible;
    std::map<std::string, services::QueueMessage> in_flight;
    int puts = 0;
    int fail_put = 0;
  };

  std::mutex mutex_;
  std::map<std::string, Queue> queues_;
  std::vector<std::string> deleted_;
  int next_id_ = 0;
  int put_failures_ = 0;
};

class MemoryBlobStore : public services::BlobStore {
 public:
  using ListHook = std::function<void(int poll, std::set<std::string> *)>;

  int CreateContainerIfMissing(base::Request *,
                               const std::string &container) override {
    std::lock_guard<std::mutex> lock(mutex_);
    containers_.insert(container);
    return 0;
  }

  int WriteUnit(base::Request *, const std::string &container,
                const std::string &blob, const std::string &unit_id,
                const uint8_t *data, size_t size,
                int server_timeout_in_s) override {
    std::lock_guard<std::mutex> lock(mutex_);

    timeouts_.insert(server_timeout_in_s);
    payloads_.insert(data);

    if (failing_units_.count(unit_id)) return -EIO;
    if (!containers_.count(container)) return -ENOENT;

    pending_[Key(container, blob)][unit_id] = size;
    return 0;
  }

  int ReadRange(base::Request *, const std::string &container,
                const std::string &blob, uint64_t offset, size_t length,
                size_t *bytes_read) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = committed_.find(Key(container, blob));

    if (iter == committed_.end()) return -ENOENT;
    if (failing_offsets_.count(offset)) return -EIO;
    if (offset + length > iter->second) return -EIO;

    reads_.push_back(std::make_pair(offset, length));
    *bytes_read = length;
    return 0;
  }

  int ListPendingUnits(base::Request *, const std::string &container,
                       const std::string &blob,
                       std::set<std::string> *units) override {
    std::lock_guard<std::mutex> lock(mutex_);

    list_calls_++;

    if (list_failures_ > 0) {
      list_failures_--;
      return -EIO;
    }

    units->clear();

    for (const auto &u : pending_[Key(container, blob)]) {
      if (!hidden_units_.count(u.first)) units->insert(u.first);
    }

    if (list_hook_) list_hook_(list_calls_, units);

    return 0;
  }

  int Commit(base::Request *, const std::string &container,
             const std::string &blob,
             const std::vector<std::string> &ordered_unit_ids) override {
    std::lock_guard<std::mutex> lock(mutex_);

    commits_.push_back(ordered_unit_ids);

    if (commit_result_) return commit_result_;

    auto &pending = pending_[Key(container, blob)];
    uint64_t size = 0;

    for (const auto &id : ordered_unit_ids) size += pending[id];

    committed_[Key(container, blob)] = size;
    pending.clear();
    return 0;
  }

  int Stat(base::Request *, const std::string &container,
           const std::string &blob, uint64_t *size) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = committed_.find(Key(container, blob));

    if (iter == committed_.end()) return -ENOENT;

    *size = iter->second;
    return 0;
  }

  int Delete(base::Request *, const std::string &container,
             const std::string &blob) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_.erase(Key(container, blob)) ? 0 : -ENOENT;
  }

  int DeleteContainer(base::Request *, const std::string &container) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_.erase(container) ? 0 : -ENOENT;
  }

  void AddBlob(const std::string &container, const std::string &blob,
               uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    containers_.insert(container);
    committed_[Key(container, blob)] = size;
  }

  void StageUnit(const std::string &container, const std::string &blob,
                 const std::string &unit_id, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[Key(container, blob)][unit_id] = size;
  }

  void FailUnit(const std::string &unit_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_units_.insert(unit_id);
  }

  void FailOffset(uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_offsets_.insert(offset);
  }

  void HideUnit(const std::string &unit_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    hidden_units_.insert(unit_id);
  }

  void set_list_hook(ListHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    list_hook_ = hook;
  }

  void set_list_failures(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    list_failures_ = n;
  }

  void set_commit_result(int r) {
    std::lock_guard<std::mutex> lock(mutex_);
    commit_result_ = r;
  }

  bool has_container(const std::string &container) {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_.count(container) > 0;
  }

  bool has_blob(const std::string &container, const std::string &blob) {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_.count(Key(container, blob)) > 0;
  }

  size_t pending_count(const std::string &container, const std::string &blob) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_[Key(container, blob)].size();
  }

  std::vector<std::vector<std::string>> commits() {
    std::lock_guard<std::mutex> lock(mutex_);
    return commits_;
  }

  std::vector<std::pair<uint64_t, size_t>> reads() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
  }

  std::set<int> timeouts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeouts_;
  }

  // distinct payload addresses passed to WriteUnit()
  std::set<const uint8_t *> payloads() {
    std::lock_guard<std::mutex> lock(mutex_);
    return payloads_;
  }

  int list_calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_calls_;
  }

 private:
  inline static std::string Key(const std::string &container,
                                const std::string &blob) {
    return container + "/" + blob;
  }

  std::mutex mutex_;
  std::set<std::string> containers_;
  std::map<std::string, std::map<std::string, size_t>> pending_;
  std::map<std::string, uint64_t> committed_;
  std::set<std::string> failing_units_, hidden_units_;
  std::set<uint64_t> failing_offsets_;
  std::vector<std::vector<std::string>> commits_;
  std::vector<std::pair<uint64_t, size_t>> reads_;
  std::set<int> timeouts_;
  std::set<const uint8_t *> payloads_;
  ListHook list_hook_;
  int list_calls_ = 0, list_failures_ = 0, commit_result_ = 0;
};

// Runs pool threads with no request hook, and polls without sleeping.
class TransferTest : public ::testing::Test {
 protected:
  void SetUp() override {
    base::Config::set_transfer_concurrency(4);
    base::Config::set_queue_poll_interval_in_s(0);
    base::Config::set_finalize_poll_interval_in_s(0);
    base::Config::set_finalize_timeout_in_s(0);
    base::Config::set_ack_jobs_after_report(false);
    base::Config::set_max_transfer_retries(2);
    base::Config::set_max_committable_units(50000);

    threads::Pool::Init();
  }

  void TearDown() override { threads::Pool::Terminate(); }
};

}  // namespace tests
}  // namespace transfer
}  // namespace dxfer

#endif
