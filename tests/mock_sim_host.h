#pragma once

#include "sim_host.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Scripted simulation host. Every connect() queues an Open notification
// unless connects are made to fail.
class MockSimHost : public panelbridge::SimHost {
public:
  bool connect(const std::string& clientName, std::string& err) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connects_;
    lastClientName_ = clientName;
    if (failConnect_) {
      err = "simulator not running";
      return false;
    }
    connected_ = true;
    panelbridge::SimNotification open;
    open.kind = panelbridge::SimNotification::Kind::Open;
    queue_.push_back(open);
    cv_.notify_all();
    return true;
  }

  void disconnect() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++disconnects_;
    connected_ = false;
    queue_.clear();
  }

  bool subscribeAircraftState(std::string& /*err*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++subscriptions_;
    return true;
  }

  bool mapEvent(uint32_t eventId, const std::string& hostEventName, std::string& err) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hostEventName == failMapName_) {
      err = "unknown event";
      return false;
    }
    mapped_[eventId] = hostEventName;
    return true;
  }

  bool transmitEvent(uint32_t eventId, uint32_t data, std::string& err) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mapped_.count(eventId) == 0) {
      err = "event not mapped";
      return false;
    }
    transmitted_.emplace_back(eventId, data);
    return true;
  }

  panelbridge::PollStatus nextNotification(panelbridge::SimNotification& out,
                                           std::chrono::milliseconds timeout,
                                           std::string& err) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!connected_) {
      err = "not connected";
      return panelbridge::PollStatus::Error;
    }
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
    if (queue_.empty()) {
      return panelbridge::PollStatus::None;
    }
    out = queue_.front();
    queue_.pop_front();
    return panelbridge::PollStatus::Notification;
  }

  void pushData(const panelbridge::TelemetrySample& sample) {
    panelbridge::SimNotification n;
    n.kind = panelbridge::SimNotification::Kind::Data;
    n.sample = sample;
    push(n);
  }

  void pushQuit() {
    panelbridge::SimNotification n;
    n.kind = panelbridge::SimNotification::Kind::Quit;
    push(n);
  }

  void push(const panelbridge::SimNotification& n) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(n);
    cv_.notify_all();
  }

  void setFailConnect(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failConnect_ = fail;
  }

  void setFailMapName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    failMapName_ = name;
  }

  int connects() {
    std::lock_guard<std::mutex> lock(mutex_);
    return connects_;
  }

  int disconnects() {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnects_;
  }

  int subscriptions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
  }

  std::map<uint32_t, std::string> mapped() {
    std::lock_guard<std::mutex> lock(mutex_);
    return mapped_;
  }

  std::vector<std::pair<uint32_t, uint32_t>> transmitted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return transmitted_;
  }

  std::string lastClientName() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastClientName_;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<panelbridge::SimNotification> queue_;
  bool connected_ = false;
  bool failConnect_ = false;
  std::string failMapName_;
  int connects_ = 0;
  int disconnects_ = 0;
  int subscriptions_ = 0;
  std::string lastClientName_;
  std::map<uint32_t, std::string> mapped_;
  std::vector<std::pair<uint32_t, uint32_t>> transmitted_;
};
