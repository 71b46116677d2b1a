#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "notify/wakeup_bus.hpp"

using rollout::notify::Subscription;
using rollout::notify::WakeupBus;
using namespace std::chrono_literals;

namespace {

bool Expect(Subscription& subscription, Subscription::Kind kind, const std::string& payload,
            const char* what) {
  Subscription::Message message;
  if (subscription.Next(&message, 200ms) != Subscription::WaitStatus::kMessage ||
      message.kind != kind || (!payload.empty() && message.payload != payload)) {
    std::cerr << "unexpected message: " << what << "\n";
    return false;
  }
  return true;
}

bool TestReadyThenNotifications() {
  auto bus = WakeupBus::Create();
  std::string error;
  auto subscription = bus->Subscribe("chan", 8, &error);
  bus->Publish("other", "x");
  bus->Publish("chan", "1");
  bus->Publish("chan", "2");
  if (!subscription || !Expect(*subscription, Subscription::Kind::kReady, {}, "ready") ||
      !Expect(*subscription, Subscription::Kind::kNotify, "1", "first notify") ||
      !Expect(*subscription, Subscription::Kind::kNotify, "2", "second notify")) {
    return false;
  }
  Subscription::Message message;
  if (subscription->Next(&message, 20ms) != Subscription::WaitStatus::kTimeout) {
    std::cerr << "other channels must not leak into the subscription\n";
    return false;
  }
  const auto stats = bus->GetStats();
  if (stats.published != 3 || stats.delivered != 2 || stats.subscribers != 1) {
    std::cerr << "unexpected bus stats\n";
    return false;
  }
  subscription->Close();
  if (bus->GetStats().subscribers != 0) {
    std::cerr << "closed subscription still counted\n";
    return false;
  }
  return true;
}

bool TestOverflowCutsOffSubscriber() {
  auto bus = WakeupBus::Create();
  std::string error;
  auto slow = bus->Subscribe("chan", 2, &error);
  auto fast = bus->Subscribe("chan", 16, &error);
  for (int i = 1; i <= 4; ++i) {
    bus->Publish("chan", std::to_string(i));
  }
  // kReady and "1" fill the slow queue; "2" cuts it off.
  if (!Expect(*slow, Subscription::Kind::kReady, {}, "slow ready") ||
      !Expect(*slow, Subscription::Kind::kNotify, "1", "slow notify") ||
      !Expect(*slow, Subscription::Kind::kError, {}, "slow overflow")) {
    return false;
  }
  if (!slow->IsClosed()) {
    std::cerr << "overflowed subscription should be terminal\n";
    return false;
  }
  Subscription::Message message;
  if (slow->Next(&message, 20ms) != Subscription::WaitStatus::kTimeout) {
    std::cerr << "nothing may follow the terminal message\n";
    return false;
  }
  if (!Expect(*fast, Subscription::Kind::kReady, {}, "fast ready")) {
    return false;
  }
  for (int i = 1; i <= 4; ++i) {
    if (!Expect(*fast, Subscription::Kind::kNotify, std::to_string(i), "fast notify")) {
      return false;
    }
  }
  const auto stats = bus->GetStats();
  if (stats.overflowed != 1 || stats.subscribers != 1) {
    std::cerr << "overflow not accounted\n";
    return false;
  }
  return true;
}

bool TestShutdownDisconnects() {
  auto bus = WakeupBus::Create();
  std::string error;
  auto subscription = bus->Subscribe("chan", 8, &error);
  if (!subscription || !Expect(*subscription, Subscription::Kind::kReady, {}, "ready")) {
    return false;
  }
  bus->Shutdown();
  if (!Expect(*subscription, Subscription::Kind::kDisconnected, {}, "disconnect")) {
    return false;
  }
  if (bus->Subscribe("chan", 8, &error) != nullptr || error.empty()) {
    std::cerr << "subscribe after shutdown should fail\n";
    return false;
  }
  return true;
}

bool TestNextHonoursStop() {
  auto bus = WakeupBus::Create();
  std::string error;
  auto subscription = bus->Subscribe("chan", 8, &error);
  Subscription::Message message;
  if (!subscription || subscription->Next(&message, 100ms) != Subscription::WaitStatus::kMessage) {
    return false;
  }
  std::stop_source source;
  std::jthread stopper([&source] {
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  });
  if (subscription->Next(&message, 5s, source.get_token()) != Subscription::WaitStatus::kStopped) {
    std::cerr << "stop request should end the wait\n";
    return false;
  }
  return true;
}

bool TestSubscriptionOutlivesBus() {
  std::shared_ptr<Subscription> subscription;
  {
    auto bus = WakeupBus::Create();
    std::string error;
    subscription = bus->Subscribe("chan", 8, &error);
  }
  // Closing after the bus is gone must be harmless.
  subscription->Close();
  return subscription->IsClosed();
}

}  // namespace

int main() {
  if (!TestReadyThenNotifications()) {
    return EXIT_FAILURE;
  }
  if (!TestOverflowCutsOffSubscriber()) {
    return EXIT_FAILURE;
  }
  if (!TestShutdownDisconnects()) {
    return EXIT_FAILURE;
  }
  if (!TestNextHonoursStop()) {
    return EXIT_FAILURE;
  }
  if (!TestSubscriptionOutlivesBus()) {
    return EXIT_FAILURE;
  }
  std::cout << "wakeup_bus_tests: OK\n";
  return EXIT_SUCCESS;
}
