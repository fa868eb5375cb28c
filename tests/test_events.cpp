/**
 * @file test_events.cpp
 * @brief Tests for EventManager subscription and serialized delivery.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gatehouse/event/event_manager.hpp"
#include "test_support.hpp"

using gatehouse::event::ApiEvent;
using gatehouse::event::ApiEventType;
using gatehouse::event::EventManager;
using gatehouse::testing::make_api;

TEST(EventManager, Delivers_To_All_Subscribers) {
  EventManager em;
  std::vector<std::string> seen;
  const auto a = em.subscribe([&](const ApiEvent& e) { seen.push_back("a:" + e.api.id); });
  const auto b = em.subscribe([&](const ApiEvent& e) { seen.push_back("b:" + e.api.id); });
  EXPECT_NE(a, b);
  EXPECT_EQ(em.subscribers(), 2u);

  em.publish(ApiEvent{ApiEventType::Deploy, make_api("teams", "/teams")});

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "a:teams");
  EXPECT_EQ(seen[1], "b:teams");
}

TEST(EventManager, Unsubscribe) {
  EventManager em;
  int calls = 0;
  const auto id = em.subscribe([&](const ApiEvent&) { ++calls; });

  EXPECT_TRUE(em.unsubscribe(id));
  EXPECT_FALSE(em.unsubscribe(id));
  EXPECT_FALSE(em.unsubscribe(12345));

  em.publish(ApiEvent{ApiEventType::Deploy, make_api("teams", "/teams")});
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(em.subscribers(), 0u);
}

/**
 * @test Throwing_Listener_Isolated
 * @brief A listener that throws does not stop delivery to the others.
 */
TEST(EventManager, Throwing_Listener_Isolated) {
  EventManager em;
  int calls = 0;
  em.subscribe([](const ApiEvent&) { throw std::runtime_error("listener down"); });
  em.subscribe([&](const ApiEvent&) { ++calls; });

  EXPECT_NO_THROW(em.publish(ApiEvent{ApiEventType::Undeploy, make_api("teams", "/teams")}));
  EXPECT_EQ(calls, 1);
}

/**
 * @test Deliveries_Never_Overlap
 * @brief Concurrent publishers are serialized: a listener never runs twice at once.
 */
TEST(EventManager, Deliveries_Never_Overlap) {
  EventManager em;
  std::atomic<int> inside{0}, max_inside{0}, total{0};
  em.subscribe([&](const ApiEvent&) {
    const int now = inside.fetch_add(1) + 1;
    int prev = max_inside.load();
    while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
    std::this_thread::yield();
    inside.fetch_sub(1);
    total.fetch_add(1);
  });

  std::vector<std::thread> publishers;
  for (int t = 0; t < 4; ++t) {
    publishers.emplace_back([&em, t] {
      for (int i = 0; i < 250; ++i) {
        em.publish(ApiEvent{ApiEventType::Update, make_api("api-" + std::to_string(t), "/p")});
      }
    });
  }
  for (auto& p : publishers) p.join();

  EXPECT_EQ(total.load(), 1000);
  EXPECT_EQ(max_inside.load(), 1);
}

/**
 * @test Unsubscribe_Waits_For_Inflight_Delivery
 * @brief unsubscribe() from another thread returns only after the running
 *        delivery has left the listener.
 */
TEST(EventManager, Unsubscribe_Waits_For_Inflight_Delivery) {
  EventManager em;
  std::atomic<bool> entered{false}, finished{false};
  const auto id = em.subscribe([&](const ApiEvent&) {
    entered.store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    finished.store(true);
  });

  std::thread publisher([&] { em.publish(ApiEvent{ApiEventType::Deploy, make_api("teams", "/teams")}); });
  while (!entered.load()) std::this_thread::yield();

  EXPECT_TRUE(em.unsubscribe(id));
  EXPECT_TRUE(finished.load());
  publisher.join();
}

/**
 * @test Unsubscribed_Listener_Skipped_Mid_Delivery
 * @brief A listener removed by an earlier listener of the same event is not called.
 */
TEST(EventManager, Unsubscribed_Listener_Skipped_Mid_Delivery) {
  EventManager em;
  int later_calls = 0;
  gatehouse::event::SubscriptionId later = 0;
  em.subscribe([&](const ApiEvent&) { EXPECT_TRUE(em.unsubscribe(later)); });
  later = em.subscribe([&](const ApiEvent&) { ++later_calls; });

  em.publish(ApiEvent{ApiEventType::Deploy, make_api("teams", "/teams")});
  EXPECT_EQ(later_calls, 0);
  EXPECT_EQ(em.subscribers(), 1u);
}

TEST(EventManager, Listener_Can_Unsubscribe_Itself) {
  EventManager em;
  int calls = 0;
  gatehouse::event::SubscriptionId self = 0;
  self = em.subscribe([&](const ApiEvent&) {
    ++calls;
    em.unsubscribe(self);
  });

  em.publish(ApiEvent{ApiEventType::Deploy, make_api("teams", "/teams")});
  em.publish(ApiEvent{ApiEventType::Deploy, make_api("teams", "/teams")});
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(em.subscribers(), 0u);
}

TEST(ApiEventType, Names_And_Aliases) {
  EXPECT_STREQ(to_string(ApiEventType::Deploy), "deploy");
  EXPECT_STREQ(to_string(ApiEventType::Update), "update");
  EXPECT_STREQ(to_string(ApiEventType::Undeploy), "undeploy");
  EXPECT_EQ(ApiEventType::Start, ApiEventType::Deploy);
  EXPECT_EQ(ApiEventType::Stop, ApiEventType::Undeploy);
}
