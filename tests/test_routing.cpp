/**
 * @file test_routing.cpp
 * @brief Tests for RoutingTable RCU semantics + virtual-host aware prefix lookup.
 *
 * Validates:
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - add / removeByApi / clear behavior and the API index staying in sync
 *  - Prefix-safe matching, virtual-host precedence, fallback totality
 *  - No torn reads under 1 writer / many readers; single winner on add races
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <map>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "gatehouse/handler/not_found_handler.hpp"
#include "gatehouse/routing/routing_table.hpp"
#include "test_support.hpp"

using gatehouse::handler::HandlerPtr;
using gatehouse::handler::NotFoundHandler;
using gatehouse::routing::RouteErr;
using gatehouse::routing::RoutingTable;
using gatehouse::testing::FakeHandler;

namespace {

std::shared_ptr<FakeHandler> started(std::string_view path,
                                     std::optional<std::string> vhost = std::nullopt,
                                     std::string tag = {}) {
  auto h = std::make_shared<FakeHandler>(path, std::move(vhost), std::move(tag));
  EXPECT_TRUE(h->start());
  return h;
}

struct RoutingFixture : ::testing::Test {
  HandlerPtr   fallback = std::make_shared<NotFoundHandler>();
  RoutingTable table{fallback};
};

} // namespace

// --------------------------- Basic construction ----------------------------

/**
 * @test Empty_Table_Returns_Fallback
 * @brief Fresh table publishes a valid empty snapshot; lookup is still total.
 */
TEST_F(RoutingFixture, Empty_Table_Returns_Fallback) {
  auto snap = table.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->by_path.empty());
  EXPECT_TRUE(snap->by_api.empty());

  EXPECT_EQ(table.lookup("/anything", ""), fallback);
  EXPECT_EQ(table.match("/anything", ""), nullptr);
  EXPECT_EQ(table.size(), 0u);
}

TEST(RoutingTable, Null_Fallback_Rejected) {
  EXPECT_THROW(RoutingTable{nullptr}, std::invalid_argument);
}

// --------------------------- Add / lookup ----------------------------------

TEST_F(RoutingFixture, Add_And_Lookup) {
  auto teams = started("/teams", std::nullopt, "teams");
  ASSERT_EQ(table.add("api-teams", teams), RouteErr::Ok);

  EXPECT_EQ(table.lookup("/teams", ""), teams);
  EXPECT_EQ(table.lookup("/teams/", ""), teams);
  EXPECT_EQ(table.lookup("/teams/42/members", ""), teams);
  EXPECT_EQ(table.lookup("/unknow", ""), fallback);

  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.contextPathOf("api-teams"), std::optional<std::string>("/teams/"));
  EXPECT_EQ(table.findByApi("api-teams"), teams);
  EXPECT_EQ(table.stats().adds, 1u);
}

/**
 * @test Prefix_Is_Segment_Safe
 * @brief "/api" serves "/api" and "/api/x" but never "/apix".
 */
TEST_F(RoutingFixture, Prefix_Is_Segment_Safe) {
  auto api = started("/api");
  ASSERT_EQ(table.add("api", api), RouteErr::Ok);

  EXPECT_EQ(table.lookup("/api", ""), api);
  EXPECT_EQ(table.lookup("/api/x", ""), api);
  EXPECT_EQ(table.lookup("/apix", ""), fallback);
  EXPECT_EQ(table.lookup("/apix/y", ""), fallback);
  EXPECT_EQ(table.lookup("/", ""), fallback);
}

TEST_F(RoutingFixture, Root_Path_Matches_Everything) {
  auto root = started("/");
  ASSERT_EQ(table.add("root", root), RouteErr::Ok);

  EXPECT_EQ(table.lookup("/", ""), root);
  EXPECT_EQ(table.lookup("", ""), root);
  EXPECT_EQ(table.lookup("/deep/path", ""), root);
}

// --------------------------- Rejections ------------------------------------

TEST_F(RoutingFixture, Duplicate_Path_Rejected) {
  auto first  = started("/teams", std::nullopt, "first");
  auto second = started("/teams/", std::nullopt, "second");

  ASSERT_EQ(table.add("a", first), RouteErr::Ok);
  EXPECT_EQ(table.add("b", second), RouteErr::PathTaken);

  EXPECT_EQ(table.lookup("/teams", ""), first);
  EXPECT_FALSE(table.contextPathOf("b"));
  EXPECT_EQ(table.stats().rejections, 1u);
}

TEST_F(RoutingFixture, Duplicate_Api_Rejected) {
  ASSERT_EQ(table.add("a", started("/one")), RouteErr::Ok);
  EXPECT_EQ(table.add("a", started("/two")), RouteErr::ApiTaken);

  EXPECT_EQ(table.lookup("/two", ""), fallback);
  EXPECT_EQ(table.contextPathOf("a"), std::optional<std::string>("/one/"));
}

/**
 * @test Invalid_Inputs_DoNotPublish
 * @brief Rejected adds must not publish a new snapshot.
 */
TEST_F(RoutingFixture, Invalid_Inputs_DoNotPublish) {
  const auto v0 = table.version();

  EXPECT_EQ(table.add("x", nullptr), RouteErr::Invalid);
  EXPECT_EQ(table.add("", started("/x")), RouteErr::Invalid);
  EXPECT_EQ(table.add(std::string(200, 'a'), started("/x")), RouteErr::Invalid);

  auto not_started = std::make_shared<FakeHandler>("/x");
  EXPECT_EQ(table.add("x", not_started), RouteErr::Invalid);

  auto empty_path = std::make_shared<FakeHandler>("");
  ASSERT_TRUE(empty_path->start());
  EXPECT_EQ(table.add("x", empty_path), RouteErr::Invalid);

  EXPECT_EQ(table.version(), v0);
  EXPECT_EQ(table.size(), 0u);
  EXPECT_EQ(table.stats().rejections, 5u);

  // Positive control
  EXPECT_EQ(table.add("x", started("/x")), RouteErr::Ok);
  EXPECT_EQ(table.version(), v0 + 1);
}

// --------------------------- Virtual hosts ---------------------------------

/**
 * @test Virtual_Host_Precedence
 * @brief Host-bound handler wins on its host; everything else goes host-less.
 */
TEST_F(RoutingFixture, Virtual_Host_Precedence) {
  auto bound    = started("/", std::string("a.example.com"), "bound");
  auto hostless = started("/teams", std::nullopt, "hostless");
  ASSERT_EQ(table.add("bound", bound), RouteErr::Ok);
  ASSERT_EQ(table.add("hostless", hostless), RouteErr::Ok);

  EXPECT_EQ(table.lookup("/teams", "a.example.com"), bound);
  EXPECT_EQ(table.lookup("/teams", "b.example.com"), hostless);
  EXPECT_EQ(table.lookup("/teams", ""), hostless);

  // Only the bound handler covers "/other", and the host does not match.
  EXPECT_EQ(table.lookup("/other", "b.example.com"), fallback);
  EXPECT_EQ(table.lookup("/other", "a.example.com"), bound);
}

TEST_F(RoutingFixture, Virtual_Host_Compared_Lowercase) {
  auto bound = started("/shop", std::string("Shop.Example.COM"));
  ASSERT_EQ(table.add("shop", bound), RouteErr::Ok);

  // Callers pass the resolved (lower-cased) host.
  EXPECT_EQ(table.lookup("/shop", "shop.example.com"), bound);
  EXPECT_EQ(table.lookup("/shop", "other.example.com"), fallback);
}

TEST_F(RoutingFixture, Stopped_Handlers_Skipped) {
  auto teams = started("/teams");
  ASSERT_EQ(table.add("teams", teams), RouteErr::Ok);
  ASSERT_TRUE(teams->stop());

  EXPECT_EQ(table.lookup("/teams", ""), fallback);
  EXPECT_EQ(table.size(), 1u); // still indexed until removed
}

/**
 * @test Overlapping_Hostless_Tie_Break_Is_Stable
 * @brief Overlapping host-less prefixes resolve the same way for one snapshot.
 */
TEST_F(RoutingFixture, Overlapping_Hostless_Tie_Break_Is_Stable) {
  auto root  = started("/", std::nullopt, "root");
  auto teams = started("/teams", std::nullopt, "teams");
  ASSERT_EQ(table.add("root", root), RouteErr::Ok);
  ASSERT_EQ(table.add("teams", teams), RouteErr::Ok);

  auto first = table.lookup("/teams/1", "");
  EXPECT_TRUE(first == root || first == teams);
  for (int i = 0; i < 1000; ++i) {
    ASSERT_EQ(table.lookup("/teams/1", ""), first);
  }
  // Non-overlapping requests are unambiguous.
  EXPECT_EQ(table.lookup("/users", ""), root);
}

// --------------------------- Remove / Clear --------------------------------

TEST_F(RoutingFixture, Remove_By_Api) {
  auto teams = started("/teams");
  ASSERT_EQ(table.add("teams", teams), RouteErr::Ok);

  EXPECT_EQ(table.removeByApi("teams"), teams);
  EXPECT_EQ(table.lookup("/teams", ""), fallback);
  EXPECT_FALSE(table.contextPathOf("teams"));
  EXPECT_EQ(table.findByApi("teams"), nullptr);

  // Idempotent: second removal is a no-op and does not publish.
  const auto v = table.version();
  EXPECT_EQ(table.removeByApi("teams"), nullptr);
  EXPECT_EQ(table.removeByApi("never-deployed"), nullptr);
  EXPECT_EQ(table.version(), v);
  EXPECT_EQ(table.stats().removes, 1u);

  // Path is free again.
  EXPECT_EQ(table.add("teams-v2", started("/teams")), RouteErr::Ok);
}

/**
 * @test Removed_Handler_Outlives_Table_Entry
 * @brief A snapshot taken before removal keeps its handler alive.
 */
TEST_F(RoutingFixture, Removed_Handler_Outlives_Table_Entry) {
  auto teams = started("/teams");
  ASSERT_EQ(table.add("teams", teams), RouteErr::Ok);

  auto old = table.snapshot();
  std::weak_ptr<FakeHandler> weak = teams;
  teams.reset();
  ASSERT_TRUE(table.removeByApi("teams"));

  EXPECT_FALSE(weak.expired());
  ASSERT_EQ(old->by_path.size(), 1u);
  old.reset();
  EXPECT_TRUE(weak.expired());
}

/**
 * @test Clear_Returns_All_Routes
 * @brief clear() hands back every handler together with the API id that owned it.
 */
TEST_F(RoutingFixture, Clear_Returns_All_Routes) {
  auto a = started("/a");
  auto b = started("/b", std::string("b.example.com"));
  ASSERT_EQ(table.add("api-a", a), RouteErr::Ok);
  ASSERT_EQ(table.add("api-b", b), RouteErr::Ok);

  auto removed = table.clear();
  ASSERT_EQ(removed.size(), 2u);
  std::map<std::string, gatehouse::handler::ContextHandlerPtr> got;
  for (const auto& route : removed) got.emplace(route.api_id, route.handler);
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got["api-a"], a);
  EXPECT_EQ(got["api-b"], b);

  EXPECT_EQ(table.size(), 0u);
  EXPECT_TRUE(table.snapshot()->by_api.empty());
  EXPECT_EQ(table.lookup("/a", ""), fallback);
  EXPECT_TRUE(table.clear().empty());
  EXPECT_EQ(table.stats().clears, 2u);
}

TEST_F(RoutingFixture, List_Routes) {
  ASSERT_EQ(table.add("a", started("/a")), RouteErr::Ok);
  ASSERT_EQ(table.add("b", started("/b", std::string("b.example.com"))), RouteErr::Ok);

  auto routes = table.listRoutes();
  ASSERT_EQ(routes.size(), 2u);
  for (const auto& r : routes) {
    if (r.api_id == "a") {
      EXPECT_EQ(r.context_path, "/a/");
      EXPECT_FALSE(r.virtual_host);
    } else {
      EXPECT_EQ(r.api_id, "b");
      EXPECT_EQ(r.context_path, "/b/");
      EXPECT_EQ(r.virtual_host, std::optional<std::string>("b.example.com"));
    }
  }
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Concurrency_1W_MR
 * @brief One writer swaps the API between two paths; readers always see the
 *        index and the primary map agree.
 *
 * This is a lightweight sanity test (not a full linearizability proof).
 */
TEST_F(RoutingFixture, Concurrency_1W_MR) {
  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 2000; ++i) {
      (void)table.removeByApi("svc");
      auto h = std::make_shared<FakeHandler>((i & 1) ? "/odd" : "/even");
      (void)h->start();
      (void)table.add("svc", h);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      auto s = table.snapshot();
      auto idx = s->by_api.find(std::string_view{"svc"});
      if (idx != s->by_api.end()) {
        auto it = s->by_path.find(idx->second);
        if (it != s->by_path.end() && it->second.api_id == "svc" && s->by_path.size() == 1) {
          ok_reads.fetch_add(1, std::memory_order_relaxed);
        } else {
          ADD_FAILURE() << "Index and path map disagree for " << idx->second;
          break;
        }
      } else if (!s->by_path.empty()) {
        ADD_FAILURE() << "Path published without index entry";
        break;
      }
      (void)table.lookup("/even/x", "");
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.contextPathOf("svc"), std::optional<std::string>("/odd/"));
}

/**
 * @test Concurrent_Add_Single_Winner
 * @brief Racing adds for the same path publish exactly one route.
 */
TEST_F(RoutingFixture, Concurrent_Add_Single_Winner) {
  constexpr int kThreads = 8;
  std::atomic<int> ok{0}, taken{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]{
      auto h = std::make_shared<FakeHandler>("/race");
      (void)h->start();
      auto rc = table.add("api-" + std::to_string(t), h);
      if (rc == RouteErr::Ok) ok.fetch_add(1);
      else if (rc == RouteErr::PathTaken) taken.fetch_add(1);
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(taken.load(), kThreads - 1);
  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.snapshot()->by_api.size(), 1u);
}
