#include <gtest/gtest.h>
#include <ichain/registry.hpp>
#include "test-helpers.hpp"

namespace {

using namespace ichain;

Interceptor noop(std::string const& id, InterceptorType type, int priority = 0,
                 std::vector<std::string> const& events = {},
                 std::vector<InterceptorPhase> const& phases = {}) {
  auto options = test::options(id, type, priority);
  options.applicable_events = events;
  options.phases = phases;
  return make_interceptor(options, {}, [] {});
}

std::vector<std::string> ids_of(std::vector<std::shared_ptr<Interceptor const>> const& found) {
  std::vector<std::string> ids;
  for (auto&& interceptor : found) ids.push_back(interceptor->id());
  return ids;
}

TEST(Registry, RejectsDuplicateIds) {
  Registry registry;
  registry.add(noop("audit", InterceptorType::OBSERVABILITY));
  try {
    registry.add(noop("audit", InterceptorType::MUTATION));
    FAIL() << "Expected DUPLICATE_ID";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::DUPLICATE_ID);
    EXPECT_EQ(e.interceptor_id(), "audit");
  }
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.resolve("audit")->type(), InterceptorType::OBSERVABILITY);
}

TEST(Registry, ResolveUnknownId) {
  Registry registry;
  try {
    registry.resolve("ghost");
    FAIL() << "Expected UNKNOWN_INTERCEPTOR_ID";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::UNKNOWN_INTERCEPTOR_ID);
    EXPECT_EQ(e.interceptor_id(), "ghost");
  }
}

TEST(Registry, LookupFiltersAndOrders) {
  Registry registry;
  registry.add(noop("b", InterceptorType::MUTATION, 1));
  registry.add(noop("a", InterceptorType::MUTATION, 1));
  registry.add(noop("first", InterceptorType::VALIDATION, -5));
  registry.add(noop("responses", InterceptorType::VALIDATION, 0, {}, {InterceptorPhase::RESPONSE}));
  registry.add(noop("prompts", InterceptorType::VALIDATION, 0, {"prompts/get"}));

  auto found = registry.lookup("tools/call", InterceptorPhase::REQUEST);
  EXPECT_EQ(ids_of(found), (std::vector<std::string>{"first", "a", "b"}));

  found = registry.lookup("prompts/get", InterceptorPhase::RESPONSE);
  EXPECT_EQ(ids_of(found), (std::vector<std::string>{"first", "prompts", "responses", "a", "b"}));
}

TEST(Registry, ListPagesById) {
  Registry registry;
  for (auto id : {"e", "c", "a", "d", "b"}) registry.add(noop(id, InterceptorType::VALIDATION));

  auto page = registry.list("", 2);
  ASSERT_EQ(page.interceptors.size(), 2u);
  EXPECT_EQ(page.interceptors[0].id(), "a");
  EXPECT_EQ(page.interceptors[1].id(), "b");
  EXPECT_EQ(page.next_cursor, "b");

  page = registry.list(page.next_cursor, 2);
  ASSERT_EQ(page.interceptors.size(), 2u);
  EXPECT_EQ(page.interceptors[0].id(), "c");
  EXPECT_EQ(page.next_cursor, "d");

  page = registry.list(page.next_cursor, 2);
  ASSERT_EQ(page.interceptors.size(), 1u);
  EXPECT_EQ(page.interceptors[0].id(), "e");
  EXPECT_TRUE(page.next_cursor.empty());

  EXPECT_EQ(registry.list("", 0).interceptors.size(), 5u);
  EXPECT_TRUE(registry.list("", 5).next_cursor.empty());
}

TEST(Registry, AppliesDescriptorOverrides) {
  DescriptorOverride override;
  override.set_id("audit");
  override.set_name("Audit Trail");
  override.set_priority(42);
  override.add_phases(InterceptorPhase::RESPONSE);

  Registry registry(std::vector<DescriptorOverride>{override});
  registry.add(noop("audit", InterceptorType::OBSERVABILITY, 1));
  registry.add(noop("other", InterceptorType::OBSERVABILITY, 1));

  auto audit = registry.resolve("audit")->descriptor();
  EXPECT_EQ(audit.name(), "Audit Trail");
  EXPECT_EQ(audit.priority(), 42);
  EXPECT_EQ(audit.type(), InterceptorType::OBSERVABILITY);
  EXPECT_TRUE(registry.lookup("tools/call", InterceptorPhase::REQUEST).size() == 1);
  EXPECT_EQ(registry.resolve("other")->descriptor().priority(), 1);
}

TEST(Registry, OverrideWithoutPriorityKeepsRegisteredOrder) {
  DescriptorOverride rename;
  rename.set_id("m");
  rename.set_name("Renamed");

  Registry registry(std::vector<DescriptorOverride>{rename});
  registry.add(noop("m", InterceptorType::MUTATION, 7));
  registry.add(noop("n", InterceptorType::MUTATION, 3));

  auto m = registry.resolve("m")->descriptor();
  EXPECT_EQ(m.name(), "Renamed");
  EXPECT_EQ(m.priority(), 7);
  EXPECT_EQ(ids_of(registry.lookup("tools/call", InterceptorPhase::REQUEST)),
            (std::vector<std::string>{"n", "m"}));
}

TEST(Registry, RemoveAndChangeListeners) {
  Registry registry;
  int changes = 0;
  registry.on_change([&] { ++changes; });
  registry.on_change([] { throw std::runtime_error("listener failed"); });

  registry.add(noop("audit", InterceptorType::OBSERVABILITY));
  EXPECT_EQ(changes, 1);

  EXPECT_FALSE(registry.remove("ghost"));
  EXPECT_EQ(changes, 1);

  EXPECT_TRUE(registry.remove("audit"));
  EXPECT_EQ(changes, 2);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(Registry, SnapshotsAreImmutable) {
  Registry registry;
  registry.add(noop("a", InterceptorType::MUTATION));
  auto before = registry.snapshot();
  registry.add(noop("b", InterceptorType::MUTATION));
  registry.remove("a");

  EXPECT_EQ(before->size(), 1u);
  EXPECT_EQ(before->count("a"), 1u);
  EXPECT_EQ(registry.snapshot()->count("a"), 0u);
}

}  // namespace
