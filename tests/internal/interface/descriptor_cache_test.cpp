#include "wfroute/internal/interface/descriptor_cache.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "tests/internal/testing/error_assert.h"
#include "tests/internal/testing/sample_workflows.h"

namespace iface = wfroute::internal::interface;
namespace diag = wfroute::internal::diagnostics::error;

namespace {

std::atomic<int> g_counted_declarations{0};

class Counted {
public:
  virtual ~Counted() = default;
  virtual void run() = 0;
};

} // namespace

namespace wfroute::internal::interface {

template <> struct WorkflowInterfaceTraits<Counted> {
  static InterfaceDeclaration declare() {
    g_counted_declarations.fetch_add(1);
    return InterfaceBuilder<Counted>("Counted")
        .add(WFROUTE_METHOD(Counted, run, WorkflowMethod{}))
        .build();
  }
};

} // namespace wfroute::internal::interface

class DescriptorCacheTest : public ::testing::Test {
protected:
  void SetUp() override {
    iface::DescriptorCache::clear();
    g_counted_declarations.store(0);
  }
  void TearDown() override { iface::DescriptorCache::clear(); }
};

TEST_F(DescriptorCacheTest, ResolvesOnFirstUseOnly) {
  EXPECT_FALSE(iface::DescriptorCache::contains(typeid(Counted)));
  auto first = iface::DescriptorCache::get<Counted>();
  auto second = iface::DescriptorCache::get<Counted>();
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(g_counted_declarations.load(), 1);
  EXPECT_TRUE(iface::DescriptorCache::contains(typeid(Counted)));
  EXPECT_EQ(iface::DescriptorCache::size(), 1u);
}

TEST_F(DescriptorCacheTest, ConcurrentFirstUseResolvesOnce) {
  constexpr int kThreads = 8;
  std::vector<iface::DescriptorCache::DescriptorPtr> seen(kThreads);
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      seen[i] = iface::DescriptorCache::get<Counted>();
    });
  }
  go.store(true);
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_EQ(g_counted_declarations.load(), 1);
  for (const auto &descriptor : seen) {
    EXPECT_EQ(descriptor.get(), seen.front().get());
  }
}

TEST_F(DescriptorCacheTest, FailedResolutionIsNotCached) {
  wfroute::tests::ExpectError(diag::WfrouteErrc::AmbiguousRole, [] {
    iface::DescriptorCache::get<wfroute::tests::Ambiguous>();
  });
  EXPECT_FALSE(iface::DescriptorCache::contains(typeid(wfroute::tests::Ambiguous)));
  EXPECT_EQ(iface::DescriptorCache::size(), 0u);
}

TEST_F(DescriptorCacheTest, DescriptorsOutliveClear) {
  auto descriptor = iface::DescriptorCache::get<wfroute::tests::Greeter>();
  iface::DescriptorCache::clear();
  EXPECT_EQ(descriptor->interfaceName(), "Greeter");
  auto again = iface::DescriptorCache::get<wfroute::tests::Greeter>();
  EXPECT_NE(descriptor.get(), again.get());
}

TEST_F(DescriptorCacheTest, RejectsDeclarationOfAnotherType) {
  wfroute::tests::ExpectError(diag::WfrouteErrc::InvalidState, [] {
    iface::DescriptorCache::getOrResolve(
        typeid(int), &iface::WorkflowInterfaceTraits<Counted>::declare);
  });
  EXPECT_FALSE(iface::DescriptorCache::contains(typeid(int)));
}

TEST_F(DescriptorCacheTest, RejectsNullDeclareFunction) {
  wfroute::tests::ExpectError(diag::WfrouteErrc::InvalidArgument, [] {
    iface::DescriptorCache::getOrResolve(typeid(Counted), nullptr);
  });
}
