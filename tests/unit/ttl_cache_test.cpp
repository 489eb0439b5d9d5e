#include "internal/cache/ttl_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

using tracelens::cache::TtlCache;
using tracelens::util::TimePoint;

using namespace std::chrono_literals;

struct FakeClock {
  TimePoint now = TimePoint(std::chrono::seconds(1'000));
};

TtlCache<std::string, int> MakeCache(std::size_t capacity, const std::shared_ptr<FakeClock>& clock) {
  return TtlCache<std::string, int>(capacity, [clock] { return clock->now; });
}

void TestEntryExpires() {
  auto clock = std::make_shared<FakeClock>();
  auto cache = MakeCache(4, clock);

  cache.Put("a", 1, 10s);
  assert(cache.Get("a") == 1);

  clock->now += 9s;
  assert(cache.Get("a") == 1);

  clock->now += 1s;
  assert(!cache.Get("a"));
  assert(cache.Size() == 0);
}

void TestOverwriteRefreshesExpiry() {
  auto clock = std::make_shared<FakeClock>();
  auto cache = MakeCache(4, clock);

  cache.Put("a", 1, 10s);
  clock->now += 8s;
  cache.Put("a", 2, 10s);
  clock->now += 8s;
  assert(cache.Get("a") == 2);
}

void TestFullCacheEvictsExpiredFirst() {
  auto clock = std::make_shared<FakeClock>();
  auto cache = MakeCache(2, clock);

  cache.Put("short", 1, 1s);
  cache.Put("long", 2, 60s);
  clock->now += 2s;

  cache.Put("new", 3, 60s);
  assert(cache.Size() == 2);
  assert(cache.Get("long") == 2);
  assert(cache.Get("new") == 3);
}

void TestFullCacheEvictsSoonestExpiry() {
  auto clock = std::make_shared<FakeClock>();
  auto cache = MakeCache(2, clock);

  cache.Put("soon", 1, 5s);
  cache.Put("later", 2, 50s);
  cache.Put("third", 3, 20s);

  assert(cache.Size() == 2);
  assert(!cache.Get("soon"));
  assert(cache.Get("later") == 2);
  assert(cache.Get("third") == 3);
}

void TestDisabledCapacityAndTtl() {
  auto clock = std::make_shared<FakeClock>();

  auto empty = MakeCache(0, clock);
  empty.Put("a", 1, 10s);
  assert(empty.Size() == 0);

  auto cache = MakeCache(2, clock);
  cache.Put("a", 1, 0ms);
  assert(!cache.Get("a"));
}

void TestEraseAndClear() {
  auto clock = std::make_shared<FakeClock>();
  auto cache = MakeCache(4, clock);

  cache.Put("a", 1, 10s);
  cache.Put("b", 2, 10s);
  cache.Erase("a");
  assert(!cache.Get("a"));
  assert(cache.Size() == 1);

  cache.Clear();
  assert(cache.Size() == 0);
}

} // namespace

int main() {
  TestEntryExpires();
  TestOverwriteRefreshesExpiry();
  TestFullCacheEvictsExpiredFirst();
  TestFullCacheEvictsSoonestExpiry();
  TestDisabledCapacityAndTtl();
  TestEraseAndClear();

  std::cout << "tracelens_unit_ttl_cache: pass\n";
  return 0;
}
