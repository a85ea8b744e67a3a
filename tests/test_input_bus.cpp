#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <optional>
#include <string>
#include <vector>

#include <cwt/input_bus.hpp>

using Catch::Approx;
using namespace cwt;

static KeyPredicate key_is(const std::string& k) {
  return [k](const InputEvent& e){ return e.key == k; };
}
static bool any_key(const InputEvent&) { return true; }

TEST_CASE("take_until returns buffered events in arrival order and consumes them") {
  FakeClock clock(100.0);
  InputBus bus(clock);
  bus.push({10.0, "A"});
  bus.push({20.0, "B"});
  bus.push({30.0, "A"});

  std::optional<InputEvent> first, second;
  bus.take_until(key_is("A"), CancelToken{}, [&](std::optional<InputEvent> e){ first = e; });
  bus.take_until(key_is("A"), CancelToken{}, [&](std::optional<InputEvent> e){ second = e; });

  REQUIRE(first.has_value());
  REQUIRE(first->at == Approx(10.0));
  REQUIRE(second.has_value());
  REQUIRE(second->at == Approx(30.0));

  const auto left = bus.pending();
  REQUIRE(left.size() == 1);
  REQUIRE(left[0].key == "B");
}

TEST_CASE("future events stay invisible until the clock reaches them") {
  FakeClock clock;
  InputBus bus(clock);
  bus.push({50.0, "K"});
  REQUIRE(bus.pending().empty());

  std::optional<InputEvent> got;
  bus.take_until(any_key, CancelToken{}, [&](std::optional<InputEvent> e){ got = e; });
  REQUIRE(bus.waiting() == 1);

  clock.run_for(49.0);
  REQUIRE_FALSE(got.has_value());
  clock.run_for(1.0);
  REQUIRE(got.has_value());
  REQUIRE(got->key == "K");
  REQUIRE(got->at == Approx(50.0));
  REQUIRE(bus.waiting() == 0);
}

TEST_CASE("an event goes to the earliest registered matching waiter only") {
  FakeClock clock;
  InputBus bus(clock);
  int a = 0, b = 0;
  bus.take_until(any_key, CancelToken{}, [&](std::optional<InputEvent> e){ if (e) ++a; });
  bus.take_until(any_key, CancelToken{}, [&](std::optional<InputEvent> e){ if (e) ++b; });

  bus.push({0.0, "X"});
  REQUIRE(a == 1);
  REQUIRE(b == 0);
  REQUIRE(bus.waiting() == 1);
}

TEST_CASE("cancelling a wait completes it empty and unregisters it") {
  FakeClock clock;
  InputBus bus(clock);
  CancelSource src;
  bool called = false;
  std::optional<InputEvent> got{InputEvent{}};
  bus.take_until(any_key, src.token(), [&](std::optional<InputEvent> e){ called = true; got = e; });

  src.cancel();
  REQUIRE(called);
  REQUIRE_FALSE(got.has_value());
  REQUIRE(bus.waiting() == 0);

  // The next key is left for someone else.
  bus.push({0.0, "Q"});
  REQUIRE(bus.pending().size() == 1);
}

TEST_CASE("undo_last removes the newest unconsumed event only") {
  FakeClock clock(100.0);
  InputBus bus(clock);
  bus.push({10.0, "A"});
  bus.push({20.0, "B"});
  bus.push({30.0, "C"});

  std::optional<InputEvent> taken;
  bus.take_until(key_is("C"), CancelToken{}, [&](std::optional<InputEvent> e){ taken = e; });
  REQUIRE(taken.has_value());

  REQUIRE(bus.undo_last());
  auto left = bus.pending();
  REQUIRE(left.size() == 1);
  REQUIRE(left[0].key == "A");

  REQUIRE(bus.undo_last());
  REQUIRE_FALSE(bus.undo_last());
}

TEST_CASE("observers see each event once, when it becomes visible") {
  FakeClock clock;
  InputBus bus(clock);
  std::vector<std::string> seen;
  const auto id = bus.observe([&](const InputEvent& e){ seen.push_back(e.key); });

  bus.push({0.0, "A"});
  bus.push({10.0, "B"});
  REQUIRE(seen == std::vector<std::string>{"A"});
  clock.run_for(10.0);
  REQUIRE(seen == std::vector<std::string>{"A", "B"});

  bus.unobserve(id);
  bus.push({10.0, "C"});
  REQUIRE(seen.size() == 2);
}

TEST_CASE("clear drops buffered events but keeps waiters") {
  FakeClock clock(5.0);
  InputBus bus(clock);
  bus.push({1.0, "A"});
  std::optional<InputEvent> got;
  bus.take_until(key_is("Z"), CancelToken{}, [&](std::optional<InputEvent> e){ got = e; });

  bus.clear();
  REQUIRE(bus.pending().empty());
  REQUIRE(bus.waiting() == 1);
  bus.push({5.0, "Z"});
  REQUIRE(got.has_value());
}

TEST_CASE("consumed events are dropped from the stream") {
  FakeClock clock(100.0);
  InputBus bus(clock);
  for (int i = 0; i < 50; ++i) {
    bus.take_until(any_key, CancelToken{}, [](std::optional<InputEvent>) {});
    bus.push({static_cast<Millis>(i), "E"});
  }
  REQUIRE(bus.buffered() == 0);

  bus.push({60.0, "T"});   // no waiter: kept for later takers
  bus.push({500.0, "M"});  // not visible yet
  REQUIRE(bus.buffered() == 2);
  REQUIRE(bus.pending().size() == 1);
}
