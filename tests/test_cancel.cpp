#include <catch2/catch_test_macros.hpp>
#include <vector>

#include <cwt/cancel.hpp>

using namespace cwt;

TEST_CASE("default token never fires") {
  CancelToken tok;
  REQUIRE_FALSE(tok.cancelled());
  REQUIRE_FALSE(tok.can_cancel());
  int calls = 0;
  REQUIRE(tok.on_cancel([&]{ ++calls; }) == 0);
  REQUIRE(calls == 0);
}

TEST_CASE("cancel runs callbacks once, in registration order") {
  CancelSource src;
  std::vector<int> order;
  src.token().on_cancel([&]{ order.push_back(1); });
  src.token().on_cancel([&]{ order.push_back(2); });

  src.cancel();
  src.cancel();
  REQUIRE(src.cancelled());
  REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("registering on a cancelled token runs immediately") {
  CancelSource src;
  src.cancel();
  int calls = 0;
  const auto id = src.token().on_cancel([&]{ ++calls; });
  REQUIRE(id == 0);
  REQUIRE(calls == 1);
}

TEST_CASE("removed callbacks do not run") {
  CancelSource src;
  int a = 0, b = 0;
  const auto id = src.token().on_cancel([&]{ ++a; });
  src.token().on_cancel([&]{ ++b; });
  src.token().remove(id);
  src.cancel();
  REQUIRE(a == 0);
  REQUIRE(b == 1);
}

TEST_CASE("child sources follow their parent synchronously") {
  CancelSource root;
  CancelSource child(root.token());
  CancelSource grandchild(child.token());
  bool seen = false;
  grandchild.token().on_cancel([&]{ seen = true; });

  SECTION("parent cancel reaches every descendant") {
    root.cancel();
    REQUIRE(child.cancelled());
    REQUIRE(grandchild.cancelled());
    REQUIRE(seen);
  }

  SECTION("child cancel does not reach the parent") {
    child.cancel();
    REQUIRE(grandchild.cancelled());
    REQUIRE_FALSE(root.cancelled());
  }
}

TEST_CASE("a destroyed child leaves no registration behind") {
  CancelSource root;
  {
    CancelSource child(root.token());
    REQUIRE_FALSE(child.cancelled());
  }
  root.cancel();
  REQUIRE(root.cancelled());
}
