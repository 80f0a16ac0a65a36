// Catch2WithMain provides main(); this file only holds a framework smoke test

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
