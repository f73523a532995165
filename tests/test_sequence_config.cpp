#include "mseq/domain/sequence_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace mseq::domain;

TEST_CASE("normalize_prefix uppercases letters only", "[domain][prefix]") {
  CHECK(normalize_prefix("srv") == "SRV");
  CHECK(normalize_prefix("srv-01") == "SRV-01");
  CHECK(normalize_prefix("a_b") == "A_B");
}

TEST_CASE("validate_prefix accepts 1-10 chars of [A-Z0-9-]", "[domain][prefix]") {
  CHECK(validate_prefix("A").has_value());
  CHECK(validate_prefix("SRV-01").has_value());
  CHECK(validate_prefix("ABCDEFGHIJ").has_value());
}

TEST_CASE("validate_prefix rejects empty, long or illegal prefixes", "[domain][prefix]") {
  const auto empty = validate_prefix("");
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().code == SequenceError::kInvalidPrefix);

  CHECK_FALSE(validate_prefix("ABCDEFGHIJK").has_value());
  CHECK_FALSE(validate_prefix("AB_C").has_value());
  CHECK_FALSE(validate_prefix("ab").has_value());
  CHECK_FALSE(validate_prefix("A B").has_value());
}

TEST_CASE("validate_starting_number requires at least 1", "[domain][config]") {
  CHECK(validate_starting_number(1).has_value());
  CHECK(validate_starting_number(500).has_value());

  const auto zero = validate_starting_number(0);
  REQUIRE_FALSE(zero.has_value());
  CHECK(zero.error().code == SequenceError::kInvalidStartingNumber);
  CHECK_FALSE(validate_starting_number(-3).has_value());
}
