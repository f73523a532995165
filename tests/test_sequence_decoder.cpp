#include "mseq/sequence/sequence_decoder.h"
#include "mseq/sequence/template_codec.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace mseq::sequence;

TEST_CASE("decode: structural match with known slugs", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("web")};
  const auto result = decode("SRV-WEB-042", "{category}-{subcategory}-{sequence}", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 42);
  CHECK(result->strategy == DecodeStrategy::kStructural);
}

TEST_CASE("decode: structural match with known-empty subcategory", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};
  const auto result = decode("SRV-042", "{category}-{subcategory}-{sequence}", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 42);
  CHECK(result->strategy == DecodeStrategy::kStructural);
}

TEST_CASE("decode: unknown subcategory matches any slug", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::nullopt};
  const auto result = decode("SRV-WEB-042", "{category}-{subcategory}-{sequence}", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 42);
  CHECK(result->strategy == DecodeStrategy::kStructural);
}

TEST_CASE("decode: structural match is case-insensitive on slugs", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};
  const auto result = decode("srv-007", "{category}-{sequence}", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 7);
  CHECK(result->strategy == DecodeStrategy::kStructural);
}

TEST_CASE("decode: falls back to padded number", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};
  const auto result = decode("LEGACY-00123-X", "{category}-{sequence}", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 123);
  CHECK(result->strategy == DecodeStrategy::kPaddedNumber);
}

TEST_CASE("decode: falls back to any zero-padded number", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};
  const auto result = decode("OLD-007", "{category}-{sequence}", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 7);
  CHECK(result->strategy == DecodeStrategy::kZeroPaddedNumber);
}

TEST_CASE("decode: falls back to bare digits, preferring runs of two or more",
          "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};

  const auto longer = decode("X12Y3", "{category}-{sequence}", context);
  REQUIRE(longer.has_value());
  CHECK(longer->number == 12);
  CHECK(longer->strategy == DecodeStrategy::kBareDigits);

  const auto single = decode("A7B", "{category}-{sequence}", context);
  REQUIRE(single.has_value());
  CHECK(single->number == 7);
  CHECK(single->strategy == DecodeStrategy::kBareDigits);
}

TEST_CASE("decode: no digits means not found", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};
  CHECK_FALSE(decode("NO-DIGITS", "{category}-{sequence}", context).has_value());
  CHECK_FALSE(decode("", "{category}-{sequence}", context).has_value());
}

TEST_CASE("decode: regex metacharacters in templates are literal", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::string("")};
  const auto result = decode("SRV.(042)", "{category}.({sequence})", context);
  REQUIRE(result.has_value());
  CHECK(result->number == 42);
  CHECK(result->strategy == DecodeStrategy::kStructural);
}

TEST_CASE("decode: recovers what encode rendered", "[sequence][decoder]") {
  const std::vector<std::string> formats{
      "{category}-{subcategory}-{sequence}",
      "{sequence}-{category}",
      "M-{category}/{sequence}",
  };
  const DecodeContext context{"srv", std::string("web")};

  for (const auto& format : formats) {
    const std::string identifier = encode(format, "srv", "web", 1042);
    const auto result = decode(identifier, format, context);
    REQUIRE(result.has_value());
    CHECK(result->number == 1042);
    CHECK(result->strategy == DecodeStrategy::kStructural);
  }
}

TEST_CASE("SequenceDecoder: one instance decodes a whole batch", "[sequence][decoder]") {
  const DecodeContext context{"srv", std::nullopt};
  const std::string format = "{category}-{subcategory}-{sequence}";
  const SequenceDecoder decoder(SequenceTemplate::parse_lenient(format), context);

  const std::vector<std::string> identifiers = {"SRV-WEB-042", "SRV-DB-7", "LEGACY-0042",
                                                "box 0009", "R2D2-17", "GARBAGE"};
  for (const auto& identifier : identifiers) {
    const auto batch = decoder.decode(identifier);
    const auto single = decode(identifier, format, context);
    REQUIRE(batch.has_value() == single.has_value());
    if (batch.has_value()) {
      CHECK(batch->number == single->number);
      CHECK(batch->strategy == single->strategy);
    }
  }
  CHECK(decoder.decode("SRV-WEB-042")->strategy == DecodeStrategy::kStructural);
  CHECK_FALSE(decoder.decode("GARBAGE").has_value());
}

TEST_CASE("strategy_name: stable names", "[sequence][decoder]") {
  CHECK(std::string(strategy_name(DecodeStrategy::kStructural)) == "structural");
  CHECK(std::string(strategy_name(DecodeStrategy::kPaddedNumber)) == "padded_number");
  CHECK(std::string(strategy_name(DecodeStrategy::kZeroPaddedNumber)) == "zero_padded_number");
  CHECK(std::string(strategy_name(DecodeStrategy::kBareDigits)) == "bare_digits");
}
