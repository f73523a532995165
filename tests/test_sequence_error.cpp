#include "mseq/domain/sequence_error.h"
#include "mseq/domain/sequence_scope.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mseq::domain;

TEST_CASE("error_code_string: stable codes for transport layers", "[domain][error]") {
  CHECK(std::string(error_code_string(SequenceError::kConfigNotFound)) ==
        "SEQUENCE_MANAGEMENT_NOT_FOUND");
  CHECK(std::string(error_code_string(SequenceError::kReferenceNotFound)) ==
        "CATEGORY_NOT_FOUND");
  CHECK(std::string(error_code_string(SequenceError::kGenerationExhausted)) ==
        "SEQUENCE_GENERATION_FAILED");
  CHECK(std::string(error_code_string(SequenceError::kDuplicateConfig)) ==
        "DUPLICATE_SEQUENCE_CONFIG");
  CHECK(std::string(error_code_string(SequenceError::kInvalidTemplate)) ==
        "INVALID_SEQUENCE_FORMAT");
  CHECK(std::string(error_code_string(SequenceError::kInvalidStartingNumber)) ==
        "INVALID_STARTING_NUMBER");
  CHECK(std::string(error_code_string(SequenceError::kInvalidPrefix)) ==
        "INVALID_SEQUENCE_PREFIX");
}

TEST_CASE("suggested_status: failures map to HTTP-style classes", "[domain][error]") {
  CHECK(suggested_status(SequenceError::kConfigNotFound) == 404);
  CHECK(suggested_status(SequenceError::kReferenceNotFound) == 404);
  CHECK(suggested_status(SequenceError::kDuplicateConfig) == 409);
  CHECK(suggested_status(SequenceError::kCounterContention) == 409);
  CHECK(suggested_status(SequenceError::kInvalidTemplate) == 400);
  CHECK(suggested_status(SequenceError::kInvalidStartingNumber) == 400);
  CHECK(suggested_status(SequenceError::kInvalidPrefix) == 400);
  CHECK(suggested_status(SequenceError::kGenerationExhausted) == 500);
  CHECK(suggested_status(SequenceError::kStorageFailure) == 503);
}

TEST_CASE("from_storage_error: not found becomes config not found", "[domain][error]") {
  const auto missing = from_storage_error(mseq::core::StorageError::kNotFound, "Reset");
  CHECK(missing.code == SequenceError::kConfigNotFound);
  CHECK(missing.message.starts_with("Reset"));

  CHECK(from_storage_error(mseq::core::StorageError::kUnavailable, "x").code ==
        SequenceError::kStorageFailure);
  CHECK(from_storage_error(mseq::core::StorageError::kConflict, "x").code ==
        SequenceError::kStorageFailure);
}

TEST_CASE("scope_to_string: category or category/subcategory", "[domain][scope]") {
  const SequenceScope wide{mseq::core::CategoryId{"cat-srv"}, std::nullopt};
  const SequenceScope narrow{mseq::core::CategoryId{"cat-srv"}, mseq::core::CategoryId{"cat-web"}};

  CHECK(scope_to_string(wide) == "cat-srv");
  CHECK(scope_to_string(narrow) == "cat-srv/cat-web");
  CHECK(narrow.category_wide() == wide);
  CHECK(wide.is_category_wide());
  CHECK_FALSE(narrow.is_category_wide());
}
