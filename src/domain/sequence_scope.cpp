#include "mseq/domain/sequence_scope.h"

namespace mseq::domain {

std::string scope_to_string(const SequenceScope& scope) {
  if (!scope.subcategory_id.has_value()) {
    return scope.category_id.value;
  }
  return scope.category_id.value + "/" + scope.subcategory_id->value;
}

}  // namespace mseq::domain
