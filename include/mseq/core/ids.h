#pragma once

#include <string>

namespace mseq::core {

// Entity identifiers. Each Tag yields its own type, so a machine id cannot be
// passed where a config id is expected. value is the stored form.
template <typename Tag>
struct StrongId {
  std::string value;
  auto operator<=>(const StrongId&) const = default;
};

using CategoryId = StrongId<struct CategoryIdTag>;
using MachineId = StrongId<struct MachineIdTag>;
using ConfigId = StrongId<struct ConfigIdTag>;
using TraceId = StrongId<struct TraceIdTag>;

}  // namespace mseq::core
