#include "internal/mapping/position_mapper.hpp"

namespace srepl::mapping {

const char* ReasonName(MapperError::Reason reason) {
  switch (reason) {
    case MapperError::Reason::kNoBuildConfiguration:
      return "no_build_configuration";
    case MapperError::Reason::kEmissionDisabled:
      return "emission_disabled";
    case MapperError::Reason::kMappingTablesDisabled:
      return "mapping_tables_disabled";
    case MapperError::Reason::kMultipleSourceRoots:
      return "multiple_source_roots";
  }
  return "unknown";
}

} // namespace srepl::mapping
