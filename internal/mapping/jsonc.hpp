#pragma once

#include <string>
#include <string_view>

namespace srepl::mapping {

// Turns JSON-with-comments (tsconfig.json dialect) into strict JSON:
// removes // and /* */ comments and trailing commas outside strings.
std::string StripJsonComments(std::string_view text);

} // namespace srepl::mapping
