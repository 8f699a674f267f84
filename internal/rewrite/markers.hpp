#pragma once

#include <string_view>

namespace srepl::rewrite {

/*
  Annotation markers embedded in source text.

  These are a wire format: they are written and recognized with the same
  literals, so changing one breaks stripping of files annotated by an
  older build.
*/

// "<code> //=> <result>"
inline constexpr std::string_view kTrailingMarker = " //=> ";

// "/*=> <result>\n     <result>\n*/\n"
inline constexpr std::string_view kBlockOpen  = "/*=> ";
inline constexpr std::string_view kBlockClose = "*/";

// Results joined inside one annotation.
inline constexpr std::string_view kTrailingSeparator = ", ";
inline constexpr std::string_view kBlockSeparator    = ",\n";

} // namespace srepl::rewrite
