#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/rewrite/rewrite_engine.hpp"
#include "internal/util/file_io.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  srepl-strip <file>...\n"
            << "\n"
            << "Removes every srepl annotation from the given files.\n";
}

// Returns false when the file could not be processed.
static bool StripFile(const std::string& path) {
  auto content = srepl::util::ReadFile(path);
  if (!content) {
    std::cerr << "cannot read " << path << "\n";
    return false;
  }

  auto pristine = srepl::rewrite::Strip(*content);
  if (pristine == *content) {
    return true;
  }

  try {
    srepl::util::WriteFile(path, pristine);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return false;
  }

  std::cout << "stripped " << path << "\n";
  return true;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  const std::string first = argv[1];
  if (first == "-h" || first == "--help") {
    Usage();
    return 0;
  }

  bool ok = true;
  for (int i = 1; i < argc; ++i) {
    ok = StripFile(argv[i]) && ok;
  }
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
