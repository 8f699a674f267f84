#include <algorithm>
#include <iostream>
#include <map>
#include <numeric>
#include <string>
#include <vector>

#include "client/cpp/probe.h"

namespace {

std::string Join(const std::vector<std::string>& words, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += words[i];
  }
  return out;
}

} // namespace

int main() {
  // Outside a watch session SREPL_P only passes values through. Run under
  // srepl (with a runner whose command builds and runs this file) and each
  // call site below gains an annotation holding its value.
  const auto greeting = SREPL_P(Join({"Hello", "world"}, ", "));

  std::vector<int> primes{2, 3, 5, 7, 11};
  SREPL_P(std::accumulate(primes.begin(), primes.end(), 0));

  std::map<std::string, size_t> lengths;
  for (const auto& word : {"alpha", "beta", "gamma"}) {
    lengths[word] = std::string(word).size();
  }
  SREPL_P(lengths);

  std::reverse(primes.begin(), primes.end());
  SREPL_P(primes);

  std::cout << greeting << '\n';
  return 0;
}
