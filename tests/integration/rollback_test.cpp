#include <cassert>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/file_io.hpp"
#include "internal/watch/event_source.hpp"
#include "internal/watch/orchestrator.hpp"
#include "internal/watch/process_runner.hpp"

namespace {

namespace fs = std::filesystem;

using srepl::watch::EventSource;
using srepl::watch::Orchestrator;
using srepl::watch::OrchestratorOptions;
using srepl::watch::ProcessRunner;

// Delivers a fixed batch, then reports cancellation.
class ScriptedEvents final : public EventSource {
 public:
  explicit ScriptedEvents(std::deque<fs::path> paths) : paths_(std::move(paths)) {
  }

  std::optional<fs::path> Next() override {
    if (paths_.empty()) {
      return std::nullopt;
    }
    auto next = paths_.front();
    paths_.pop_front();
    return next;
  }

 private:
  std::deque<fs::path> paths_;
};

std::string Read(const fs::path& path) {
  auto content = srepl::util::ReadFile(path);
  assert(content.has_value());
  return *content;
}

void TestTerminationRestoresEveryAnnotatedFile() {
  const auto root = fs::temp_directory_path() / "srepl_rollback_tests";
  fs::remove_all(root);
  fs::create_directories(root);

  // shell modules acting as their own probes
  const std::string first_source  = "printf '%s\\n' 'first.sh:2:1 :: 42' >> \"$SREPL_LOG_FILE\"\n"
                                    "true # p(6 * 7)\n";
  const std::string second_source = "printf '%s\\n' 'second.sh:2:3 :: %5B%0A%20%201%0A%5D' >> \"$SREPL_LOG_FILE\" #\r\n"
                                    "  true # p([1])\r\n";
  const auto first  = root / "first.sh";
  const auto second = root / "second.sh";
  srepl::util::WriteFile(first, first_source);
  srepl::util::WriteFile(second, second_source);

  auto runner = std::make_shared<ProcessRunner>(std::vector<ProcessRunner::Command>{{{".sh"}, {"/bin/sh", "{artifact}"}}});

  OrchestratorOptions options;
  options.root     = root;
  options.log_file = ".srepl.log";
  Orchestrator orchestrator(std::move(options), runner);

  ScriptedEvents events({first, second});
  orchestrator.Run(events);

  assert(Read(first) == "printf '%s\\n' 'first.sh:2:1 :: 42' >> \"$SREPL_LOG_FILE\"\n"
                        "true # p(6 * 7) //=> 42\n");
  assert(Read(second) == "printf '%s\\n' 'second.sh:2:3 :: %5B%0A%20%201%0A%5D' >> \"$SREPL_LOG_FILE\" #\r\n"
                         "  true # p([1])\r\n"
                         "  /*=> [\r\n"
                         "         1\r\n"
                         "       ]\r\n"
                         "  */\r\n");
  assert(orchestrator.touched_files().size() == 2);

  assert(orchestrator.Rollback() == 2);
  assert(Read(first) == first_source);
  assert(Read(second) == second_source);

  // a touched file that disappeared is skipped
  fs::remove(first);
  assert(orchestrator.Rollback() == 1);
  assert(Read(second) == second_source);
}

} // namespace

int main() {
  TestTerminationRestoresEveryAnnotatedFile();

  std::cout << "srepl_integration_rollback: pass\n";
  return 0;
}
