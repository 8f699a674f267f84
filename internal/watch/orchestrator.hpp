#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/log/log_entry.hpp"
#include "internal/mapping/position_mapper.hpp"
#include "internal/util/time.hpp"
#include "internal/watch/capture_context.hpp"
#include "internal/watch/debounce_table.hpp"
#include "internal/watch/event_source.hpp"
#include "internal/watch/module_runner.hpp"

namespace srepl::watch {

/*
  Exit taken by one synchronization cycle.
*/
enum class CycleOutcome {
  kPersisted,
  kLinked,
  kNotExecutable,
  kDebounced,
  kUnmappable,
  kExecutionFailed,
  kNoLog,
  kNoEntries,
  kMappingFailed,
  kSourceUnreadable,
  kUnchanged,
};

const char* CycleOutcomeName(CycleOutcome outcome);

// A build toolchain deriving executable artifacts from authored sources.
struct Toolchain {
  std::string                                 name;
  std::vector<std::string>                    extensions;
  std::function<mapping::PositionMapperPtr()> make_mapper;
};

struct OrchestratorOptions {
  std::filesystem::path     root;
  std::filesystem::path     log_file;
  std::chrono::milliseconds debounce_window{300};
  std::vector<Toolchain>    toolchains;
  srepl::util::NowFn        now = srepl::util::Now;
};

/*
  Watch orchestrator.

  Consumes change events one at a time:

    Resolving -> Executing -> Reading-Log -> Mapping -> Rewriting -> Persisting

  Any stage may end the cycle early (see CycleOutcome). Only the module
  run and the persisted write touch the outside world; everything else is
  bookkeeping owned by this single consumer, so no locking is needed.

  Every source file written is remembered and Rollback() strips all
  annotations from them when the session ends.
*/
class Orchestrator {
 public:
  Orchestrator(OrchestratorOptions options, ModuleRunnerPtr runner);

  Orchestrator(const Orchestrator&)            = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Processes events until the source is exhausted (cancellation).
  void Run(EventSource& events);

  CycleOutcome ProcessEvent(const std::filesystem::path& changed_path);

  // Strips annotations from every touched file; returns how many were
  // restored. Failures are isolated per file.
  std::size_t Rollback();

  const std::vector<std::filesystem::path>& touched_files() const {
    return touched_;
  }

  const CaptureContext& capture() const {
    return capture_;
  }

  const std::filesystem::path& log_file() const {
    return options_.log_file;
  }

 private:
  struct MappingLink {
    std::filesystem::path source_path;
    std::filesystem::path mapping_table_path;
    std::string           toolchain;
  };

  struct Resolution {
    std::filesystem::path      source_path;
    std::filesystem::path      artifact_path;
    std::optional<MappingLink> link;
  };

  const Toolchain*         ToolchainFor(const std::filesystem::path& path) const;
  mapping::PositionMapper* MapperFor(const Toolchain& toolchain);

  // std::nullopt when there is no log; entries of other artifacts are dropped.
  std::optional<std::vector<log::LogEntry>> ReadLog(const std::filesystem::path& artifact_path) const;
  std::optional<std::vector<log::LogEntry>> MapEntries(const Resolution& resolution, std::vector<log::LogEntry> entries);

  void Persist(const Resolution& resolution, const std::string& content);
  void ClearLog() const;
  void MarkTouched(const std::filesystem::path& source_path);

  OrchestratorOptions options_;
  ModuleRunnerPtr     runner_;
  CaptureContext      capture_;
  DebounceTable       debounce_;

  std::map<std::filesystem::path, MappingLink>      links_;
  std::map<std::string, mapping::PositionMapperPtr> mappers_;
  std::vector<std::filesystem::path>                touched_;
  std::set<std::filesystem::path>                   touched_set_;
};

} // namespace srepl::watch
