#include "internal/watch/orchestrator.hpp"

#include <algorithm>
#include <future>
#include <sstream>

#include "internal/log/log_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rewrite/rewrite_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace srepl::watch {

namespace fs = std::filesystem;

using srepl::log::LogEntry;
using srepl::observability::BoolField;
using srepl::observability::IntField;
using srepl::observability::StringField;

namespace {

fs::path Normalize(const fs::path& path, const fs::path& root) {
  return (path.is_absolute() ? path : root / path).lexically_normal();
}

bool HasExtension(const fs::path& path, const std::vector<std::string>& extensions) {
  const auto extension = path.extension().string();
  return !extension.empty() && std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

// Strips every annotation from one touched file. Returns false when the
// file is gone.
bool RestoreFile(const fs::path& path) {
  auto content = srepl::util::ReadFile(path);
  if (!content) {
    return false;
  }

  auto pristine = srepl::rewrite::Strip(*content);
  if (pristine != *content) {
    srepl::util::WriteFile(path, pristine);
  }
  return true;
}

} // namespace

const char* CycleOutcomeName(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kPersisted:
      return "persisted";
    case CycleOutcome::kLinked:
      return "linked";
    case CycleOutcome::kNotExecutable:
      return "not_executable";
    case CycleOutcome::kDebounced:
      return "debounced";
    case CycleOutcome::kUnmappable:
      return "unmappable";
    case CycleOutcome::kExecutionFailed:
      return "execution_failed";
    case CycleOutcome::kNoLog:
      return "no_log";
    case CycleOutcome::kNoEntries:
      return "no_entries";
    case CycleOutcome::kMappingFailed:
      return "mapping_failed";
    case CycleOutcome::kSourceUnreadable:
      return "source_unreadable";
    case CycleOutcome::kUnchanged:
      return "unchanged";
  }
  return "unknown";
}

Orchestrator::Orchestrator(OrchestratorOptions options, ModuleRunnerPtr runner)
    : options_(std::move(options)), runner_(std::move(runner)), debounce_(options_.debounce_window) {
  options_.root     = fs::absolute(options_.root).lexically_normal();
  options_.log_file = Normalize(options_.log_file, options_.root);
  capture_.log_file = options_.log_file;
}

void Orchestrator::Run(EventSource& events) {
  while (auto path = events.Next()) {
    const auto outcome = ProcessEvent(*path);
    SREPL_LOG_TRACE("cycle closed", {StringField("path", path->string()), StringField("outcome", CycleOutcomeName(outcome))});
  }
  SREPL_LOG_DEBUG("event stream closed");
}

const Toolchain* Orchestrator::ToolchainFor(const fs::path& path) const {
  for (const auto& toolchain : options_.toolchains) {
    if (HasExtension(path, toolchain.extensions)) {
      return &toolchain;
    }
  }
  return nullptr;
}

mapping::PositionMapper* Orchestrator::MapperFor(const Toolchain& toolchain) {
  auto cached = mappers_.find(toolchain.name);
  if (cached != mappers_.end()) {
    return cached->second.get();
  }

  // A failed construction is cached as null until the session restarts.
  mapping::PositionMapperPtr mapper;
  try {
    mapper = toolchain.make_mapper();
    SREPL_LOG_INFO("position mapper ready", {StringField("toolchain", toolchain.name)});
  } catch (const mapping::MapperError& e) {
    SREPL_LOG_ERROR("toolchain unmappable until restart", {StringField("toolchain", toolchain.name),
                                                           StringField("reason", mapping::ReasonName(e.reason())),
                                                           StringField("error", e.what())});
  }

  auto* raw = mapper.get();
  mappers_.emplace(toolchain.name, std::move(mapper));
  return raw;
}

std::optional<std::vector<LogEntry>> Orchestrator::ReadLog(const fs::path& artifact_path) const {
  auto content = srepl::util::ReadFile(options_.log_file);
  if (!content) {
    return std::nullopt;
  }

  std::vector<LogEntry> entries;

  const auto         base_directory = options_.log_file.parent_path();
  std::istringstream lines(*content);
  std::string        line;
  std::size_t        dropped = 0;
  while (std::getline(lines, line)) {
    if (line.empty()) {
      continue;
    }
    auto entry = srepl::log::Decode(base_directory, line);
    if (!entry || entry->file_path != artifact_path) {
      // malformed, or left over from another artifact
      ++dropped;
      continue;
    }
    entries.push_back(std::move(*entry));
  }

  if (dropped > 0) {
    SREPL_LOG_TRACE("log lines dropped", {IntField("count", static_cast<std::int64_t>(dropped))});
  }
  return entries;
}

std::optional<std::vector<LogEntry>> Orchestrator::MapEntries(const Resolution& resolution, std::vector<LogEntry> entries) {
  if (!resolution.link) {
    return entries;
  }

  auto mapper = mappers_.find(resolution.link->toolchain);
  if (mapper == mappers_.end() || !mapper->second) {
    return std::nullopt;
  }

  std::unique_ptr<mapping::MappingTable> table;
  try {
    table = mapper->second->LoadTable(resolution.link->mapping_table_path);
  } catch (const srepl::util::TransientFault& e) {
    SREPL_LOG_WARN("mapping table unavailable", {StringField("path", resolution.link->mapping_table_path.string()), StringField("error", e.what())});
    return std::nullopt;
  }

  std::vector<LogEntry> mapped;
  mapped.reserve(entries.size());
  for (auto& entry : entries) {
    // mapping needs a column
    if (!entry.column) {
      continue;
    }
    auto position = table->Resolve({entry.line, *entry.column});
    if (!position) {
      continue;
    }

    LogEntry source_entry;
    source_entry.file_path = resolution.source_path;
    source_entry.line      = position->line;
    source_entry.column    = position->column;
    source_entry.result    = std::move(entry.result);
    mapped.push_back(std::move(source_entry));
  }
  return mapped;
}

void Orchestrator::ClearLog() const {
  try {
    srepl::util::RemoveIfExists(options_.log_file);
  } catch (const std::exception& e) {
    SREPL_LOG_WARN("cannot remove probe log", {StringField("path", options_.log_file.string()), StringField("error", e.what())});
  }
}

void Orchestrator::MarkTouched(const fs::path& source_path) {
  if (touched_set_.insert(source_path).second) {
    touched_.push_back(source_path);
  }
}

void Orchestrator::Persist(const Resolution& resolution, const std::string& content) {
  debounce_.Record(resolution.artifact_path, options_.now());
  MarkTouched(resolution.source_path);

  // Different files; both must finish before the cycle closes.
  auto write = std::async(std::launch::async, [&] { srepl::util::WriteFile(resolution.source_path, content); });
  auto clear = std::async(std::launch::async, [this] { ClearLog(); });
  clear.get();
  write.get();
}

CycleOutcome Orchestrator::ProcessEvent(const fs::path& changed_path) {
  const auto event_path = Normalize(changed_path, options_.root);

  // ------------------------------------------------------------
  // Resolving
  // ------------------------------------------------------------
  SREPL_LOG_TRACE("resolving", {StringField("path", event_path.string())});

  Resolution resolution{event_path, event_path, std::nullopt};
  if (auto link = links_.find(event_path); link != links_.end()) {
    resolution.source_path = link->second.source_path;
    resolution.link        = std::move(link->second);
    links_.erase(link);
  } else if (const auto* toolchain = ToolchainFor(event_path)) {
    auto* mapper = MapperFor(*toolchain);
    if (!mapper) {
      return CycleOutcome::kUnmappable;
    }

    // The derived artifact's own change event runs the cycle.
    auto paths = mapper->ArtifactFor(event_path);
    auto key   = Normalize(paths.artifact_path, options_.root);
    links_[key] = MappingLink{event_path, Normalize(paths.mapping_table_path, options_.root), toolchain->name};
    SREPL_LOG_TRACE("linked derived artifact", {StringField("source", event_path.string()), StringField("artifact", key.string())});
    return CycleOutcome::kLinked;
  }

  if (!runner_->Handles(resolution.artifact_path)) {
    return CycleOutcome::kNotExecutable;
  }

  if (debounce_.Consume(resolution.artifact_path, options_.now())) {
    SREPL_LOG_TRACE("ignoring own write", {StringField("artifact", resolution.artifact_path.string())});
    return CycleOutcome::kDebounced;
  }

  // ------------------------------------------------------------
  // Executing
  // ------------------------------------------------------------
  SREPL_LOG_TRACE("executing", {StringField("artifact", resolution.artifact_path.string())});
  ClearLog();
  const auto started = options_.now();
  try {
    CaptureScope scope(capture_);
    runner_->Run(RunRequest{resolution.artifact_path, resolution.source_path}, capture_);
  } catch (const srepl::util::ExecutionFailed& e) {
    // broken saves are expected while editing
    SREPL_LOG_WARN("module run failed", {StringField("artifact", resolution.artifact_path.string()), StringField("error", e.what())});
    return CycleOutcome::kExecutionFailed;
  }

  // ------------------------------------------------------------
  // Reading-Log
  // ------------------------------------------------------------
  SREPL_LOG_TRACE("reading log", {StringField("path", options_.log_file.string()),
                                  IntField("run_ms", static_cast<std::int64_t>(srepl::util::MillisBetween(started, options_.now())))});
  auto entries = ReadLog(resolution.artifact_path);
  if (!entries) {
    return CycleOutcome::kNoLog;
  }
  if (entries->empty()) {
    ClearLog();
    return CycleOutcome::kNoEntries;
  }

  // ------------------------------------------------------------
  // Mapping
  // ------------------------------------------------------------
  SREPL_LOG_TRACE("mapping", {IntField("entries", static_cast<std::int64_t>(entries->size())), BoolField("mapped", resolution.link.has_value())});
  auto mapped = MapEntries(resolution, std::move(*entries));
  if (!mapped) {
    ClearLog();
    return CycleOutcome::kMappingFailed;
  }

  // ------------------------------------------------------------
  // Rewriting
  // ------------------------------------------------------------
  SREPL_LOG_TRACE("rewriting", {StringField("source", resolution.source_path.string())});
  auto original = srepl::util::ReadFile(resolution.source_path);
  if (!original) {
    ClearLog();
    return CycleOutcome::kSourceUnreadable;
  }

  auto updated = srepl::rewrite::Apply(srepl::rewrite::StripTrailing(*original), *mapped);

  // ------------------------------------------------------------
  // Persisting
  // ------------------------------------------------------------
  if (updated == *original) {
    ClearLog();
    return CycleOutcome::kUnchanged;
  }

  Persist(resolution, updated);
  SREPL_LOG_DEBUG("annotations updated", {StringField("source", resolution.source_path.string()),
                                          IntField("entries", static_cast<std::int64_t>(mapped->size()))});
  return CycleOutcome::kPersisted;
}

std::size_t Orchestrator::Rollback() {
  SREPL_LOG_INFO("rolling back annotations", {IntField("files", static_cast<std::int64_t>(touched_.size()))});

  std::vector<std::future<bool>> tasks;
  tasks.reserve(touched_.size());
  for (const auto& path : touched_) {
    tasks.push_back(std::async(std::launch::async, [path] { return RestoreFile(path); }));
  }

  std::size_t restored = 0;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    try {
      if (tasks[i].get()) {
        ++restored;
      } else {
        SREPL_LOG_WARN("touched file no longer readable", {StringField("path", touched_[i].string())});
      }
    } catch (const std::exception& e) {
      SREPL_LOG_WARN("rollback failed", {StringField("path", touched_[i].string()), StringField("error", e.what())});
    }
  }
  return restored;
}

} // namespace srepl::watch
