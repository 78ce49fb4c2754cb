#pragma once
#include "DeletionGateway.hpp"
#include "DuplicateIndex.hpp"
#include "FilterPipeline.hpp"
#include "OperatorConsole.hpp"
#include "core/paths/PathTranslator.hpp"
#include "core/tracking/PeriodicSync.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

class TrackingStore;

enum class SweepOutcome { Completed, Quit };

struct SweepSummary {
  SweepOutcome outcome = SweepOutcome::Completed;
  std::string  location;       // canonical operator form
  std::string  archivePath;
  size_t candidates = 0;       // duplicate instances reported by the index
  size_t afterFilters = 0;
  size_t unprocessed = 0;
  size_t groups = 0;
  size_t kept = 0;
  size_t deleted = 0;
  size_t skipped = 0;
  size_t unrecorded = 0;       // vanished, query failure, every deletion failed
  size_t errors = 0;
  bool   synced = false;       // final sync reached the shared copy
};

struct SweepOptions {
  // Zero disables the background timer; the final sync still runs.
  std::chrono::milliseconds syncInterval = PeriodicSync::kDefaultInterval;
};

// One interactive pass over a single directory of the archive:
// query, filter, drop already-processed files, then one decision per file_id,
// each outcome written to the tracking store before the next group is shown.
class SweepSession {
public:
  SweepSession(TrackingStore& store,
               DuplicateIndex& index,
               DeletionGateway& gateway,
               FilterPipeline filters,
               PathTranslator paths,
               OperatorConsole& console,
               InstanceViewer* viewer = nullptr,
               SweepOptions options = {});

  // Throws MalformedPath if the location is not under the mount, QueryFailure if
  // the initial duplicate query fails. Operator quit is a normal return.
  SweepSummary run(const std::string& location);

private:
  enum class GroupResult { Kept, Deleted, Skipped, Unrecorded, Quit };

  std::vector<int64_t> collectCandidates(const std::string& archivePath);
  GroupResult reviewGroup(int64_t file_id, size_t position, size_t total);
  GroupResult executeDeletion(const CandidateGroup& group,
                              const std::vector<const PresentedInstance*>& selected);
  void openInstance(const CandidateGroup& group, int index);
  void finalSync();
  void recordError(const std::string& operation, std::optional<int64_t> file_id,
                   const std::string& message, const std::optional<std::string>& context);

  TrackingStore& store_;
  DuplicateIndex& index_;
  DeletionGateway& gateway_;
  FilterPipeline filters_;
  PathTranslator paths_;
  OperatorConsole& console_;
  InstanceViewer* viewer_;
  SweepOptions options_;
  SweepSummary summary_;
};
