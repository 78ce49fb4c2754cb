#include "SweepSession.hpp"
#include "Command.hpp"
#include "core/errors/Errors.hpp"
#include "core/tracking/TrackingStore.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

SweepSession::SweepSession(TrackingStore& store,
                           DuplicateIndex& index,
                           DeletionGateway& gateway,
                           FilterPipeline filters,
                           PathTranslator paths,
                           OperatorConsole& console,
                           InstanceViewer* viewer,
                           SweepOptions options)
  : store_(store),
    index_(index),
    gateway_(gateway),
    filters_(std::move(filters)),
    paths_(std::move(paths)),
    console_(console),
    viewer_(viewer),
    options_(options) {}

// ---------- session ----------

SweepSummary SweepSession::run(const std::string& location) {
  summary_ = SweepSummary{};
  summary_.archivePath = paths_.toArchive(location);
  summary_.location = paths_.toOperator(summary_.archivePath);

  spdlog::info("Sweep started for {} (archive path '{}')", summary_.location, summary_.archivePath);
  console_.info("Querying for duplicates in: " + summary_.archivePath);

  std::vector<int64_t> fileIds;
  try {
    fileIds = collectCandidates(summary_.archivePath);
  } catch (const QueryFailure& e) {
    console_.error(std::string("Duplicate query failed: ") + e.what());
    recordError("query", std::nullopt, e.what(), summary_.location);
    finalSync();
    throw;
  }
  summary_.groups = fileIds.size();

  if (fileIds.empty()) {
    console_.info("Nothing to review in this location.");
  } else {
    console_.info(fmt::format("Ready to review {} unique files.", fileIds.size()));

    PeriodicSync timer(store_, options_.syncInterval);
    if (options_.syncInterval.count() > 0) timer.start();

    for (size_t i = 0; i < fileIds.size(); ++i) {
      const GroupResult r = reviewGroup(fileIds[i], i + 1, fileIds.size());
      if (r == GroupResult::Quit) {
        summary_.outcome = SweepOutcome::Quit;
        break;
      }
      switch (r) {
        case GroupResult::Kept:       ++summary_.kept; break;
        case GroupResult::Deleted:    ++summary_.deleted; break;
        case GroupResult::Skipped:    ++summary_.skipped; break;
        case GroupResult::Unrecorded: ++summary_.unrecorded; break;
        case GroupResult::Quit:       break;
      }
    }
    timer.stop();
  }

  if (summary_.outcome == SweepOutcome::Completed) {
    try {
      store_.recordLocationComplete(summary_.location, summary_.archivePath,
                                    static_cast<int64_t>(summary_.groups));
      console_.info("All files in location processed.");
    } catch (const StoreError& e) {
      console_.error(std::string("Could not mark location complete: ") + e.what());
      recordError("record-location", std::nullopt, e.what(), summary_.location);
    }
  } else {
    console_.warn("Quitting; remaining files stay unprocessed.");
  }

  finalSync();
  spdlog::info("Sweep of {} ended: {} kept, {} deleted, {} skipped, {} unrecorded, {} errors",
               summary_.location, summary_.kept, summary_.deleted, summary_.skipped,
               summary_.unrecorded, summary_.errors);
  return summary_;
}

std::vector<int64_t> SweepSession::collectCandidates(const std::string& archivePath) {
  const auto found = index_.findDuplicatesUnder(archivePath);
  summary_.candidates = found.size();
  console_.info(fmt::format("Found {} duplicate file instances.", found.size()));

  const auto filtered = filters_.apply(found);
  summary_.afterFilters = filtered.size();
  console_.info(fmt::format("After filtering: {} file instances to review.", filtered.size()));

  // Group by file_id in first-seen order.
  std::vector<int64_t> order;
  std::unordered_set<int64_t> seen;
  for (const auto& inst : filtered) {
    if (store_.isProcessed(inst.file_id)) continue;
    ++summary_.unprocessed;
    if (seen.insert(inst.file_id).second) order.push_back(inst.file_id);
  }
  console_.info(fmt::format("Unprocessed: {} instances.", summary_.unprocessed));
  return order;
}

// ---------- per group ----------

SweepSession::GroupResult SweepSession::reviewGroup(int64_t file_id, size_t position, size_t total) {
  std::vector<FileInstance> all;
  try {
    all = index_.findAllLocations(file_id);
  } catch (const QueryFailure& e) {
    console_.error(fmt::format("Could not load locations for file {}: {}", file_id, e.what()));
    recordError("query", file_id, e.what(), summary_.location);
    return GroupResult::Unrecorded;
  }

  if (all.size() < 2) {
    console_.warn(fmt::format("File {} now has {} location(s); leaving it for a later sweep.",
                              file_id, all.size()));
    spdlog::warn("File {} no longer duplicated ({} locations)", file_id, all.size());
    return GroupResult::Unrecorded;
  }

  CandidateGroup group{file_id, {}};
  for (size_t i = 0; i < all.size(); ++i) {
    const auto& inst = all[i];
    group.instances.push_back({static_cast<int>(i + 1), inst,
                               paths_.toOperator(inst.directory, inst.filename),
                               inst.directory == summary_.archivePath});
  }

  console_.showGroup(group, position, total);

  for (;;) {
    const auto line = console_.readCommand();
    if (!line) {
      console_.warn("End of input.");
      return GroupResult::Quit;
    }

    const Command cmd = parseCommand(*line);
    switch (cmd.kind) {
      case CommandKind::Invalid:
        console_.error("Invalid command. Please try again.");
        continue;

      case CommandKind::Quit:
        return GroupResult::Quit;

      case CommandKind::Skip:
        console_.info("Skipping this file.");
        return GroupResult::Skipped;

      case CommandKind::Open:
        openInstance(group, cmd.indices.front());
        console_.showGroup(group, position, total);
        continue;

      case CommandKind::Keep:
        try {
          store_.recordKept(file_id, summary_.location,
                            fmt::format("kept all {} instances", group.instances.size()));
        } catch (const StoreError& e) {
          console_.error(std::string("Could not record decision: ") + e.what());
          recordError("record-kept", file_id, e.what(), summary_.location);
          return GroupResult::Unrecorded;
        }
        console_.info("Marked as processed (all copies kept).");
        return GroupResult::Kept;

      case CommandKind::Delete: {
        std::vector<const PresentedInstance*> selected;
        for (int idx : cmd.indices) {
          if (idx >= 1 && static_cast<size_t>(idx) <= group.instances.size()) {
            selected.push_back(&group.instances[static_cast<size_t>(idx - 1)]);
          } else {
            console_.warn(fmt::format("Ignoring invalid file number {}.", idx));
          }
        }
        if (selected.empty()) {
          console_.error("No valid file numbers specified.");
          continue;
        }
        if (!console_.confirmDeletion(group, selected)) {
          console_.info("Deletion cancelled.");
          continue;
        }
        return executeDeletion(group, selected);
      }
    }
  }
}

SweepSession::GroupResult SweepSession::executeDeletion(
    const CandidateGroup& group, const std::vector<const PresentedInstance*>& selected) {
  std::vector<Deletion> done;

  for (const auto* sel : selected) {
    console_.info("Deleting: " + sel->path);

    DeletionResult r;
    try {
      r = gateway_.requestDeletion(group.file_id, sel->path);
    } catch (const std::exception& e) {
      r.success = false;
      r.error_message = e.what();
    }

    if (r.success) {
      spdlog::debug("Deletion accepted for {} (ref {})", sel->path, r.gateway_ref);
      done.push_back({sel->path, sel->instance.size, r.gateway_ref});
      console_.info("Deletion task enqueued successfully.");
    } else {
      spdlog::warn("Deletion of {} failed: {}", sel->path, r.error_message);
      console_.error("Error enqueuing deletion: " + r.error_message);
      recordError("delete", group.file_id, r.error_message, sel->path);
    }
  }

  if (done.empty()) {
    console_.warn("No instance was deleted; the file stays eligible for review.");
    return GroupResult::Unrecorded;
  }

  const std::string note =
    fmt::format("deleted {} of {} instances", done.size(), group.instances.size());
  try {
    store_.recordDeleted(group.file_id, summary_.location, note, done);
  } catch (const StoreError& e) {
    std::string paths;
    for (const auto& d : done) paths += (paths.empty() ? "" : "; ") + d.path;
    console_.error(std::string("Deletions were accepted but could not be recorded: ") + e.what());
    recordError("record-deleted", group.file_id, e.what(), paths);
    return GroupResult::Unrecorded;
  }
  console_.info("File processed.");
  return GroupResult::Deleted;
}

void SweepSession::openInstance(const CandidateGroup& group, int index) {
  if (index < 1 || static_cast<size_t>(index) > group.instances.size()) {
    console_.error("Invalid file number.");
    return;
  }
  if (!viewer_) {
    console_.warn("No viewer available in this session.");
    return;
  }
  const auto& inst = group.instances[static_cast<size_t>(index - 1)];
  console_.info("Opening file: " + inst.path);
  if (viewer_->open(inst.path)) console_.info("File opened successfully.");
  else console_.error("Failed to open file.");
}

// ---------- bookkeeping ----------

void SweepSession::finalSync() {
  console_.info("Syncing database to storage...");
  try {
    store_.sync();
    summary_.synced = true;
  } catch (const SyncFailed& e) {
    spdlog::warn("Final sync failed: {}", e.what());
    console_.warn(std::string("Sync failed, local store kept: ") + e.what());
    recordError("sync", std::nullopt, e.what(), store_.sharedPath());
  }
}

void SweepSession::recordError(const std::string& operation, std::optional<int64_t> file_id,
                               const std::string& message,
                               const std::optional<std::string>& context) {
  ++summary_.errors;
  try {
    store_.recordError(operation, file_id, message, context);
  } catch (const StoreError& e) {
    spdlog::error("Could not record {} error ({}): {}", operation, message, e.what());
  }
}
