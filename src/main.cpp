// src/main.cpp
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/errors/Errors.hpp"
#include "core/paths/PathTranslator.hpp"
#include "core/sweep/FilterPipeline.hpp"
#include "core/sweep/SweepSession.hpp"
#include "core/tracking/InitDb.hpp"
#include "core/tracking/TrackingStore.hpp"
#include "services/archives/ArchivesGateway.hpp"
#include "services/archives/ArchivesIndex.hpp"
#include "services/console/TempFileViewer.hpp"
#include "services/console/TerminalConsole.hpp"

#ifndef SSD_VERSION
#define SSD_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " sweep <location> [--debug]  # review duplicates in one directory\n"
            << "  " << argv0 << " init-db                     # create a new tracking store\n"
            << "  " << argv0 << " sync-db                     # publish the local store to SWEEP_DB_LOCATION\n"
            << "  " << argv0 << " status                      # show record counts\n"
            << "  " << argv0 << " --version\n";
}

static bool ask_yes_no(const std::string& question) {
  std::cout << question << " (yes/no) [no]: " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) return false;
  return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

// ---------- commands ----------

static int cmd_sweep(const std::string& location) {
  const AppConfig cfg = loadConfig(ConfigScope::Sweep);

  if (!fs::exists(location)) {
    std::cerr << "Error: Location does not exist: " << location << "\n";
    return 1;
  }
  if (!fs::is_directory(location)) {
    std::cerr << "Error: Location is not a directory: " << location << "\n";
    return 1;
  }
  PathTranslator paths(cfg.fileServerMount);
  if (!paths.isUnder(location)) {
    std::cerr << "Error: Location is not under FILE_SERVER_MOUNT (" << paths.mount()
              << "): " << location << "\n";
    return 1;
  }

  std::cout << "Initializing services...\n";
  TrackingStore store(cfg.localStorePath(), cfg.sharedStorePath());
  ssd::ArchivesIndex index({cfg.archivesDbHost, cfg.archivesDbName,
                            cfg.archivesDbUser, cfg.archivesDbPassword});
  ssd::ArchivesGateway gateway({cfg.archivesAppUrl, cfg.archivesAppUser, cfg.archivesAppPassword});
  ssd::TerminalConsole console(std::cin, std::cout);
  ssd::TempFileViewer viewer(cfg.viewer);

  SweepOptions options;
  options.syncInterval = cfg.syncInterval;

  SweepSession session(store, index, gateway, FilterPipeline::fromNames(cfg.filters),
                       std::move(paths), console, &viewer, options);
  const SweepSummary s = session.run(location);

  std::cout << "\nSweep " << (s.outcome == SweepOutcome::Quit ? "stopped" : "complete")
            << ": " << s.kept << " kept, " << s.deleted << " deleted, " << s.skipped
            << " skipped, " << s.errors << " error(s)"
            << (s.synced ? "" : " (shared copy NOT updated, run sync-db later)") << "\n";
  return 0;
}

static int cmd_init_db() {
  const AppConfig cfg = loadConfig(ConfigScope::Store);

  std::cout << "Creating new database at: " << cfg.sharedStorePath() << "\n";
  const bool created = createTrackingStore(
    cfg.localStorePath(), cfg.sharedStorePath(),
    [](const std::vector<std::string>& existing) {
      std::cout << "A tracking store already exists:\n";
      for (const auto& f : existing) std::cout << "  " << f << "\n";
      std::cout << "Decisions not yet synced would be lost.\n";
      return ask_yes_no("Do you want to overwrite it?");
    });
  if (!created) {
    std::cout << "Operation cancelled.\n";
    return 0;
  }
  std::cout << "Database created successfully.\n";
  return 0;
}

static int cmd_sync_db() {
  const AppConfig cfg = loadConfig(ConfigScope::Store);
  const std::string local = cfg.localStorePath();
  if (!fs::exists(local)) {
    std::cerr << "Error: No local database found (" << local << ").\n";
    return 1;
  }

  std::cout << "Syncing database to storage...\n";
  TrackingStore store(local, cfg.sharedStorePath());
  store.sync();
  std::cout << "Database synced successfully.\n";
  return 0;
}

static int cmd_status() {
  const AppConfig cfg = loadConfig(ConfigScope::Store);
  TrackingStore store(cfg.localStorePath(), cfg.sharedStorePath());
  const StoreCounts c = store.counts();
  std::cout << "Tracking store:      " << store.localPath() << "\n"
            << "Shared copy:         " << store.sharedPath() << "\n"
            << "Processed locations: " << c.processed_locations << "\n"
            << "Processed files:     " << c.processed_files << "\n"
            << "Deleted instances:   " << c.deleted_files << "\n"
            << "Errors:              " << c.errors << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::vector<std::string> args;
  bool debug = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--debug") debug = true;
    else args.push_back(a);
  }

  spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::warn);
  loadDotEnv(".env");

  try {
    if (args.size() == 1 && (args[0] == "--version" || args[0] == "-V")) {
      std::cout << "slug-sweep " << SSD_VERSION << "\n";
      return 0;
    }
    if (args.size() == 2 && args[0] == "sweep") return cmd_sweep(args[1]);
    if (args.size() == 1 && args[0] == "init-db") return cmd_init_db();
    if (args.size() == 1 && args[0] == "sync-db") return cmd_sync_db();
    if (args.size() == 1 && args[0] == "status") return cmd_status();
    if (args.size() == 1 && (args[0] == "--help" || args[0] == "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n"
              << "Create a .env file with the required variables (see .env.example).\n";
    return 1;
  } catch (const AlreadyExists& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const StoreUnavailable& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const MalformedPath& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const QueryFailure& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const SyncFailed& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    if (debug) spdlog::critical("Unhandled {}: {}", typeid(e).name(), e.what());
    return 2;
  }
}
