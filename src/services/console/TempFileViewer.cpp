#include "TempFileViewer.hpp"

#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ssd {

namespace fs = std::filesystem;

TempFileViewer::TempFileViewer(std::string viewerCommand)
  : viewer_(std::move(viewerCommand)),
    tempDir_((fs::temp_directory_path() /
              ("slug_sweep_open_" + std::to_string(::getpid()))).string()) {}

TempFileViewer::~TempFileViewer() {
  if (const size_t left = runningViewers()) {
    spdlog::debug("{} viewer process(es) still running at exit", left);
  }
  std::error_code ec;
  fs::remove_all(tempDir_, ec);
  if (ec) spdlog::warn("Could not remove {}: {}", tempDir_, ec.message());
}

size_t TempFileViewer::runningViewers() {
  std::vector<pid_t> running;
  for (pid_t pid : children_) {
    const pid_t rc = ::waitpid(pid, nullptr, WNOHANG);
    if (rc == 0) running.push_back(pid);
  }
  children_.swap(running);
  return children_.size();
}

bool TempFileViewer::open(const std::string& path) {
  runningViewers();

  std::error_code ec;
  fs::create_directories(tempDir_, ec);
  if (ec) {
    spdlog::error("Cannot create {}: {}", tempDir_, ec.message());
    return false;
  }

  const fs::path dest = fs::path(tempDir_) / fs::path(path).filename();
  fs::copy_file(path, dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    spdlog::error("Cannot copy {} for viewing: {}", path, ec.message());
    return false;
  }

  const std::string destStr = dest.string();
  char* argv[] = {const_cast<char*>(viewer_.c_str()), const_cast<char*>(destStr.c_str()), nullptr};
  pid_t pid = 0;
  const int rc = posix_spawnp(&pid, viewer_.c_str(), nullptr, nullptr, argv, environ);
  if (rc != 0) {
    spdlog::error("Cannot launch viewer '{}': {}", viewer_, std::strerror(rc));
    return false;
  }
  children_.push_back(pid);
  spdlog::debug("Viewer '{}' started (pid {}) on {}", viewer_, pid, destStr);
  return true;
}

} // namespace ssd
