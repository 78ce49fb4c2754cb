#pragma once
#include "core/sweep/OperatorConsole.hpp"

#include <cstddef>
#include <string>
#include <sys/types.h>
#include <vector>

namespace ssd {

// Copies the instance into a private temp directory and hands the copy to an
// external viewer, so the archive file itself is never opened for writing.
// Viewer processes are reaped as they exit; the directory is removed on destruction.
class TempFileViewer : public InstanceViewer {
public:
  explicit TempFileViewer(std::string viewerCommand);
  ~TempFileViewer() override;

  TempFileViewer(const TempFileViewer&) = delete;
  TempFileViewer& operator=(const TempFileViewer&) = delete;

  bool open(const std::string& path) override;

  const std::string& tempDir() const { return tempDir_; }

  // Reaps viewers that have exited and returns how many are still running.
  size_t runningViewers();

private:
  std::string viewer_;
  std::string tempDir_;
  std::vector<pid_t> children_;
};

} // namespace ssd
