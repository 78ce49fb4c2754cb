#pragma once
#include "DuplicateIndex.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One row of the table shown to the operator.
struct PresentedInstance {
  int         index;          // 1-based
  FileInstance instance;
  std::string path;           // operator form
  bool        inSweepLocation;
};

struct CandidateGroup {
  int64_t file_id;
  std::vector<PresentedInstance> instances;
};

// Everything the sweep loop needs from the person at the keyboard.
class OperatorConsole {
public:
  virtual ~OperatorConsole() = default;

  virtual void showGroup(const CandidateGroup& group, size_t position, size_t total) = 0;

  // nullopt when input is exhausted; the session treats that as quit.
  virtual std::optional<std::string> readCommand() = 0;

  virtual bool confirmDeletion(const CandidateGroup& group,
                               const std::vector<const PresentedInstance*>& selected) = 0;

  virtual void info(const std::string& text) = 0;
  virtual void warn(const std::string& text) = 0;
  virtual void error(const std::string& text) = 0;
};

// Opens a copy of an instance for inspection. Never modifies the archive.
class InstanceViewer {
public:
  virtual ~InstanceViewer() = default;
  virtual bool open(const std::string& path) = 0;
};
