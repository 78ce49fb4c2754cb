#pragma once
#include "core/sweep/OperatorConsole.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace ssd {

// Human-readable size: "512 B", "823 KB", "1.5 MB", "2.25 GB".
std::string formatFileSize(int64_t bytes);

// Line-oriented console on a pair of streams (std::cin/std::cout in the CLI).
class TerminalConsole : public OperatorConsole {
public:
  TerminalConsole(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

  void showGroup(const CandidateGroup& group, size_t position, size_t total) override;
  std::optional<std::string> readCommand() override;
  bool confirmDeletion(const CandidateGroup& group,
                       const std::vector<const PresentedInstance*>& selected) override;

  void info(const std::string& text) override;
  void warn(const std::string& text) override;
  void error(const std::string& text) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

} // namespace ssd
