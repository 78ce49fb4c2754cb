#include "TerminalConsole.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace ssd {

std::string formatFileSize(int64_t bytes) {
  constexpr double kKB = 1024.0;
  constexpr double kMB = kKB * 1024.0;
  constexpr double kGB = kMB * 1024.0;
  const double b = static_cast<double>(bytes);
  if (b < kKB) return fmt::format("{} B", bytes);
  if (b < kMB) return fmt::format("{:.0f} KB", b / kKB);
  if (b < kGB) return fmt::format("{:.1f} MB", b / kMB);
  return fmt::format("{:.2f} GB", b / kGB);
}

void TerminalConsole::showGroup(const CandidateGroup& group, size_t position, size_t total) {
  const std::string name = group.instances.empty() ? "" : group.instances.front().instance.filename;

  size_t pathWidth = 9;
  for (const auto& row : group.instances) pathWidth = std::max(pathWidth, row.path.size());

  out_ << fmt::format("\nFile {} of {}\n", position, total);
  out_ << fmt::format("File ID: {} ({})\n", group.file_id, name);
  out_ << fmt::format("{:>3}  {:<{}}  {:>10}  {}\n", "#", "File Path", pathWidth, "Size", "Notes");
  for (const auto& row : group.instances) {
    out_ << fmt::format("{:>3}  {:<{}}  {:>10}  {}\n", row.index, row.path, pathWidth,
                        formatFileSize(row.instance.size),
                        row.inSweepLocation ? "current loc" : "duplicate");
  }

  out_ << "\nCommands:\n"
       << "  <numbers> - Delete specific instances (e.g. '1 3')\n"
       << "  c         - Keep all copies (mark processed)\n"
       << "  o <#>     - Open file for inspection\n"
       << "  s         - Skip this file\n"
       << "  q         - Quit and sync database\n";
}

std::optional<std::string> TerminalConsole::readCommand() {
  out_ << "\nYour choice: " << std::flush;
  std::string line;
  if (!std::getline(in_, line)) return std::nullopt;
  return line;
}

bool TerminalConsole::confirmDeletion(const CandidateGroup& group,
                                      const std::vector<const PresentedInstance*>& selected) {
  out_ << fmt::format("\nYou are about to delete {} file(s):\n", selected.size());
  for (const auto* row : selected) out_ << fmt::format("  [{}] {}\n", row->index, row->path);
  if (selected.size() == group.instances.size()) {
    out_ << "WARNING: every copy of this file is selected; none will remain.\n";
  }
  out_ << "\nConfirm deletion? (yes/no) [no]: " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer)) return false;
  answer.erase(std::remove_if(answer.begin(), answer.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               answer.end());
  std::transform(answer.begin(), answer.end(), answer.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return answer == "y" || answer == "yes";
}

void TerminalConsole::info(const std::string& text) { out_ << text << "\n"; }

void TerminalConsole::warn(const std::string& text) { out_ << "Warning: " << text << "\n"; }

void TerminalConsole::error(const std::string& text) { out_ << "Error: " << text << "\n"; }

} // namespace ssd
