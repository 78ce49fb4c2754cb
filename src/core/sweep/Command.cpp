#include "Command.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

static bool toIndex(const std::string& tok, int& out) {
  if (tok.empty() || tok.size() > 9) return false;
  if (!std::all_of(tok.begin(), tok.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
  out = std::stoi(tok);
  return true;
}

Command parseCommand(const std::string& line) {
  std::istringstream in(line);
  std::vector<std::string> tokens;
  for (std::string tok; in >> tok;) {
    std::transform(tok.begin(), tok.end(), tok.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    tokens.push_back(tok);
  }

  Command cmd;
  if (tokens.empty()) return cmd;

  const std::string& head = tokens.front();
  if (tokens.size() == 1 && head == "c") { cmd.kind = CommandKind::Keep; return cmd; }
  if (tokens.size() == 1 && head == "s") { cmd.kind = CommandKind::Skip; return cmd; }
  if (tokens.size() == 1 && head == "q") { cmd.kind = CommandKind::Quit; return cmd; }

  if (head == "o") {
    int n = 0;
    if (tokens.size() == 2 && toIndex(tokens[1], n)) {
      cmd.kind = CommandKind::Open;
      cmd.indices.push_back(n);
    }
    return cmd;
  }

  std::vector<int> indices;
  for (const auto& tok : tokens) {
    int n = 0;
    if (!toIndex(tok, n)) return cmd;
    if (std::find(indices.begin(), indices.end(), n) == indices.end()) indices.push_back(n);
  }
  cmd.kind = CommandKind::Delete;
  cmd.indices = std::move(indices);
  return cmd;
}
