#pragma once
#include <string>
#include <vector>

enum class CommandKind { Delete, Keep, Open, Skip, Quit, Invalid };

struct Command {
  CommandKind kind = CommandKind::Invalid;
  std::vector<int> indices;  // 1-based; Delete: the selection, Open: exactly one
};

// "1 3" delete, "c" keep all, "o 2" open, "s" skip, "q" quit. Case-insensitive,
// surrounding whitespace ignored. Repeated delete indices are collapsed.
Command parseCommand(const std::string& line);
