#pragma once
#include "pk/commands/EditCommand.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pk {

using CommandPtr = std::shared_ptr<EditCommand>;

// Invoker for EditCommands. Keeps two sequences:
//  - log_: every command ever executed, in order. Never shrinks on undo.
//  - undoStack_: executed, not-yet-undone commands (LIFO).
// There is no redo; an undone command stays in the log only.
class CommandHistory {
public:
  // Apply the command, then record it in the log and on the undo stack.
  // If apply() throws, nothing is recorded.
  void execute(CommandPtr cmd);

  // execute() each command in order. Not atomic: a throw partway through
  // leaves the earlier commands applied and recorded.
  void executeBatch(const std::vector<CommandPtr>& cmds);

  // Revert the most recent command. Returns false (and traces
  // "Nothing to undo!") when the undo stack is empty.
  bool undo();

  bool canUndo() const;

  std::size_t logCount() const;
  std::size_t undoCount() const;

  // Description of the next command undo() would revert.
  // Returns empty string if the undo stack is empty.
  std::string undoDescription() const;

  // 1-based "N. Kind" lines in execution order; also traced.
  std::vector<std::string> showHistory() const;

  const std::vector<CommandPtr>& log() const { return log_; }

  // {"history":[{"index":1,"kind":"Insert","description":"..."}],"undoDepth":N}
  std::string toJSON() const;

private:
  std::vector<CommandPtr> log_;
  std::vector<CommandPtr> undoStack_;
};

} // namespace pk
