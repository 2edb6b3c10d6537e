#pragma once
#include "pk/commands/CommandHistory.hpp"
#include "pk/commands/EditCommand.hpp"
#include "pk/debug/Trace.hpp"
#include "pk/text/TextBuffer.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pk {

struct EditSessionConfig {
  std::string initialText;
  bool narrate{true};   // traceConfig().enabled while the session lives
};

// Parse {"initialText":"...","narrate":true}. Missing keys keep their
// current values. Returns false on parse error or non-object root.
bool deserializeEditSessionConfig(const std::string& json, EditSessionConfig& out);

// One editing session: owns the buffer and its history. Commands made by
// the factories are bound to this session's buffer. A session built from a
// config narrates per cfg.narrate until it is destroyed, then the previous
// trace setting is restored.
class EditSession {
public:
  EditSession();
  explicit EditSession(const EditSessionConfig& cfg);

  EditSession(const EditSession&) = delete;
  EditSession& operator=(const EditSession&) = delete;

  // Insert at the current end of the buffer.
  std::shared_ptr<InsertCommand> makeInsert(const std::string& text);
  std::shared_ptr<InsertCommand> makeInsert(const std::string& text, std::size_t position);
  std::shared_ptr<DeleteCommand> makeDelete(std::size_t position, std::size_t length);
  std::shared_ptr<ReplaceCommand> makeReplace(std::size_t position, std::size_t length,
                                              const std::string& newText);

  void execute(CommandPtr cmd) { history_.execute(std::move(cmd)); }
  void executeBatch(const std::vector<CommandPtr>& cmds) { history_.executeBatch(cmds); }
  bool undo() { return history_.undo(); }
  std::vector<std::string> showHistory() const { return history_.showHistory(); }

  TextBuffer& buffer() { return buffer_; }
  const TextBuffer& buffer() const { return buffer_; }
  CommandHistory& history() { return history_; }
  const CommandHistory& history() const { return history_; }

  const std::string& text() const { return buffer_.text(); }

private:
  ScopedTrace trace_;
  TextBuffer buffer_;
  CommandHistory history_;
};

// {"version":"1.0","text":"...","undoDepth":N,"history":["Insert",...]}
std::string serializeSessionState(const EditSession& session);

} // namespace pk
