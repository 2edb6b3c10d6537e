#include "pk/commands/EditCommand.hpp"
#include "pk/debug/Trace.hpp"

#include <stdexcept>
#include <utility>

namespace pk {

const char* commandKindName(CommandKind kind) {
  switch (kind) {
    case CommandKind::Insert:  return "Insert";
    case CommandKind::Delete:  return "Delete";
    case CommandKind::Replace: return "Replace";
  }
  return "Unknown";
}

// -------------------- Insert --------------------

InsertCommand::InsertCommand(TextBuffer& buffer, std::string text)
  : EditCommand(buffer), text_(std::move(text)), position_(buffer.length()) {}

InsertCommand::InsertCommand(TextBuffer& buffer, std::string text,
                             std::size_t position)
  : EditCommand(buffer), text_(std::move(text)), position_(position) {}

void InsertCommand::apply() {
  trace("\n[Command] Executing INSERT\n");
  buffer_.insert(text_, position_);
  applied_ = true;
}

void InsertCommand::revert() {
  if (!applied_) {
    throw std::logic_error("InsertCommand::revert: command was never applied");
  }
  trace("\n[Command] Undoing INSERT\n");
  buffer_.erase(position_, text_.size());
}

std::string InsertCommand::describe() const {
  return "Insert '" + text_ + "' at " + std::to_string(position_);
}

// -------------------- Delete --------------------

DeleteCommand::DeleteCommand(TextBuffer& buffer, std::size_t position,
                             std::size_t length)
  : EditCommand(buffer), position_(position), length_(length) {}

void DeleteCommand::apply() {
  trace("\n[Command] Executing DELETE\n");
  deletedText_ = buffer_.erase(position_, length_);
  applied_ = true;
}

void DeleteCommand::revert() {
  if (!applied_) {
    throw std::logic_error("DeleteCommand::revert: no deleted text recorded");
  }
  trace("\n[Command] Undoing DELETE\n");
  buffer_.insert(deletedText_, position_);
}

std::string DeleteCommand::describe() const {
  return "Delete " + std::to_string(length_) + " at " + std::to_string(position_);
}

// -------------------- Replace --------------------

ReplaceCommand::ReplaceCommand(TextBuffer& buffer, std::size_t position,
                               std::size_t length, std::string newText)
  : EditCommand(buffer),
    delete_(buffer, position, length),
    insert_(buffer, std::move(newText), position) {}

void ReplaceCommand::apply() {
  trace("\n[Command] Executing REPLACE (macro)\n");
  // Both steps are anchored at the same position; the old text must be gone
  // before the new text lands there.
  delete_.apply();
  insert_.apply();
}

void ReplaceCommand::revert() {
  trace("\n[Command] Undoing REPLACE (macro)\n");
  insert_.revert();
  delete_.revert();
}

std::string ReplaceCommand::describe() const {
  return "Replace " + std::to_string(delete_.length()) + " at " +
         std::to_string(delete_.position()) + " with '" + insert_.text() + "'";
}

} // namespace pk
