#pragma once
#include "pk/text/TextBuffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pk {

enum class CommandKind : std::uint8_t {
  Insert = 1,
  Delete = 2,
  Replace = 3  // macro: Delete then Insert at the same position
};

// "Insert", "Delete", "Replace".
const char* commandKindName(CommandKind kind);

// A reversible edit bound to a TextBuffer. The buffer is not owned and must
// outlive the command. revert() is only valid after apply().
class EditCommand {
public:
  explicit EditCommand(TextBuffer& buffer) : buffer_(buffer) {}
  virtual ~EditCommand() = default;

  EditCommand(const EditCommand&) = delete;
  EditCommand& operator=(const EditCommand&) = delete;

  virtual void apply() = 0;
  virtual void revert() = 0;

  virtual CommandKind kind() const = 0;
  virtual std::string describe() const = 0;

  const char* name() const { return commandKindName(kind()); }
  TextBuffer& buffer() const { return buffer_; }

protected:
  TextBuffer& buffer_;
};

class InsertCommand final : public EditCommand {
public:
  // Position defaults to the buffer length at construction time.
  InsertCommand(TextBuffer& buffer, std::string text);
  InsertCommand(TextBuffer& buffer, std::string text, std::size_t position);

  void apply() override;

  // Throws std::logic_error if apply() never ran.
  void revert() override;

  CommandKind kind() const override { return CommandKind::Insert; }
  std::string describe() const override;

  const std::string& text() const { return text_; }
  std::size_t position() const { return position_; }
  bool applied() const { return applied_; }

private:
  std::string text_;
  std::size_t position_;
  bool applied_{false};
};

class DeleteCommand final : public EditCommand {
public:
  DeleteCommand(TextBuffer& buffer, std::size_t position, std::size_t length);

  void apply() override;

  // Throws std::logic_error if apply() never ran.
  void revert() override;

  CommandKind kind() const override { return CommandKind::Delete; }
  std::string describe() const override;

  std::size_t position() const { return position_; }
  std::size_t length() const { return length_; }

  bool applied() const { return applied_; }
  const std::string& deletedText() const { return deletedText_; }

private:
  std::size_t position_;
  std::size_t length_;
  std::string deletedText_;
  bool applied_{false};
};

// Composite of Delete + Insert anchored at the same position.
// apply: delete, then insert. revert: insert.revert, then delete.revert.
class ReplaceCommand final : public EditCommand {
public:
  ReplaceCommand(TextBuffer& buffer, std::size_t position, std::size_t length,
                 std::string newText);

  void apply() override;
  void revert() override;

  CommandKind kind() const override { return CommandKind::Replace; }
  std::string describe() const override;

  const DeleteCommand& deleteStep() const { return delete_; }
  const InsertCommand& insertStep() const { return insert_; }

private:
  DeleteCommand delete_;
  InsertCommand insert_;
};

} // namespace pk
