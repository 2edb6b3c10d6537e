#include "pk/commands/CommandHistory.hpp"
#include "pk/debug/Trace.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>
#include <utility>

namespace pk {

void CommandHistory::execute(CommandPtr cmd) {
  if (!cmd) throw std::invalid_argument("CommandHistory::execute: null command");
  cmd->apply();
  log_.push_back(cmd);
  undoStack_.push_back(std::move(cmd));
}

void CommandHistory::executeBatch(const std::vector<CommandPtr>& cmds) {
  trace("\n[CommandHistory] Executing batch of %zu commands\n", cmds.size());
  for (const auto& cmd : cmds) {
    execute(cmd);
  }
}

bool CommandHistory::undo() {
  if (undoStack_.empty()) {
    trace("\n[CommandHistory] Nothing to undo!\n");
    return false;
  }
  auto cmd = std::move(undoStack_.back());
  undoStack_.pop_back();
  cmd->revert();
  return true;
}

bool CommandHistory::canUndo() const { return !undoStack_.empty(); }

std::size_t CommandHistory::logCount() const { return log_.size(); }
std::size_t CommandHistory::undoCount() const { return undoStack_.size(); }

std::string CommandHistory::undoDescription() const {
  return undoStack_.empty() ? std::string() : undoStack_.back()->describe();
}

std::vector<std::string> CommandHistory::showHistory() const {
  std::vector<std::string> lines;
  lines.reserve(log_.size());

  trace("\n[CommandHistory] Command History:\n");
  for (std::size_t i = 0; i < log_.size(); ++i) {
    lines.push_back(std::to_string(i + 1) + ". " + log_[i]->name());
    trace("  %s\n", lines.back().c_str());
  }
  return lines;
}

std::string CommandHistory::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("history");
  w.StartArray();
  for (std::size_t i = 0; i < log_.size(); ++i) {
    const std::string desc = log_[i]->describe();
    w.StartObject();
    w.Key("index");       w.Uint64(static_cast<std::uint64_t>(i + 1));
    w.Key("kind");        w.String(log_[i]->name());
    w.Key("description"); w.String(desc.c_str(), static_cast<rapidjson::SizeType>(desc.size()));
    w.EndObject();
  }
  w.EndArray();
  w.Key("undoDepth");
  w.Uint64(static_cast<std::uint64_t>(undoStack_.size()));
  w.EndObject();

  return sb.GetString();
}

} // namespace pk
