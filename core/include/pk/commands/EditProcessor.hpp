#pragma once
#include "pk/commands/CommandHistory.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace pk {

class EditSession;

struct CmdError {
  std::string code;     // e.g. "RANGE_ERROR"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
};

// JSON front-end for an EditSession. One command object per call:
//   {"cmd":"insert","text":"abc","pos":0}     pos optional (default: end)
//   {"cmd":"delete","pos":0,"len":3}
//   {"cmd":"replace","pos":0,"len":3,"text":"xyz"}
//   {"cmd":"undo"}
//   {"cmd":"batch","cmds":[ <insert|delete|replace>, ... ]}
//   {"cmd":"history"}
class EditProcessor {
public:
  explicit EditProcessor(EditSession& session);

  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Apply every element of a JSON array in order; stops at the first failure.
  // The failing entry's details gain an "index" field.
  CmdResult applyScriptText(const std::string& jsonText);

  // serializeSessionState() of the bound session.
  std::string stateJson() const;

  // True when the last "undo" found nothing to revert.
  bool lastUndoWasEmpty() const { return lastUndoEmpty_; }

private:
  EditSession& session_;
  bool lastUndoEmpty_{false};

  CmdResult cmdEdit(const rapidjson::Value& obj);
  CmdResult cmdUndo(const rapidjson::Value& obj);
  CmdResult cmdBatch(const rapidjson::Value& obj);
  CmdResult cmdHistory(const rapidjson::Value& obj);

  // Builds an insert/delete/replace command from obj, or sets err.
  CommandPtr buildEdit(const rapidjson::Value& obj, CmdResult& err);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static bool getSize(const rapidjson::Value& obj, const char* key, std::size_t& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
};

} // namespace pk
