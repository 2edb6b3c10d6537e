#include "pk/commands/EditProcessor.hpp"
#include "pk/session/EditSession.hpp"

#include <rapidjson/document.h>

#include <string>
#include <utility>
#include <vector>

namespace pk {

EditProcessor::EditProcessor(EditSession& session) : session_(session) {}

CmdResult EditProcessor::fail(const std::string& code,
                              const std::string& message,
                              const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

const rapidjson::Value* EditProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

bool EditProcessor::getSize(const rapidjson::Value& obj, const char* key, std::size_t& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsUint64()) return false;
  out = static_cast<std::size_t>(v->GetUint64());
  return true;
}

CmdResult EditProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "EditProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult EditProcessor::applyScriptText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsArray()) {
    return fail("BAD_COMMAND", "EditProcessor: script must be a JSON array");
  }

  rapidjson::SizeType index = 0;
  for (const auto& v : d.GetArray()) {
    CmdResult r = applyJson(v);
    if (!r.ok) {
      // Prepend the failing index to whatever details the command reported.
      const std::string& d = r.err.details;
      std::string merged = std::string(R"({"index":)") + std::to_string(index);
      if (d.size() > 2 && d.front() == '{') merged += "," + d.substr(1);
      else merged += "}";
      r.err.details = merged;
      return r;
    }
    ++index;
  }
  return {};
}

CmdResult EditProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "insert" || cmd == "delete" || cmd == "replace") return cmdEdit(obj);
  if (cmd == "undo") return cmdUndo(obj);
  if (cmd == "batch") return cmdBatch(obj);
  if (cmd == "history") return cmdHistory(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

CommandPtr EditProcessor::buildEdit(const rapidjson::Value& obj, CmdResult& err) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    err = fail("BAD_COMMAND", "Missing string field: cmd");
    return nullptr;
  }
  const std::string cmd = cmdV->GetString();

  std::size_t pos = 0;
  std::size_t len = 0;
  const bool hasPos = getSize(obj, "pos", pos);
  const auto* textV = getMember(obj, "text");

  if (cmd == "insert") {
    if (!textV || !textV->IsString()) {
      err = fail("BAD_COMMAND", "insert: missing string field: text");
      return nullptr;
    }
    if (getMember(obj, "pos") && !hasPos) {
      err = fail("BAD_COMMAND", "insert: pos must be a non-negative integer");
      return nullptr;
    }
    return hasPos ? CommandPtr(session_.makeInsert(textV->GetString(), pos))
                  : CommandPtr(session_.makeInsert(textV->GetString()));
  }

  if (cmd == "delete" || cmd == "replace") {
    if (!hasPos || !getSize(obj, "len", len)) {
      err = fail("BAD_COMMAND", cmd + ": missing/invalid pos or len");
      return nullptr;
    }
    if (cmd == "delete") return session_.makeDelete(pos, len);

    if (!textV || !textV->IsString()) {
      err = fail("BAD_COMMAND", "replace: missing string field: text");
      return nullptr;
    }
    return session_.makeReplace(pos, len, textV->GetString());
  }

  err = fail("UNKNOWN_COMMAND",
             "Not an edit command",
             std::string(R"({"cmd":")") + cmd + R"("})");
  return nullptr;
}

CmdResult EditProcessor::cmdEdit(const rapidjson::Value& obj) {
  CmdResult r;
  CommandPtr c = buildEdit(obj, r);
  if (!c) return r;

  try {
    session_.execute(c);
  } catch (const RangeError& e) {
    return fail("RANGE_ERROR", e.what(),
                std::string(R"({"length":)") + std::to_string(session_.buffer().length()) + "}");
  }
  return r;
}

CmdResult EditProcessor::cmdUndo(const rapidjson::Value&) {
  lastUndoEmpty_ = !session_.undo();
  return {};
}

CmdResult EditProcessor::cmdBatch(const rapidjson::Value& obj) {
  const auto* arr = getMember(obj, "cmds");
  if (!arr || !arr->IsArray()) {
    return fail("BAD_COMMAND", "batch: missing array field: cmds");
  }

  // Insert positions default to the buffer end at build time, so every
  // entry of a batch shares the end position from before the batch runs.
  std::vector<CommandPtr> cmds;
  cmds.reserve(arr->Size());
  for (const auto& v : arr->GetArray()) {
    CmdResult r;
    CommandPtr c = buildEdit(v, r);
    if (!c) return r;
    cmds.push_back(std::move(c));
  }

  const std::size_t before = session_.history().logCount();
  try {
    session_.executeBatch(cmds);
  } catch (const RangeError& e) {
    const std::size_t executed = session_.history().logCount() - before;
    return fail("RANGE_ERROR", e.what(),
                std::string(R"({"executed":)") + std::to_string(executed) + "}");
  }
  return {};
}

CmdResult EditProcessor::cmdHistory(const rapidjson::Value&) {
  session_.showHistory();
  return {};
}

std::string EditProcessor::stateJson() const {
  return serializeSessionState(session_);
}

} // namespace pk
