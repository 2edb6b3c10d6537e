#include "pk/session/EditSession.hpp"
#include "pk/debug/Trace.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace pk {

bool deserializeEditSessionConfig(const std::string& json, EditSessionConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("initialText") && doc["initialText"].IsString())
    out.initialText = doc["initialText"].GetString();

  if (doc.HasMember("narrate") && doc["narrate"].IsBool())
    out.narrate = doc["narrate"].GetBool();

  return true;
}

EditSession::EditSession()
  : trace_(traceConfig().enabled, traceConfig().out) {}

EditSession::EditSession(const EditSessionConfig& cfg)
  : trace_(cfg.narrate, traceConfig().out), buffer_(cfg.initialText) {}

std::shared_ptr<InsertCommand> EditSession::makeInsert(const std::string& text) {
  return std::make_shared<InsertCommand>(buffer_, text);
}

std::shared_ptr<InsertCommand> EditSession::makeInsert(const std::string& text,
                                                       std::size_t position) {
  return std::make_shared<InsertCommand>(buffer_, text, position);
}

std::shared_ptr<DeleteCommand> EditSession::makeDelete(std::size_t position,
                                                       std::size_t length) {
  return std::make_shared<DeleteCommand>(buffer_, position, length);
}

std::shared_ptr<ReplaceCommand> EditSession::makeReplace(std::size_t position,
                                                         std::size_t length,
                                                         const std::string& newText) {
  return std::make_shared<ReplaceCommand>(buffer_, position, length, newText);
}

std::string serializeSessionState(const EditSession& session) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", "1.0", alloc);
  doc.AddMember("text",
                rapidjson::Value(session.text().c_str(),
                                 static_cast<rapidjson::SizeType>(session.text().size()),
                                 alloc),
                alloc);
  doc.AddMember("undoDepth",
                static_cast<std::uint64_t>(session.history().undoCount()), alloc);

  rapidjson::Value names(rapidjson::kArrayType);
  for (const auto& cmd : session.history().log()) {
    names.PushBack(rapidjson::StringRef(cmd->name()), alloc);
  }
  doc.AddMember("history", names, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace pk
