// D2.2: EditSession: config parsing, factories, state JSON

#include "pk/session/EditSession.hpp"
#include "pk/debug/Trace.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  pk::ScopedTrace quiet(false);

  // ---- Test 1: config parsing ----
  {
    pk::EditSessionConfig cfg;
    requireTrue(cfg.initialText.empty() && cfg.narrate, "defaults");

    requireTrue(pk::deserializeEditSessionConfig(
                  R"({"initialText":"Hello World!","narrate":false})", cfg),
                "parse full config");
    requireTrue(cfg.initialText == "Hello World!", "initialText");
    requireTrue(!cfg.narrate, "narrate false");

    pk::EditSessionConfig partial;
    requireTrue(pk::deserializeEditSessionConfig(R"({"initialText":"x"})", partial),
                "parse partial config");
    requireTrue(partial.narrate, "missing key keeps default");

    pk::EditSessionConfig bad;
    requireTrue(!pk::deserializeEditSessionConfig("{oops", bad), "parse error");
    requireTrue(!pk::deserializeEditSessionConfig("[1,2]", bad), "non-object root");
    requireTrue(bad.initialText.empty(), "failed parse leaves defaults");
    std::printf("  Test 1 (config): PASS\n");
  }

  // ---- Test 2: session from config, replace scenario ----
  {
    pk::EditSessionConfig cfg;
    cfg.initialText = "Hello World!";
    cfg.narrate = false;
    pk::EditSession session(cfg);
    requireTrue(session.text() == "Hello World!", "initial text");

    session.execute(session.makeReplace(0, 5, "Greetings"));
    requireTrue(session.text() == "Greetings World!", "replace");
    requireTrue(session.undo(), "undo");
    requireTrue(session.text() == "Hello World!", "restored exactly");
    std::printf("  Test 2 (session replace scenario): PASS\n");
  }

  // ---- Test 3: factories bind to the session buffer ----
  {
    pk::EditSession session;
    auto a = session.makeInsert("Hello");
    requireTrue(&a->buffer() == &session.buffer(), "bound to session buffer");
    session.execute(a);
    session.execute(session.makeInsert(", ", 5));
    session.execute(session.makeInsert("World"));
    requireTrue(session.text() == "Hello, World", "factory inserts");
    session.execute(session.makeDelete(5, 1));
    requireTrue(session.text() == "Hello World", "factory delete");

    session.executeBatch({session.makeInsert("!"), session.makeReplace(0, 1, "J")});
    requireTrue(session.text() == "Jello World!", "batch of mixed kinds");

    auto lines = session.showHistory();
    requireTrue(lines.size() == 6, "6 logged");
    requireTrue(lines[5] == "6. Replace", "last is Replace");
    std::printf("  Test 3 (factories): PASS\n");
  }

  // ---- Test 4: state JSON ----
  {
    pk::EditSession session;
    session.execute(session.makeInsert("Hi \"there\""));
    session.execute(session.makeDelete(0, 1));
    session.undo();

    rapidjson::Document doc;
    doc.Parse(pk::serializeSessionState(session).c_str());
    requireTrue(!doc.HasParseError() && doc.IsObject(), "valid JSON");
    requireTrue(std::string(doc["version"].GetString()) == "1.0", "version");
    requireTrue(std::string(doc["text"].GetString()) == "Hi \"there\"", "text escaped");
    requireTrue(doc["undoDepth"].GetUint64() == 1, "undoDepth");
    requireTrue(doc["history"].IsArray() && doc["history"].Size() == 2, "history size");
    requireTrue(std::string(doc["history"][1].GetString()) == "Delete", "history names");
    std::printf("  Test 4 (state JSON): PASS\n");
  }

  // ---- Test 5: a session's narrate setting ends with the session ----
  {
    requireTrue(!pk::traceConfig().enabled, "quiet before session");
    {
      pk::EditSessionConfig cfg;  // narrate defaults to true
      pk::EditSession session(cfg);
      requireTrue(pk::traceConfig().enabled, "narrating while session lives");
    }
    requireTrue(!pk::traceConfig().enabled, "quiet again after session ends");

    {
      pk::ScopedTrace loud(true);
      {
        pk::EditSessionConfig cfg;
        cfg.narrate = false;
        pk::EditSession session(cfg);
        requireTrue(!pk::traceConfig().enabled, "silenced while session lives");
      }
      requireTrue(pk::traceConfig().enabled, "caller's narration restored");

      pk::EditSession plain;
      requireTrue(pk::traceConfig().enabled, "default session leaves setting alone");
    }
    requireTrue(!pk::traceConfig().enabled, "outer quiet scope intact");
    std::printf("  Test 5 (session-scoped narration): PASS\n");
  }

  std::printf("D2.2 session_state: ALL PASS\n");
  return 0;
}
