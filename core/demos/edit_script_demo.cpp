// Runs a JSON edit script through EditProcessor.
// Usage: edit_script_demo [script.json] [config.json]
// Without a script, runs a built-in one.

#include "pk/commands/EditProcessor.hpp"
#include "pk/session/EditSession.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

static const char* kBuiltinScript = R"([
  {"cmd":"insert","text":"Hello"},
  {"cmd":"insert","text":" World!"},
  {"cmd":"replace","pos":0,"len":5,"text":"Greetings"},
  {"cmd":"batch","cmds":[
    {"cmd":"delete","pos":15,"len":1},
    {"cmd":"insert","text":"?","pos":15}
  ]},
  {"cmd":"undo"},
  {"cmd":"history"}
])";

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  std::string script = kBuiltinScript;
  if (argc > 1 && !readFile(argv[1], script)) {
    std::fprintf(stderr, "edit_script_demo: cannot read %s\n", argv[1]);
    return 1;
  }

  pk::EditSessionConfig cfg;
  if (argc > 2) {
    std::string cfgText;
    if (!readFile(argv[2], cfgText) || !pk::deserializeEditSessionConfig(cfgText, cfg)) {
      std::fprintf(stderr, "edit_script_demo: bad config %s\n", argv[2]);
      return 1;
    }
  }

  pk::EditSession session(cfg);
  pk::EditProcessor proc(session);

  auto r = proc.applyScriptText(script);
  if (!r.ok) {
    std::fprintf(stderr, "FAIL: code=%s msg=%s details=%s\n",
                 r.err.code.c_str(), r.err.message.c_str(), r.err.details.c_str());
    return 1;
  }

  std::printf("\n%s\n", proc.stateJson().c_str());
  return 0;
}
