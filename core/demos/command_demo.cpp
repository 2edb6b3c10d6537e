// Command pattern walkthrough: text edits as objects with undo,
// batch execution, macro (replace) commands and a permanent history log.

#include "pk/session/EditSession.hpp"
#include "pk/debug/Trace.hpp"

#include <cstdio>
#include <string>

static void rule() {
  std::printf("%s\n", std::string(70, '=').c_str());
}

int main() {
  rule();
  std::printf("COMMAND PATTERN DEMONSTRATION - Text Editor\n");
  rule();

  pk::EditSession session;

  std::printf("\n### SCENARIO 1: Basic Commands ###\n");
  session.execute(session.makeInsert("Hello"));
  session.execute(session.makeInsert(" World"));
  session.execute(session.makeInsert("!"));

  std::printf("\n### SCENARIO 2: Undo Operations ###\n");
  session.undo(); // "!"
  session.undo(); // " World"

  std::printf("\n### SCENARIO 3: Macro Command (Replace) ###\n");
  session.execute(session.makeReplace(0, 5, "Greetings"));

  std::printf("\n### SCENARIO 4: Batch Execution (Queue) ###\n");
  // All three are built before the batch runs, so they share one position.
  session.executeBatch({
    session.makeInsert(" to"),
    session.makeInsert(" all"),
    session.makeInsert("!")
  });

  std::printf("\n### SCENARIO 5: Multiple Undos ###\n");
  session.undo();
  session.undo();

  std::printf("\n### SCENARIO 6: Command History ###\n");
  session.showHistory();

  std::printf("\n### Final State ###\n");
  session.buffer().show();

  std::printf("\n");
  rule();
  std::printf("KEY CONCEPTS DEMONSTRATED:\n");
  rule();
  std::printf("1. Commands as objects (encapsulation)\n");
  std::printf("2. Separation of invoker and receiver\n");
  std::printf("3. Undo capability\n");
  std::printf("4. Command history/logging\n");
  std::printf("5. Command queuing (batch execution)\n");
  std::printf("6. Macro commands (composite)\n");
  rule();
  return 0;
}
