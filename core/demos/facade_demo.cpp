// Facade pattern walkthrough: one call drives a six-part home theater.

#include "pk/theater/HomeTheaterFacade.hpp"

#include <cstdio>
#include <string>

static void rule() {
  std::printf("%s\n", std::string(60, '=').c_str());
}

static void section(const char* title) {
  std::printf("\n");
  rule();
  std::printf("%s\n", title);
  rule();
}

int main() {
  rule();
  std::printf("FACADE PATTERN DEMONSTRATION - Home Theater System\n");
  rule();

  std::printf("\n--- Creating Complex Subsystem Components ---\n\n");
  pk::Amplifier amp;
  pk::DvdPlayer dvd;
  pk::Projector projector;
  pk::TheaterLights lights;
  pk::Screen screen;
  pk::PopcornPopper popper;

  std::printf("--- Creating Facade ---\n\n");
  pk::HomeTheaterFacade theater({amp, dvd, projector, lights, screen, popper});

  theater.watchMovie("The Matrix");

  section("INTERMISSION - Theater is running...");
  theater.endMovie();

  section("BONUS FEATURE - Radio Mode");
  theater.listenToRadio("101.5");

  section("DEMONSTRATION COMPLETE");

  std::printf("\n\nKEY BENEFITS OF FACADE PATTERN:\n");
  std::printf("- Simplified interface (1 method vs 12+ calls)\n");
  std::printf("- Hides subsystem complexity from client\n");
  std::printf("- Loose coupling between client and subsystems\n");
  std::printf("- Easy to use and understand\n");
  std::printf("- Client doesn't need to know internal details\n");
  return 0;
}
