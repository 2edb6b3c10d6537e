// D3.1: HomeTheaterFacade: subsystem sequencing and state

#include "pk/theater/HomeTheaterFacade.hpp"
#include "pk/errors/RangeError.hpp"
#include "pk/debug/Trace.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  pk::ScopedTrace quiet(false);

  // ---- Test 1: watchMovie drives every component ----
  {
    pk::Amplifier amp; pk::DvdPlayer dvd; pk::Projector proj;
    pk::TheaterLights lights; pk::Screen screen; pk::PopcornPopper popper;
    pk::HomeTheaterFacade theater({amp, dvd, proj, lights, screen, popper});

    theater.watchMovie("The Matrix");
    requireTrue(popper.isOn() && popper.batches() == 1, "popper on and popped");
    requireTrue(lights.brightness() == 10, "lights dimmed to 10");
    requireTrue(screen.isDown(), "screen down");
    requireTrue(proj.isOn() && proj.wideScreen() && proj.input() == "DVD", "projector ready");
    requireTrue(amp.isOn() && amp.volume() == 5 && amp.surround(), "amp ready");
    requireTrue(dvd.isOn() && dvd.isPlaying() && dvd.movie() == "The Matrix", "dvd playing");
    std::printf("  Test 1 (watchMovie state): PASS\n");

    theater.endMovie();
    requireTrue(!popper.isOn(), "popper off");
    requireTrue(lights.brightness() == 100, "lights full");
    requireTrue(!screen.isDown(), "screen up");
    requireTrue(!proj.isOn() && !amp.isOn(), "projector and amp off");
    requireTrue(!dvd.isOn() && !dvd.isPlaying() && dvd.movie().empty(), "dvd off and ejected");
    std::printf("  Test 2 (endMovie state): PASS\n");

    theater.listenToRadio("101.5");
    requireTrue(amp.isOn() && amp.volume() == 3, "amp on at radio volume");
    requireTrue(lights.brightness() == 100, "lights on");
    requireTrue(!dvd.isOn(), "dvd untouched");
    std::printf("  Test 3 (listenToRadio state): PASS\n");
  }

  // ---- Test 4: narration order of watchMovie ----
  {
    std::FILE* tmp = std::tmpfile();
    requireTrue(tmp != nullptr, "tmpfile");
    {
      pk::ScopedTrace to(true, tmp);
      pk::Amplifier amp; pk::DvdPlayer dvd; pk::Projector proj;
      pk::TheaterLights lights; pk::Screen screen; pk::PopcornPopper popper;
      pk::HomeTheaterFacade theater({amp, dvd, proj, lights, screen, popper});
      theater.watchMovie("Alien");
    }
    const std::vector<std::string> expect = {
      "Popcorn Popper: Starting...",
      "Popcorn Popper: Popping corn!",
      "Theater Lights: Dimming to 10%",
      "Screen: Lowering screen",
      "Projector: Powering on...",
      "Projector: Setting widescreen mode (16:9)",
      "Projector: Setting input to DVD",
      "Amplifier: Powering on...",
      "Amplifier: Setting volume to 5",
      "Amplifier: Enabling 5.1 surround sound",
      "DVD Player: Powering on...",
      "DVD Player: Playing 'Alien'",
    };
    // component lines are "Name: action"; banners carry no ": "
    std::vector<std::string> got;
    std::rewind(tmp);
    char buf[256];
    while (std::fgets(buf, sizeof(buf), tmp)) {
      std::string s(buf);
      if (!s.empty() && s.back() == '\n') s.pop_back();
      if (s.find(": ") != std::string::npos) got.push_back(s);
    }
    std::fclose(tmp);
    requireTrue(got == expect, "watchMovie narration order");
    std::printf("  Test 4 (narration order): PASS\n");
  }

  // ---- Test 5: range checks ----
  {
    pk::Amplifier amp;
    bool threw = false;
    try { amp.setVolume(12); } catch (const pk::RangeError&) { threw = true; }
    requireTrue(threw, "volume above max throws");
    requireTrue(amp.volume() == 0, "volume unchanged");

    pk::TheaterLights lights;
    threw = false;
    try { lights.dim(-1); } catch (const pk::RangeError&) { threw = true; }
    requireTrue(threw, "negative dim throws");
    requireTrue(lights.brightness() == 100, "brightness unchanged");
    std::printf("  Test 5 (range checks): PASS\n");
  }

  std::printf("D3.1 home_theater: ALL PASS\n");
  return 0;
}
