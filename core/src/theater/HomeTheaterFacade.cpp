#include "pk/theater/HomeTheaterFacade.hpp"
#include "pk/debug/Trace.hpp"

namespace pk {

static void banner(const std::string& title) {
  trace("\n========================================\n");
  trace("%s\n", title.c_str());
  trace("========================================\n\n");
}

void HomeTheaterFacade::watchMovie(const std::string& movie) {
  banner("Get ready to watch '" + movie + "'...");

  p_.popper.on();
  p_.popper.pop();
  p_.lights.dim(kMovieLightLevel);
  p_.screen.down();
  p_.projector.on();
  p_.projector.wideScreenMode();
  p_.projector.setInput("DVD");
  p_.amp.on();
  p_.amp.setVolume(kMovieVolume);
  p_.amp.setSurroundSound();
  p_.dvd.on();
  p_.dvd.play(movie);

  trace("\n... Movie is now playing! Enjoy! ...\n\n");
}

void HomeTheaterFacade::endMovie() {
  banner("Shutting down movie theater...");

  p_.popper.off();
  p_.lights.on();
  p_.screen.up();
  p_.projector.off();
  p_.amp.off();
  p_.dvd.stop();
  p_.dvd.eject();
  p_.dvd.off();

  trace("\n... Theater shut down complete! ...\n\n");
}

void HomeTheaterFacade::listenToRadio(const std::string& station) {
  banner("Tuning to radio station " + station + "...");

  p_.lights.on();
  p_.amp.on();
  p_.amp.setVolume(kRadioVolume);
  trace("Radio: Tuned to %s FM\n", station.c_str());

  trace("\n... Radio is playing! ...\n\n");
}

} // namespace pk
