#pragma once
#include "pk/theater/Components.hpp"

#include <string>

namespace pk {

struct HomeTheaterParts {
  Amplifier& amp;
  DvdPlayer& dvd;
  Projector& projector;
  TheaterLights& lights;
  Screen& screen;
  PopcornPopper& popper;
};

// One-call entry points over the six theater components.
// Components are not owned and must outlive the facade.
class HomeTheaterFacade {
public:
  explicit HomeTheaterFacade(const HomeTheaterParts& parts) : p_(parts) {}

  void watchMovie(const std::string& movie);
  void endMovie();
  void listenToRadio(const std::string& station);

  static constexpr int kMovieLightLevel = 10;
  static constexpr int kMovieVolume = 5;
  static constexpr int kRadioVolume = 3;

private:
  HomeTheaterParts p_;
};

} // namespace pk
