#include "pk/theater/Components.hpp"
#include "pk/debug/Trace.hpp"
#include "pk/errors/RangeError.hpp"

namespace pk {

// ---- Amplifier ----

void Amplifier::on() {
  on_ = true;
  trace("Amplifier: Powering on...\n");
}

void Amplifier::off() {
  on_ = false;
  trace("Amplifier: Shutting down...\n");
}

void Amplifier::setVolume(int level) {
  if (level < 0 || level > kMaxVolume) {
    throw RangeError("Amplifier::setVolume: level " + std::to_string(level) +
                     " outside [0, " + std::to_string(kMaxVolume) + "]");
  }
  volume_ = level;
  trace("Amplifier: Setting volume to %d\n", level);
}

void Amplifier::setSurroundSound() {
  surround_ = true;
  trace("Amplifier: Enabling 5.1 surround sound\n");
}

// ---- DvdPlayer ----

void DvdPlayer::on() {
  on_ = true;
  trace("DVD Player: Powering on...\n");
}

void DvdPlayer::off() {
  on_ = false;
  playing_ = false;
  trace("DVD Player: Shutting down...\n");
}

void DvdPlayer::play(const std::string& movie) {
  movie_ = movie;
  playing_ = true;
  trace("DVD Player: Playing '%s'\n", movie.c_str());
}

void DvdPlayer::stop() {
  playing_ = false;
  trace("DVD Player: Stopping playback\n");
}

void DvdPlayer::eject() {
  movie_.clear();
  trace("DVD Player: Ejecting disc\n");
}

// ---- Projector ----

void Projector::on() {
  on_ = true;
  trace("Projector: Powering on...\n");
}

void Projector::off() {
  on_ = false;
  trace("Projector: Shutting down...\n");
}

void Projector::setInput(const std::string& source) {
  input_ = source;
  trace("Projector: Setting input to %s\n", source.c_str());
}

void Projector::wideScreenMode() {
  wideScreen_ = true;
  trace("Projector: Setting widescreen mode (16:9)\n");
}

// ---- TheaterLights ----

void TheaterLights::dim(int level) {
  if (level < 0 || level > 100) {
    throw RangeError("TheaterLights::dim: level " + std::to_string(level) +
                     " outside [0, 100]");
  }
  brightness_ = level;
  trace("Theater Lights: Dimming to %d%%\n", level);
}

void TheaterLights::on() {
  brightness_ = 100;
  trace("Theater Lights: Turning on to full brightness\n");
}

// ---- Screen ----

void Screen::down() {
  down_ = true;
  trace("Screen: Lowering screen\n");
}

void Screen::up() {
  down_ = false;
  trace("Screen: Raising screen\n");
}

// ---- PopcornPopper ----

void PopcornPopper::on() {
  on_ = true;
  trace("Popcorn Popper: Starting...\n");
}

void PopcornPopper::off() {
  on_ = false;
  trace("Popcorn Popper: Shutting off\n");
}

void PopcornPopper::pop() {
  ++batches_;
  trace("Popcorn Popper: Popping corn!\n");
}

} // namespace pk
