#pragma once
#include "pk/errors/RangeError.hpp"

#include <string>

namespace pk {

// Home theater subsystem. Each operation updates observable state and
// traces one line of narration.

class Amplifier {
public:
  static constexpr int kMaxVolume = 11;

  void on();
  void off();
  // Throws RangeError outside [0, kMaxVolume].
  void setVolume(int level);
  void setSurroundSound();

  bool isOn() const { return on_; }
  int volume() const { return volume_; }
  bool surround() const { return surround_; }

private:
  bool on_{false};
  int volume_{0};
  bool surround_{false};
};

class DvdPlayer {
public:
  void on();
  void off();
  void play(const std::string& movie);
  void stop();
  void eject();

  bool isOn() const { return on_; }
  bool isPlaying() const { return playing_; }
  const std::string& movie() const { return movie_; }

private:
  bool on_{false};
  bool playing_{false};
  std::string movie_;
};

class Projector {
public:
  void on();
  void off();
  void setInput(const std::string& source);
  void wideScreenMode();

  bool isOn() const { return on_; }
  const std::string& input() const { return input_; }
  bool wideScreen() const { return wideScreen_; }

private:
  bool on_{false};
  std::string input_;
  bool wideScreen_{false};
};

class TheaterLights {
public:
  // Throws RangeError outside [0, 100].
  void dim(int level);
  void on();

  int brightness() const { return brightness_; }

private:
  int brightness_{100};
};

class Screen {
public:
  void down();
  void up();

  bool isDown() const { return down_; }

private:
  bool down_{false};
};

class PopcornPopper {
public:
  void on();
  void off();
  void pop();

  bool isOn() const { return on_; }
  int batches() const { return batches_; }

private:
  bool on_{false};
  int batches_{0};
};

} // namespace pk
