#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include "AudioOutput.hpp"
#include "Note.hpp"
#include "Voice.hpp"

struct PlayerConfig {
  double mixGain = 0.2;                  // applied to the sum of all notes
  // Clamps the mixed sample to [-|limit|, +|limit|]; negative peaks are cut as well as positive ones.
  std::optional<double> amplitudeLimit;
  size_t reserveNotes = 64;              // initial note capacity
  uint32_t randomSeed = 0;               // noise seed for the render thread; 0 keeps it random
};

// Mixing engine. Owns the note collection shared between the render thread
// (render()) and control threads (add/remove/count). One mutex guards the
// whole collection; every critical section is a short scan/insert/update.
class Player {
public:
  // Installs render() as the output's callback and starts it. Throws AudioError
  // if the output cannot start.
  explicit Player(AudioOutput& output, PlayerConfig config = {});
  ~Player();

  Player(const Player&) = delete;
  Player& operator=(const Player&) = delete;

  void addNote(const Voice& voice);
  void addNotes(const std::vector<Voice>& voices);
  void removeNote(const Voice& voice);
  void removeNotes(const std::vector<Voice>& voices);

  size_t simultaneousNoteCount() const;
  double time() const { return output_.time(); }
  const PlayerConfig& config() const { return config_; }

  // Per-frame mix. Runs on the render thread, which the first call seeds from config().randomSeed.
  double render(double time) noexcept;

private:
  void insertNotes(std::vector<Note>& fresh);
  void releaseLocked(const Voice& voice, double now);

  AudioOutput& output_;
  PlayerConfig config_;
  mutable std::mutex mutex_;
  std::vector<Note> notes_;
  bool renderSeeded_ = false; // render thread only
};
