// src/sys/rtmidi_source.hpp
// The hardware side of the recorder: MIDI input ports through RtMidi.
//
// Each open() creates its own RtMidiIn with a callback that stamps the
// message with steady_clock::now() the moment RtMidi hands it over, decodes
// it and passes it on. Clock / active sensing / SysEx are not filtered here;
// the engine decides what to ignore.

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "capture/collaborators.hpp"

class RtMidiIn;

namespace sys {

class RtMidiSource : public capture::EventSource {
public:
  RtMidiSource();
  ~RtMidiSource() override;

  std::vector<std::string> list() override;
  std::unique_ptr<capture::InputPort> open(const std::string &name,
                                           Callback callback) override;

  // Backend name, e.g. "ALSA", for the startup log.
  [[nodiscard]] std::string api_name() const;

private:
  std::unique_ptr<RtMidiIn> lister_; // enumerates ports, never opened
};

} // namespace sys
