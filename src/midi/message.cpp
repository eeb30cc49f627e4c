// src/midi/message.cpp
// Classification of raw MIDI 1.0 messages.

#include "midi/message.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace midi {

int channel_data_length(std::uint8_t status) {
  switch (status & 0xF0) {
  case 0x80: // Note Off
  case 0x90: // Note On
  case 0xA0: // Poly Aftertouch
  case 0xB0: // Control Change
  case 0xE0: // Pitch Bend
    return 2;
  case 0xC0: // Program Change
  case 0xD0: // Channel Pressure
    return 1;
  default:
    return 0;
  }
}

Message decode_message(std::vector<std::uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::runtime_error("Empty MIDI message");
  }
  const std::uint8_t status = bytes.front();
  if ((status & 0x80) == 0) {
    std::ostringstream oss;
    oss << "MIDI message starts with data byte 0x" << std::hex << int(status);
    throw std::runtime_error(oss.str());
  }

  Message msg;
  const std::uint8_t type = status & 0xF0;

  if ((type == 0x90 || type == 0x80) && bytes.size() >= 3) {
    msg.kind = type == 0x90 ? MsgKind::NoteOn : MsgKind::NoteOff;
    msg.note = static_cast<std::uint8_t>(bytes[1] & 0x7F);
    msg.velocity = static_cast<std::uint8_t>(bytes[2] & 0x7F);
  } else if (type == 0xB0 && bytes.size() >= 3) {
    msg.kind = MsgKind::ControlChange;
  } else if (status == 0xF8) {
    msg.kind = MsgKind::Clock;
  } else if (status == 0xFE) {
    msg.kind = MsgKind::ActiveSensing;
  } else {
    msg.kind = MsgKind::Other;
  }

  msg.bytes = std::move(bytes);
  return msg;
}

bool is_storable(const Message &msg) {
  const std::uint8_t status = msg.status();
  if (status == 0xF0) {
    return msg.bytes.size() >= 2; // SysEx with at least one payload byte
  }
  const int len = channel_data_length(status);
  return len > 0 && msg.bytes.size() >= static_cast<std::size_t>(len) + 1;
}

Message note_on(std::uint8_t ch, std::uint8_t note, std::uint8_t vel) {
  return decode_message({static_cast<std::uint8_t>(0x90 | (ch & 0x0F)),
                         static_cast<std::uint8_t>(note & 0x7F),
                         static_cast<std::uint8_t>(vel & 0x7F)});
}

Message note_off(std::uint8_t ch, std::uint8_t note, std::uint8_t vel) {
  return decode_message({static_cast<std::uint8_t>(0x80 | (ch & 0x0F)),
                         static_cast<std::uint8_t>(note & 0x7F),
                         static_cast<std::uint8_t>(vel & 0x7F)});
}

Message control_change(std::uint8_t ch, std::uint8_t number,
                       std::uint8_t value) {
  return decode_message({static_cast<std::uint8_t>(0xB0 | (ch & 0x0F)),
                         static_cast<std::uint8_t>(number & 0x7F),
                         static_cast<std::uint8_t>(value & 0x7F)});
}

Message program_change(std::uint8_t ch, std::uint8_t program) {
  return decode_message({static_cast<std::uint8_t>(0xC0 | (ch & 0x0F)),
                         static_cast<std::uint8_t>(program & 0x7F)});
}

Message timing_clock() { return decode_message({0xF8}); }

Message active_sensing() { return decode_message({0xFE}); }

} // namespace midi
