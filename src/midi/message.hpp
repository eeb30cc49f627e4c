// src/midi/message.hpp
// Decoding raw wire bytes into midi::Message, plus small constructors used by
// the tests and the shortcut code.
//
// Contract:
//  - decode_message(bytes): classifies one complete message. A Note On with
//    velocity 0 is kept as MsgKind::NoteOn; it is not folded into NoteOff.
//    Throws std::runtime_error if bytes is empty or does not start with a
//    status byte.
//  - is_storable(msg): true if the message has an SMF track representation
//    (channel voice messages and SysEx). Other system messages do not.

#pragma once
#include "midi/events.hpp"

#include <cstdint>
#include <vector>

namespace midi {

Message decode_message(std::vector<std::uint8_t> bytes);

// Number of data bytes that follow a channel status (1 or 2), 0 otherwise.
int channel_data_length(std::uint8_t status);

bool is_storable(const Message &msg);

Message note_on(std::uint8_t ch, std::uint8_t note, std::uint8_t vel);
Message note_off(std::uint8_t ch, std::uint8_t note, std::uint8_t vel = 0);
Message control_change(std::uint8_t ch, std::uint8_t number,
                       std::uint8_t value);
Message program_change(std::uint8_t ch, std::uint8_t program);
Message timing_clock();
Message active_sensing();

} // namespace midi
