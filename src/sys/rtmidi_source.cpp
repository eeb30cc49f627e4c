// src/sys/rtmidi_source.cpp

#include "sys/rtmidi_source.hpp"
#include "common/log.hpp"
#include "midi/message.hpp"

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "RtMidi.h"

namespace {

class RtMidiPort : public capture::InputPort {
public:
  RtMidiPort(std::string name, capture::EventSource::Callback callback)
      : name_(std::move(name)), callback_(std::move(callback)),
        in_(std::make_unique<RtMidiIn>()) {}

  ~RtMidiPort() override { close(); }

  // Throws RtMidiError or std::runtime_error.
  void open() {
    const unsigned count = in_->getPortCount();
    for (unsigned i = 0; i < count; ++i) {
      if (in_->getPortName(i) != name_) {
        continue;
      }
      // SysEx, timing and active sensing all pass through
      in_->ignoreTypes(false, false, false);
      in_->setCallback(&RtMidiPort::on_midi_data, this);
      in_->openPort(i, "midi-recorder input");
      return;
    }
    throw std::runtime_error("MIDI port disappeared before opening: " + name_);
  }

  const std::string &name() const override { return name_; }

  void close() override {
    if (!in_) {
      return;
    }
    try {
      in_->cancelCallback();
      if (in_->isPortOpen()) {
        in_->closePort();
      }
    } catch (const RtMidiError &error) {
      blog::error::port("RtMidi could not close {} ({})", name_,
                        error.getMessage());
    }
    in_.reset();
  }

private:
  static void on_midi_data(double /*deltaSeconds*/,
                           std::vector<unsigned char> *message,
                           void *userData) {
    const auto arrival = capture::Clock::now();
    auto *self = static_cast<RtMidiPort *>(userData);
    if (message == nullptr || message->empty()) {
      return;
    }
    try {
      self->callback_(capture::RawEvent{
          midi::decode_message(
              std::vector<std::uint8_t>(message->begin(), message->end())),
          arrival});
    } catch (const std::exception &e) {
      // a stray data byte; nothing sensible to queue
      blog::debug::port("dropped undecodable message: {}", e.what());
    }
  }

  std::string name_;
  capture::EventSource::Callback callback_;
  std::unique_ptr<RtMidiIn> in_;
};

} // namespace

namespace sys {

RtMidiSource::RtMidiSource() : lister_(std::make_unique<RtMidiIn>()) {}

RtMidiSource::~RtMidiSource() = default;

std::vector<std::string> RtMidiSource::list() {
  std::vector<std::string> names;
  const unsigned count = lister_->getPortCount();
  names.reserve(count);
  for (unsigned i = 0; i < count; ++i) {
    names.push_back(lister_->getPortName(i));
  }
  return names;
}

std::unique_ptr<capture::InputPort>
RtMidiSource::open(const std::string &name, Callback callback) {
  auto port = std::make_unique<RtMidiPort>(name, std::move(callback));
  port->open();
  return port;
}

std::string RtMidiSource::api_name() const {
  return RtMidi::getApiDisplayName(lister_->getCurrentApi());
}

} // namespace sys
