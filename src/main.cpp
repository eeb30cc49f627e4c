// src/main.cpp
// midi-recorder: always-on capture of whatever is played on the keyboard.
// Wires the pieces together and runs the control loop on the main thread:
//   RtMidi callback --> IngestionQueue --> ControlLoop/Engine --> .mid files
//   PortMonitor thread keeps the input port open across unplug/replug.
//
// SIGINT/SIGTERM are blocked everywhere and collected by a small sigwait
// thread that raises the stop flag and wakes the loop, so a shutdown never
// waits out a long low-power sleep.

#include <atomic>
#include <exception>
#include <iostream>

#include "app/cli.hpp"
#include "app/config.hpp"
#include "app/signals.hpp"
#include "capture/control_loop.hpp"
#include "capture/engine.hpp"
#include "capture/port_monitor.hpp"
#include "capture/queue.hpp"
#include "capture/session.hpp"
#include "common/log.hpp"
#include "sys/notify.hpp"
#include "sys/path_builder.hpp"
#include "sys/power.hpp"
#include "sys/rtmidi_source.hpp"

namespace {

int list_ports(sys::RtMidiSource &source) {
  const auto names = source.list();
  std::cout << "MIDI inputs (" << source.api_name() << "):\n";
  if (names.empty()) {
    std::cout << "  (none)\n";
  }
  for (std::size_t i = 0; i < names.size(); ++i) {
    std::cout << "  " << i << ": " << names[i] << "\n";
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  app::RecorderConfig cfg;
  try {
    cfg = app::parse_recorder_cli(argc, argv);
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 2;
  }

  try {
    app::SignalWatcher::block_signals();
    blog::configure(cfg.logFile, cfg.verbose);

    sys::RtMidiSource source;
    if (cfg.listPorts) {
      return list_ports(source);
    }

    blog::app("Starting MIDI recorder");
    blog::app("Recordings go to {}", cfg.baseDir.string());
    blog::app("MIDI API: {}", source.api_name());
    blog::app("Shortcuts: note {} ends a session, note {} ends and bookmarks",
              int(cfg.lowNote), int(cfg.highNote));

    capture::IngestionQueue queue;
    sys::CalendarPathBuilder paths(cfg.baseDir);
    sys::GovernorPowerControl power(cfg.powerControl);
    sys::SystemdNotifier notifier;
    capture::SessionWriter writer(paths, cfg.ticksPerBeat, cfg.usPerBeat);
    capture::Engine engine(app::engine_config(cfg), queue, writer, power,
                           capture::Clock::now());
    capture::ControlLoop loop(engine, queue, notifier, app::loop_timing(cfg));
    capture::PortMonitor monitor(source, queue, cfg.portMatch,
                                 app::port_timing(cfg));

    std::atomic<bool> stop{false};
    app::SignalWatcher signals(stop, queue);

    monitor.start();
    notifier.ready();
    loop.run(stop);
    monitor.stop();

    blog::app("MIDI recorder stopped");
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
