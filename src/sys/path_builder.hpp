// src/sys/path_builder.hpp
// Session files are filed by local calendar date:
//
//   <base>/2026/10-October/19/session_101500.mid
//
// One file per session start; a second session starting in the same second
// gets a "_2", "_3"... counter instead of overwriting. A tag such as
// "-bookmark" follows the counter: session_101500_2-bookmark.mid.

#pragma once
#include <filesystem>
#include <string>

#include "capture/collaborators.hpp"

namespace sys {

class CalendarPathBuilder : public capture::PathBuilder {
public:
  explicit CalendarPathBuilder(std::filesystem::path base);

  std::filesystem::path session_path(capture::WallTime start,
                                     const std::string &suffix) override;

private:
  std::filesystem::path base_;
};

} // namespace sys
