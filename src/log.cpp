#include "strata/log.hpp"

#include "strata/error.hpp"

namespace strata::log {

auto null_sink() -> Sink {
  return [](Level, std::string_view) {};
}

auto parse_threshold(std::string_view text) -> std::optional<Level> {
  if (text == "debug")
    return Level::Debug;
  if (text == "info")
    return Level::Info;
  if (text == "warn")
    return Level::Warn;
  if (text == "quiet")
    return std::nullopt;
  throw Error(ErrorKind::MalformedMetadata, "unknown log level: " + std::string(text));
}

auto level_name(Level level) -> std::string_view {
  switch (level) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  }
  return "?";
}

} // namespace strata::log
