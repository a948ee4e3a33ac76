// log.hpp - tagged diagnostic lines on stderr
#pragma once

#include <string>

namespace lanejump {

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

// While held, lines are buffered instead of written, so they don't land on
// top of the playfield. Releasing the hold flushes them.
void log_hold(bool hold);
void log_flush();

} // namespace lanejump
