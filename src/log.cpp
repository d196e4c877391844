// -----------------------------------------------------------------------------
// log.cpp: line logger.
// -----------------------------------------------------------------------------
#include "lorabroker/log.hpp"

#include <ostream>
#include <utility>

namespace lorabroker {

bool parse_log_level(const std::string& s, LogLevel& out) {
    if      (s == "debug") out = LogLevel::Debug;
    else if (s == "info")  out = LogLevel::Info;
    else if (s == "warn")  out = LogLevel::Warn;
    else if (s == "error") out = LogLevel::Error;
    else if (s == "off")   out = LogLevel::Off;
    else return false;
    return true;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

// Fixed-width label so columns line up in a terminal.
static const char* label(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Info:  return "[INFO ] ";
        case LogLevel::Warn:  return "[WARN ] ";
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Off:   break;
    }
    return "[?????] ";
}

Logger::Logger(std::ostream& out, LogLevel min, std::string tag)
: sink_(std::make_shared<Sink>()),
  min_(std::make_shared<Level>(min)),
  tag_(std::move(tag)) {
  sink_->out = &out;
}

Logger::Logger(std::shared_ptr<Sink> sink, std::shared_ptr<Level> min, std::string tag)
: sink_(std::move(sink)), min_(std::move(min)), tag_(std::move(tag)) {}

Logger Logger::with_tag(const std::string& tag) const {
    return Logger(sink_, min_, tag);
}

void Logger::log(LogLevel lvl, const std::string& msg) const {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(sink_->mu);
    *sink_->out << label(lvl) << tag_ << ": " << msg << '\n';
    sink_->out->flush();
}

} // namespace lorabroker
