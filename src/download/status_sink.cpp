#include "download/status_sink.hpp"

#include "download/progress_sinks.hpp"

#include <unistd.h>

namespace ipswdl {

namespace {

const char* AnsiFor(StatusTone tone) {
    switch (tone) {
        case StatusTone::Plain:    return "";
        case StatusTone::Notice:   return "\033[36m";
        case StatusTone::Muted:    return "\033[2m";
        case StatusTone::Emphasis: return "\033[1m";
        case StatusTone::Success:  return "\033[32m";
        case StatusTone::Failure:  return "\033[31m";
        case StatusTone::Removed:  return "\033[2;35m";
    }
    return "";
}

} // namespace

ConsoleStatusSink::ConsoleStatusSink(std::FILE* out)
    : out_(out), color_(out && ::isatty(::fileno(out)) == 1) {}

void ConsoleStatusSink::Emit(StatusTone tone, const std::string& line) {
    ClearProgressLine();

    const char* ansi = color_ ? AnsiFor(tone) : "";
    if (ansi[0] != '\0') {
        std::fprintf(out_, "%s%s\033[0m\n", ansi, line.c_str());
    } else {
        std::fprintf(out_, "%s\n", line.c_str());
    }
    std::fflush(out_);
}

} // namespace ipswdl
