/*─────────────────────────────────────────────────────────────
  File: src/logger.cpp

  Minimal console + file logger.

  Features:
    - Writes to stdout (unless echo is off) and optionally to a log file
    - Thread-safe: write() is protected by a mutex
    - ANSI color tags for interactive terminals only
        * INFO  -> green background
        * WARN  -> yellow background
        * ERROR -> red background
      When stdout is not a TTY the logger falls back to plain tags.
    - Counts WARN / ERROR lines so the CLI can print a final summary

  Notes:
    - Color detection uses isatty(fileno(stdout)) from unistd.h.
    - File logs always use plain tags (no escape codes).
─────────────────────────────────────────────────────────────*/
#include "logger.hpp"
#include <cstdio>            // fileno
#include <unistd.h>          // isatty

namespace lplan {

/*=====================================================================
  ANSI formatting constants (terminal output only)
=====================================================================*/
#define BG_GRN  "\033[102m"
#define BG_YEL  "\033[103m"
#define BG_RED  "\033[101m"
#define RESET   "\033[0m"

static const char* bare_tag(Logger::Level l)      // plain for file log
{
    switch (l) {
        case Logger::Level::INFO: return "INFO";
        case Logger::Level::WARN: return "WARN";
        case Logger::Level::ERR : return "ERROR";
    }
    return "UNKWN";
}

const char* Logger::level_tag(Level l)
{
    /* color only if writing to an interactive terminal         */
    if (!isatty(fileno(stdout))) return bare_tag(l);

    switch (l) {
        case Level::INFO: return BG_GRN "INFO" RESET;
        case Level::WARN: return BG_YEL "WARN" RESET;
        case Level::ERR : return BG_RED "ERROR" RESET;
    }
    return "UNKWN";
}

/*=====================================================================
  Logger lifecycle

  The file is opened in truncation mode (fresh log per run). A path
  that cannot be opened leaves the logger console-only.
=====================================================================*/
Logger::Logger(const std::string& p)
{
    if (!p.empty())
        file_.open(p, std::ios::trunc);
}

Logger::~Logger(){ if (file_.is_open()) file_.close(); }

void Logger::set_echo(bool on)
{
    std::lock_guard<std::mutex> g(mtx_);
    echo_ = on;
}

std::size_t Logger::warnings() const
{
    std::lock_guard<std::mutex> g(mtx_);
    return warnings_;
}

std::size_t Logger::errors() const
{
    std::lock_guard<std::mutex> g(mtx_);
    return errors_;
}

/*=====================================================================
  Logger::write

  Formatting:
    "<TAG>  <message>\n"
=====================================================================*/
void Logger::write(Level lvl, const std::string& msg)
{
    std::lock_guard<std::mutex> g(mtx_);
    if (lvl == Level::WARN) ++warnings_;
    if (lvl == Level::ERR)  ++errors_;

    if (echo_) {
        std::string line = std::string(level_tag(lvl)) + "  " + msg + '\n';
        std::cout << line << std::flush;     // colorised
    }
    if (file_.is_open()) file_ << bare_tag(lvl) << "  " << msg << '\n';
}

} // namespace lplan
