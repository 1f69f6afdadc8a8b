/*─────────────────────────────────────────────────────────────
  File: include/logger.hpp

  Logger: small thread-safe logging utility.

  This class is used in:
    - lora_plan_main.cpp (CLI orchestration + fatal error reporting)
    - feasibility.cpp (per-pair link decisions)
    - tree_builder.cpp (attachments + unreachable-node warnings)
    - frequency.cpp (pool exhaustion reporting)
    - planner.cpp (stage banners + network statistics)

  Output behavior:
    - Writes a formatted line to stdout (unless echo is disabled)
    - Writes a plain (non-ANSI) line to a log file, when one is open
    - Guards both outputs with a mutex to prevent interleaving

  Notes:
    - Logger is intended to be a process-level utility object
      (constructed once per tool, passed by reference into each stage)
    - Tests construct a console-only Logger and turn echo off
─────────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>    // std::size_t
#include <fstream>    // std::ofstream (file output stream)
#include <iostream>   // std::cout (console output stream)
#include <mutex>      // std::mutex, std::lock_guard (thread synchronization)
#include <string>     // std::string (message storage/formatting)

namespace lplan {

class Logger
{
public:
    /*------------------------------------------------------------------
      Level: severity enum for log messages.

      Values:
        - INFO : normal status/progress messages
        - WARN : recoverable issues (unreachable nodes, skipped
                 downlinks); partial coverage is an expected outcome
        - ERR  : errors; used in catch blocks and fatal paths
    ------------------------------------------------------------------*/
    enum class Level { INFO, WARN, ERR };

    /*------------------------------------------------------------------
      Console-only Logger. No file is opened.
    ------------------------------------------------------------------*/
    Logger() = default;

    /*------------------------------------------------------------------
      Construct a Logger that also writes to a file path.

      Parameter:
        logfile_path : filesystem path (UTF-8 string); an empty path
                       gives a console-only logger

      Effects:
        - Opens/truncates the log file (fresh log per planning run)
        - Destructor closes the file if open
    ------------------------------------------------------------------*/
    explicit Logger(const std::string& logfile_path);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /*------------------------------------------------------------------
      write: thread-safe logging to stdout and the log file.

      Parameters:
        level : Logger::Level
        msg   : message text (already formatted by caller)

      Output formatting (see src/logger.cpp):
        - stdout: may include ANSI color codes if stdout is a TTY
        - file  : always plain tags (INFO/WARN/ERROR)

      WARN and ERR lines are counted even when echo is off.
    ------------------------------------------------------------------*/
    void write(Level level, const std::string& msg);

    void info (const std::string& m) { write(Level::INFO , m); }
    void warn (const std::string& m) { write(Level::WARN , m); }
    void error(const std::string& m) { write(Level::ERR  , m); }

    /* Enable/disable the stdout copy. File output is unaffected. */
    void set_echo(bool on);

    std::size_t warnings() const;
    std::size_t errors() const;

    /*------------------------------------------------------------------
      level_tag: maps severity to a label string.

      Returns plain "INFO"/"WARN"/"ERROR" when stdout is not a TTY,
      otherwise strings containing ANSI background color codes.
    ------------------------------------------------------------------*/
    static const char* level_tag(Level);

private:
    std::ofstream file_;
    bool          echo_ = true;
    std::size_t   warnings_ = 0;
    std::size_t   errors_ = 0;

    // guards stdout, file_ and the counters
    mutable std::mutex mtx_;
};

} // namespace lplan
