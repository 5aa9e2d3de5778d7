#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace notewatch::runtime {

/*
  A script host that can run one entry point of a script source.

  CallEntry loads `source`, calls the global function `entry` with a single
  string argument and returns its string result (nullopt for nil/None).
  Script faults and timeouts throw ObserverExecutionError; a timeout has
  the message "timeout".
*/
class ScriptEngine {
 public:
  virtual ~ScriptEngine() = default;

  virtual std::optional<std::string> CallEntry(const std::string&        script_name,
                                               const std::string&        source,
                                               const std::string&        entry,
                                               const std::string&        argument,
                                               std::chrono::milliseconds timeout) = 0;
};

} // namespace notewatch::runtime
