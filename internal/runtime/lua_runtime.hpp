#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "internal/runtime/script_engine.hpp"
#include "internal/util/time.hpp"

namespace notewatch::runtime {

struct SnippetResult {
  bool        ok = true;
  std::string output; // everything passed to print()
  std::string error;
};

/*
  Restricted script runtime (Lua).

  Every call gets a fresh lua_State that is closed when the call returns,
  so no state survives between calls. The sandbox exposes only pure
  utilities: basic functions without load/require/pcall, string, table,
  math, utf8, os.time/date/clock, plus json and log modules. print() is
  captured into a buffer. Memory is capped per state and a count hook
  aborts the script at its deadline.

  At most `pool_size` states exist at once; callers wait for a free slot
  within their own deadline.
*/
class LuaRuntime : public ScriptEngine {
 public:
  explicit LuaRuntime(std::size_t pool_size);

  std::optional<std::string> CallEntry(const std::string&        script_name,
                                       const std::string&        source,
                                       const std::string&        entry,
                                       const std::string&        argument,
                                       std::chrono::milliseconds timeout) override;

  // Runs a code snippet and returns what it printed. Script errors are
  // reported in the result; a timeout throws ObserverExecutionError.
  SnippetResult RunSnippet(const std::string& code, std::chrono::milliseconds timeout);

  std::size_t PoolSize() const {
    return pool_size_;
  }

 private:
  class Slot;

  void Acquire(util::SteadyTimePoint deadline);
  void Release();

  const std::size_t       pool_size_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::size_t             in_use_ = 0;
};

} // namespace notewatch::runtime
