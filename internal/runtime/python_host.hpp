#pragma once

#include <filesystem>
#include <vector>

#include "notewatch/host/v1/python_host.pb.h"

namespace notewatch::runtime {

/*
  Interpreter side of the Python runtime, run inside the
  notewatch-python-host process.

  Owns the embedded interpreter for the life of the process and answers
  CallRequests read from `fd` until the peer closes it. Each call gets
  fresh globals. Scripts can import `logging_utils`; their log calls are
  forwarded to the parent as ScriptLog frames.
*/
class PythonHost {
 public:
  PythonHost(int fd, std::vector<std::filesystem::path> module_paths);

  PythonHost(const PythonHost&)            = delete;
  PythonHost& operator=(const PythonHost&) = delete;

  // Returns the process exit code.
  int Run();

 private:
  host::v1::CallResult Execute(const host::v1::CallRequest& request);

  int                                fd_;
  std::vector<std::filesystem::path> module_paths_;
};

} // namespace notewatch::runtime
