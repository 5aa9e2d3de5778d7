#include <csignal>
#include <filesystem>
#include <vector>

#include "internal/runtime/python_host.hpp"

namespace {

constexpr int kChannelFd = 3;

} // namespace

/*
  Interpreter process started by notewatch. The channel socket is fd 3;
  every argument is a module directory added to sys.path.
*/
int main(int argc, char** argv) {
  // notewatch ends this process by closing the channel
  std::signal(SIGINT, SIG_IGN);
  std::signal(SIGHUP, SIG_IGN);

  std::vector<std::filesystem::path> module_paths;
  for (int i = 1; i < argc; ++i) module_paths.emplace_back(argv[i]);

  notewatch::runtime::PythonHost host(kChannelFd, std::move(module_paths));
  return host.Run();
}
