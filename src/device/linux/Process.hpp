#ifndef SRC_DEVICE_LINUX_PROCESS_HPP
#define SRC_DEVICE_LINUX_PROCESS_HPP

#include <string>
#include <vector>

namespace wipecert::device::detail
{

struct ProcessOutput final
{
    int exitCode{ -1 }; // 127 when the program could not be executed
    std::string output; // stdout and stderr, interleaved
};

// fork/execvp/waitpid. Throws std::system_error when the child cannot be spawned.
[[nodiscard]] ProcessOutput runProcess(const std::vector<std::string>& args);

} // namespace wipecert::device::detail

#endif // SRC_DEVICE_LINUX_PROCESS_HPP
