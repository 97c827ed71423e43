#pragma once

#include <string>

// Python source of the remote kernel. It reads RUN frames on stdin, executes
// them against one persistent globals dict, and answers with OUT/ERR/ART/EXC
// frames followed by DONE.
const std::string& kernel_source();

// Shell command that starts the kernel with the given interpreter. The source
// travels base64-encoded so no quoting of its contents is needed.
std::string kernel_launch_command(const std::string& python);
