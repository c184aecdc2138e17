#pragma once

#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/subprocess/process.hpp>

#include <memory>
#include <string>
#include <vector>

namespace bridgegrader {

/// A runnable program: a command prefix plus the scratch directory holding its build artifacts.
/// Copies share the build directory, which is removed with the last of them.
class Executable
{
public:
    Executable(std::vector<std::string> command, std::string language, std::shared_ptr<const ScopedTempDir> build_dir);

    /// Start the program with `args` appended to its command.
    /// Throws InternalError if the process cannot be started.
    std::unique_ptr<Process> launch(const std::vector<std::string>& args, LaunchOptions opts) const;

    /// Full argv prefix; element 0 is an absolute path
    const std::vector<std::string>& get_command() const { return command_; }

    const std::string& get_language() const { return language_; }

    const std::filesystem::path& get_build_dir() const { return build_dir_->path(); }

private:
    std::vector<std::string> command_;
    std::string language_;
    std::shared_ptr<const ScopedTempDir> build_dir_;
};

} // namespace bridgegrader
