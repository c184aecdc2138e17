#pragma once

#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/executors/executable.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bridgegrader {

/// Turns source files into an Executable
class Toolchain
{
public:
    virtual ~Toolchain() = default;

    /// Build `files` (the first one being the main source) as language `lang`.
    /// Throws CompileError if the compiler rejects the sources, ConfigError for an unknown language
    /// or unreadable sources, and InternalError if the compiler can't be run at all.
    virtual Executable compile(const std::vector<std::filesystem::path>& files, const std::vector<std::string>& flags,
                               const std::string& lang, std::chrono::duration<double> time_limit,
                               bool unbuffered) const = 0;
};

/// Compiles with the command lines configured per language in a JudgeEnv.
/// Interpreted languages are "compiled" by copying their sources next to each other.
class CommandToolchain : public Toolchain
{
public:
    explicit CommandToolchain(const JudgeEnv& env)
        : languages_{env.languages}
        , tempdir_{env.tempdir} {}

    Executable compile(const std::vector<std::filesystem::path>& files, const std::vector<std::string>& flags,
                       const std::string& lang, std::chrono::duration<double> time_limit,
                       bool unbuffered) const override;

private:
    std::map<std::string, LanguageConfig> languages_;
    std::filesystem::path tempdir_;
};

/// Substitute {binary}, {sources} and {flags} in an argv template
std::vector<std::string> expand_command(const std::vector<std::string>& command_template, const std::string& binary,
                                        const std::vector<std::string>& sources,
                                        const std::vector<std::string>& flags);

/// Resolve a program name the way a shell would, using the PATH of this process.
/// Names containing a '/' are only checked for being executable.
std::optional<std::filesystem::path> find_program(const std::string& name);

} // namespace bridgegrader
