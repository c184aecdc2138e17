#include <bridgegrader/executors/toolchain.hpp>

#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>
#include <bridgegrader/subprocess/process.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace bridgegrader {

namespace {

constexpr std::string_view DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

/// Compiled programs are always written under this name in their build directory
constexpr std::string_view BINARY_NAME = "main";

std::filesystem::path resolve_program(const std::string& name) {
    auto res = find_program(name);

    if (!res) {
        throw InternalError(fmt::format("could not find program {:?}", name), ErrorKind::ProcessFailure);
    }

    return *res;
}

/// Copy every source into `dir`, returning the new paths in the same order
std::vector<std::string> stage_sources(const std::vector<std::filesystem::path>& files,
                                       const std::filesystem::path& dir) {
    std::vector<std::string> staged;

    for (const auto& file : files) {
        auto dest = dir / file.filename();
        std::error_code err;

        std::filesystem::copy_file(file, dest, std::filesystem::copy_options::overwrite_existing, err);

        if (err) {
            throw ConfigError(fmt::format("could not read source file {}: {}", file, err));
        }

        staged.push_back(dest.string());
    }

    return staged;
}

void run_compiler(const std::vector<std::string>& argv, std::chrono::duration<double> time_limit,
                  const std::filesystem::path& tempdir) {
    LaunchOptions opts;
    // Compilers spawn helper processes, so only wall time is limited
    opts.wall_time = time_limit;
    opts.tempdir = tempdir;

    Process compiler{argv, std::move(opts)};

    if (auto res = compiler.start(); !res) {
        throw InternalError(fmt::format("could not start compiler {}: {}", argv[0], res.error()),
                            ErrorKind::ProcessFailure);
    }

    auto [output, errors] = compiler.communicate();
    std::string diagnostics = output + errors;

    if (compiler.is_tle()) {
        throw CompileError(fmt::format("compiler timed out (> {:.1f}s)", time_limit.count()), diagnostics);
    }

    if (compiler.return_code() != 0) {
        LOG_DEBUG("{} failed with {}", argv, compiler.return_code());
        throw CompileError("compilation failed", diagnostics);
    }
}

} // namespace

std::vector<std::string> expand_command(const std::vector<std::string>& command_template, const std::string& binary,
                                        const std::vector<std::string>& sources,
                                        const std::vector<std::string>& flags) {
    std::vector<std::string> res;

    for (const auto& arg : command_template) {
        if (arg == "{sources}") {
            res.insert(res.end(), sources.begin(), sources.end());
        } else if (arg == "{flags}") {
            res.insert(res.end(), flags.begin(), flags.end());
        } else if (arg == "{binary}") {
            res.push_back(binary);
        } else {
            res.push_back(arg);
        }
    }

    return res;
}

std::optional<std::filesystem::path> find_program(const std::string& name) {
    const auto is_executable = [](const std::filesystem::path& path) {
        std::error_code err;
        return std::filesystem::is_regular_file(path, err) && ::access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (!is_executable(name)) {
            return std::nullopt;
        }

        return std::filesystem::absolute(name);
    }

    const char* env_path = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    std::string_view search_path = env_path != nullptr ? env_path : DEFAULT_PATH;

    while (!search_path.empty()) {
        auto sep = search_path.find(':');
        auto dir = search_path.substr(0, sep);
        search_path = sep == std::string_view::npos ? std::string_view{} : search_path.substr(sep + 1);

        if (dir.empty()) {
            continue;
        }

        auto candidate = std::filesystem::path{dir} / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

Executable CommandToolchain::compile(const std::vector<std::filesystem::path>& files,
                                     const std::vector<std::string>& flags, const std::string& lang,
                                     std::chrono::duration<double> time_limit, bool unbuffered) const {
    auto lang_it = languages_.find(lang);
    if (lang_it == languages_.end()) {
        throw ConfigError(fmt::format("unknown language {:?}", lang));
    }
    const LanguageConfig& language = lang_it->second;

    if (files.empty()) {
        throw ConfigError("nothing to compile");
    }

    auto build_dir = ScopedTempDir::create(tempdir_, "bridgegrader-build");
    if (!build_dir) {
        throw InternalError(fmt::format("could not create a build directory in {}", tempdir_),
                            ErrorKind::SyscallFailure);
    }

    auto shared_dir = std::make_shared<const ScopedTempDir>(std::move(build_dir.value()));
    const auto sources = stage_sources(files, shared_dir->path());

    std::string binary = sources.front();

    if (!language.is_interpreted()) {
        binary = (shared_dir->path() / BINARY_NAME).string();

        auto argv = expand_command(language.compile, binary, sources, flags);
        argv[0] = resolve_program(argv[0]).string();

        LOG_DEBUG("Compiling {} with {}", files, argv);
        DEBUG_TIME(run_compiler(argv, time_limit, tempdir_));
    } else if (!flags.empty()) {
        LOG_DEBUG("Ignoring compiler flags {} for interpreted language {}", flags, lang);
    }

    const auto& run_template = unbuffered && !language.unbuffered_run.empty() ? language.unbuffered_run : language.run;

    auto command = expand_command(run_template, binary, sources, flags);
    command[0] = resolve_program(command[0]).string();

    LOG_INFO("Built {} ({}) as {}", files.front().filename(), lang, command);

    return Executable{std::move(command), lang, std::move(shared_dir)};
}

} // namespace bridgegrader
