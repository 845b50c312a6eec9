#include <v6boot/launcher/process_launcher.h>

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace v6boot::launcher {

LaunchSpec buildLaunchSpec(const config::LaunchCommand& command,
                           const std::filesystem::path& configPath) {
    LaunchSpec spec;
    spec.program = command.program;
    spec.args = command.args;
    spec.args.emplace_back("--config");
    spec.args.push_back(configPath.string());
    return spec;
}

std::string describe(const LaunchSpec& spec) {
    std::string out = spec.program;
    for (const auto& arg : spec.args) {
        out.push_back(' ');
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += "'" + arg + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

Result<void> ExecProcessExecutor::replaceProcess(const LaunchSpec& spec) {
    if (spec.program.empty()) {
        return Error{ErrorCode::InvalidArgument, "No program to launch"};
    }

    for (const auto& [key, value] : spec.env) {
        if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
            return Error{ErrorCode::InternalError,
                         "setenv(" + key + ") failed: " + std::strerror(errno)};
        }
    }

    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    std::string exe = spec.program;
    argv.push_back(exe.data());
    std::vector<std::string> args = spec.args;
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    spdlog::info("Handing over to: {}", describe(spec));
    spdlog::default_logger()->flush();

    // Exec and never return on success
    ::execvp(exe.c_str(), argv.data());

    const int err = errno;
    spdlog::error("Failed to exec {}: {}", spec.program, std::strerror(err));
    return Error{ErrorCode::InternalError,
                 "Failed to exec " + spec.program + ": " + std::strerror(err)};
}

Result<void> DryRunExecutor::replaceProcess(const LaunchSpec& spec) {
    for (const auto& [key, value] : spec.env) {
        spdlog::info("[dry-run] env {}={}", key, value);
    }
    spdlog::info("[dry-run] would exec: {}", describe(spec));
    return {};
}

std::unique_ptr<IProcessExecutor> makeExecProcessExecutor() {
    return std::make_unique<ExecProcessExecutor>();
}

} // namespace v6boot::launcher
