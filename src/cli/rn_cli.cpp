#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <cctype>
#include <cstdlib>
#include <snipren/cli/error_hints.h>
#include <snipren/cli/rn_cli.h>
#include <snipren/config/config_helpers.h>
#include <snipren/resolve/candidate_resolver.hpp>

namespace fs = std::filesystem;

namespace snipren::cli {

RnCLI::RnCLI(std::filesystem::path workingDirectory, std::ostream& out, std::ostream& err)
    : workingDirectory_(std::move(workingDirectory)), out_(out), err_(err) {}

std::optional<spdlog::level::level_enum> RnCLI::parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

// Precedence: env SNIPREN_LOG_LEVEL > --verbose > config [logging] level > main's default
void RnCLI::applyLogLevel(const std::string& configLevel) const {
    if (const char* envLvl = std::getenv("SNIPREN_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown SNIPREN_LOG_LEVEL '{}'", envLvl);
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (!configLevel.empty()) {
        if (auto lvl = parseLevel(configLevel)) {
            spdlog::set_level(*lvl);
        } else {
            spdlog::warn("Ignoring unknown logging.level '{}'", configLevel);
        }
    }
}

int RnCLI::run(int argc, char* argv[]) {
    CLI::App app{"A fast, safe, intent-aware rename utility", "rn"};
    app.add_option("new_name", newName_, "The new filename to rename to")->required();
    app.add_flag("-f,--force", force_, "Force rename even if target exists");
    app.add_flag("-n,--dry-run", dryRun_, "Show the rename that would happen without doing it");
    app.add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app.add_option("--config", configPath_, "Path to config.toml");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e, out_, err_);
        return code == 0 ? 0 : 1;
    }

    auto configFile = config::get_config_path(configPath_);
    auto settings = config::load_settings(configFile);
    applyLogLevel(settings.logLevel);
    if (settings.dryRun) {
        dryRun_ = true;
    }

    auto result = execute();
    if (!result) {
        err_ << formatErrorWithHint(result.error().code, result.error().message, newName_)
             << "\n";
        return 1;
    }
    out_ << result.value() << "\n";
    return 0;
}

Result<std::string> RnCLI::execute() {
    fs::path cwd = workingDirectory_;
    if (cwd.empty()) {
        std::error_code ec;
        cwd = fs::current_path(ec);
        if (ec) {
            return Error{ErrorCode::DirectoryUnreadable,
                         "Failed to get current directory: " + ec.message()};
        }
    }
    spdlog::debug("Working directory: {}", cwd.string());

    resolve::Options opt;
    opt.force = force_;
    opt.dryRun = dryRun_;
    resolve::CandidateResolver<resolve::FilesystemBackend> resolver(resolve::FilesystemBackend{},
                                                                    cwd, opt);

    auto intent = resolver.rename(newName_);
    if (!intent) {
        return intent.error();
    }

    auto line = resolve::formatConfirmation(intent.value());
    if (dryRun_) {
        return "would rename: " + line;
    }
    return line;
}

} // namespace snipren::cli
