#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <spdlog/common.h>
#include <snipren/core/types.h>

namespace snipren::cli {

/**
 * The rn command line: rn <new_name> [--force] [--dry-run] [--verbose] [--config PATH]
 *
 * Prints "<source> → <target>" on success and returns 0; prints the refusal
 * with a hint to the error stream and returns 1 otherwise.
 */
class RnCLI {
public:
    /**
     * @param workingDirectory Directory relative targets resolve against; empty means the
     *                         process working directory at run() time
     */
    explicit RnCLI(std::filesystem::path workingDirectory = {}, std::ostream& out = std::cout,
                   std::ostream& err = std::cerr);

    int run(int argc, char* argv[]);

    /**
     * Parse a log level name ("debug", "warn", "off", ...)
     */
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& s);

private:
    // Resolve and perform (or preview) the rename; returns the line to print
    Result<std::string> execute();

    void applyLogLevel(const std::string& configLevel) const;

    std::filesystem::path workingDirectory_;
    std::ostream& out_;
    std::ostream& err_;

    std::string newName_;
    std::string configPath_;
    bool force_ = false;
    bool dryRun_ = false;
    bool verbose_ = false;
};

} // namespace snipren::cli
