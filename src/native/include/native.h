#pragma once

#if !defined(__linux__)
#   error "Error, unsupported platform"
#endif

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace pst::native
{
    /**
     * Adopts the locale from the environment and reports whether the attached terminal can take colored output.
     *
     * @return false when the locale could not be set or TERM is missing or "dumb".
     */
    bool configureTerminal();

    /**
     * Spawns `command` (resolved through PATH) with `args` passed verbatim, no shell involved,
     * and blocks until it exits.
     *
     * @return exit code (-1 when the process could not be started) and its combined stdout/stderr
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});

    /**
     * Flushes the file or directory at `path` to stable storage (fsync).
     *
     * @return false if it could not be opened or synced.
     */
    bool syncPath(const std::filesystem::path & path);

    int processId();
}
