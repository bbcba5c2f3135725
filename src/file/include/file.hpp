#pragma once

#include <cstdint>
#include <expected>
#include <fstream>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace pst::file
{
    std::optional<std::string> loadTextFile(std::filesystem::path path);

    std::optional<std::vector<std::uint8_t>> loadBinaryFile(std::filesystem::path path);

    /**
     * @brief Read a line oriented list file.
     *
     * Leading/trailing whitespace is trimmed, empty lines and lines starting with '#' are skipped.
     */
    std::optional<std::vector<std::string>> loadListFile(std::filesystem::path path);

    struct PendingFile
    {
        std::filesystem::path path;
        std::span<const std::uint8_t> content;
    };

    /**
     * @brief Replace the file at `path` with `content` atomically.
     *
     * The content is written to temporaryPath(path), synced to disk and renamed over `path`.
     * On failure the temporary file is removed and the canonical path is left untouched.
     *
     * @return error message on failure
     */
    std::expected<void, std::string> writeFileAtomic(const std::filesystem::path & path, std::span<const std::uint8_t> content);

    std::expected<void, std::string> writeFileAtomic(const std::filesystem::path & path, const std::string & content);

    /**
     * @brief Replace several files as one unit.
     *
     * Every file is staged and synced before the first rename. If any step fails, files already
     * renamed are restored from their backups and all staged files are removed, so either every
     * canonical path holds the new content or none of them changed.
     * Canonical paths occupied by something other than a regular file are rejected up front.
     */
    std::expected<void, std::string> writeFilesAtomic(std::span<const PendingFile> files);

    /**
     * @brief `<path>.<pid>.tmp`
     */
    std::filesystem::path temporaryPath(const std::filesystem::path & path);

    std::filesystem::path backupPath(const std::filesystem::path & path);
}
