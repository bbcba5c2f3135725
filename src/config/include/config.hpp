#pragma once
#include <filesystem>

namespace pst::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;
        std::filesystem::path output_path;
    };

    /**
     * @brief Paths for a run of the binary at `binary_path` writing into `output_path`.
     *
     * Logs go to `logs/` next to the binary's directory, never under the output directory.
     */
    Config makeConfig(const std::filesystem::path & binary_path, const std::filesystem::path & output_path);
}
