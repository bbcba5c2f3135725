#include "config.hpp"

namespace pst::config
{
    Config makeConfig(const std::filesystem::path & binary_path, const std::filesystem::path & output_path)
    {
        Config cfg;
        cfg.bin_path = binary_path.parent_path();
        cfg.logs_path = cfg.bin_path.parent_path() / "logs";
        cfg.output_path = output_path;
        return cfg;
    }
}
