#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "version.hpp"

#include "native.h"
#include "config.hpp"
#include "arg_parser.hpp"
#include "utils.hpp"
#include "file.hpp"

#include "chain.hpp"
#include "ubt.hpp"
#include "eth_client.hpp"
#include "state_format.hpp"
#include "stem_index.hpp"
#include "state_builder.hpp"
#include "lookup.hpp"
#include "extract.hpp"

namespace pst
{
    inline constexpr const char * DEFAULT_OUTPUT_DIR = "pir-data";
    constexpr std::int64_t DEFAULT_TIMEOUT_MS = 10'000;
}
