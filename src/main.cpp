#include "pir_state.hpp"

using ArgDef = pst::cmd::CommandLineArgDef;

static void _configureLogger(const std::filesystem::path& logs_path, const spdlog::level::level_enum console_level)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::string log_name = pst::utils::currentTimestamp() + "-pir-state.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    // set different log levels per sink
    console_sink->set_level(console_level);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(std::min(console_level, spdlog::level::debug));
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

static std::optional<std::uint64_t> _nonNegativeArg(const pst::cmd::ArgParser & arg_parser, const std::string & name)
{
    const auto values = arg_parser.getArg<std::vector<std::int64_t>>(name);
    if(!values || values->empty() || values->at(0) < 0)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(values->at(0));
}

static int _rebuildStemIndex(const std::filesystem::path & state_path, const std::filesystem::path & output_path, const bool verify)
{
    spdlog::info("Rebuilding stem index of {}", state_path.string());

    const auto state_res = pst::state::StateFile::load(state_path);
    if(!state_res)
    {
        spdlog::error(std::format("Cannot load state file: {} ({})", state_res.error().kind, state_res.error().message));
        return 1;
    }

    spdlog::info("State file: {} entries, block {}, chain id {}",
        state_res->entries.size(), state_res->header.block_number, state_res->header.chain_id);

    const auto index_res = pst::state::StemIndex::rebuild(*state_res, verify);
    if(!index_res)
    {
        spdlog::error(std::format("Cannot rebuild stem index: {} ({})", index_res.error().kind, index_res.error().message));
        return 1;
    }

    const std::vector<std::uint8_t> encoded = index_res->encode();
    if(const auto write_res = pst::file::writeFileAtomic(output_path, encoded); !write_res)
    {
        spdlog::error("Cannot write stem index: {}", write_res.error());
        return 1;
    }

    spdlog::info("Stem index generated");
    spdlog::info("  Stems:  {}", index_res->size());
    spdlog::info("  Size:   {} KB", encoded.size() / 1024);
    spdlog::info("  Output: {}", output_path.string());
    return 0;
}

int main(int argc, char* argv[])
{
    pst::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--rpc-url", ArgDef::NArgs::One, ArgDef::Type::String, "Ethereum JSON-RPC endpoint URL");
    arg_parser.addArg("--contract", ArgDef::NArgs::One, ArgDef::Type::String, "Token contract address (default: Sepolia USDC)");
    arg_parser.addArg("--mapping-slot", ArgDef::NArgs::One, ArgDef::Type::Int, "Storage slot of the balances mapping (default: 9)");
    arg_parser.addArg("--chain-id", ArgDef::NArgs::One, ArgDef::Type::Int, "Chain id written to the state header (default: 11155111)");
    arg_parser.addArg("--check-chain-id", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Fail if the endpoint reports a different chain id");
    arg_parser.addArg("--block", ArgDef::NArgs::One, ArgDef::Type::Int, "Snapshot block number (default: latest)");
    arg_parser.addArg("--block-hash", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Fetch the block hash and record it in the state header");
    arg_parser.addArg("--wallet", ArgDef::NArgs::Many, ArgDef::Type::String, "Wallet addresses");
    arg_parser.addArg("--wallets-file", ArgDef::NArgs::One, ArgDef::Type::String, "File with one wallet address per line ('#' starts a comment)");
    arg_parser.addArg("--output", ArgDef::NArgs::One, ArgDef::Type::String, "Output directory (default: ./pir-data)");
    arg_parser.addArg("--concurrency", ArgDef::NArgs::One, ArgDef::Type::Int, "Number of concurrent fetches (default: 1)");
    arg_parser.addArg("--timeout-ms", ArgDef::NArgs::One, ArgDef::Type::Int, "Per-request timeout in milliseconds (default: 10000)");
    arg_parser.addArg("--no-wallet-mapping", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Do not write wallet-mapping.json");
    arg_parser.addArg("--rebuild-stem-index", ArgDef::NArgs::One, ArgDef::Type::String, "Regenerate the stem index of an existing state file and exit");
    arg_parser.addArg("--verify", ArgDef::NArgs::Zero, ArgDef::Type::Bool, "Verify the written artifacts");
    arg_parser.addArg("--log-level", ArgDef::NArgs::One, ArgDef::Type::String, "Console log level: trace, debug, info, warn, error (default: info)");

    if(const auto parse_res = arg_parser.parse(argc, argv); !parse_res)
    {
        spdlog::error(std::format("{}: {}", parse_res.error().kind, parse_res.error().message));
        spdlog::info(arg_parser.constructHelpMessage());
        return 1;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        spdlog::info(arg_parser.constructHelpMessage());
        return 0;
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("Version: {}.{}.{}", pst::MAJOR_VERSION, pst::MINOR_VERSION, pst::PATCH_VERSION);
        return 0;
    }

    spdlog::level::level_enum console_level = spdlog::level::info;
    if(const auto level_arg = arg_parser.getArg<std::vector<std::string>>("--log-level"))
    {
        console_level = spdlog::level::from_str(pst::utils::toLower(level_arg->at(0)));
        if(console_level == spdlog::level::off && pst::utils::toLower(level_arg->at(0)) != "off")
        {
            spdlog::error("Invalid --log-level '{}'", level_arg->at(0));
            return 1;
        }
    }

    const pst::config::Config cfg = pst::config::makeConfig(argv[0],
        arg_parser.getArg<std::vector<std::string>>("--output")
            .value_or(std::vector<std::string>{pst::DEFAULT_OUTPUT_DIR}).at(0));

    const bool terminal_configured = pst::native::configureTerminal();
    try
    {
        _configureLogger(cfg.logs_path, console_level);
    }
    catch(const std::exception & e)
    {
        spdlog::error("Cannot set up logging in {}: {}", cfg.logs_path.string(), e.what());
        return 1;
    }

    if(!terminal_configured)
    {
        spdlog::warn("Terminal configuration was not fully applied");
    }

    spdlog::debug("Version: {}.{}.{}", pst::MAJOR_VERSION, pst::MINOR_VERSION, pst::PATCH_VERSION);
    spdlog::debug("pir-state started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    const bool verify = arg_parser.getArg<bool>("--verify").value_or(false);

    // stem index regeneration
    if(const auto rebuild_arg = arg_parser.getArg<std::vector<std::string>>("--rebuild-stem-index"))
    {
        const std::filesystem::path state_path = rebuild_arg->at(0);
        const std::filesystem::path output_path = arg_parser.contains("--output")
            ? cfg.output_path / pst::state::STEM_INDEX_FILE_NAME
            : state_path.parent_path() / pst::state::STEM_INDEX_FILE_NAME;
        return _rebuildStemIndex(state_path, output_path, verify);
    }

    // extraction
    const auto rpc_url_arg = arg_parser.getArg<std::vector<std::string>>("--rpc-url");
    if(!rpc_url_arg)
    {
        spdlog::error("--rpc-url is required");
        return 1;
    }

    pst::extract::ExtractConfig extract_cfg;
    extract_cfg.output_dir = cfg.output_path;
    extract_cfg.fetch_block_hash = arg_parser.getArg<bool>("--block-hash").value_or(false);
    extract_cfg.check_chain_id = arg_parser.getArg<bool>("--check-chain-id").value_or(false);
    extract_cfg.wallet_mapping = !arg_parser.getArg<bool>("--no-wallet-mapping").value_or(false);
    extract_cfg.verify = verify;

    const std::string contract_hex = arg_parser.getArg<std::vector<std::string>>("--contract")
        .value_or(std::vector<std::string>{pst::extract::DEFAULT_CONTRACT}).at(0);
    const auto contract_res = pst::chain::parseAddress(contract_hex);
    if(!contract_res)
    {
        spdlog::error(std::format("Invalid --contract: {}", contract_res.error().message));
        return 1;
    }
    extract_cfg.contract = *contract_res;

    if(arg_parser.contains("--mapping-slot"))
    {
        const auto mapping_slot = _nonNegativeArg(arg_parser, "--mapping-slot");
        if(!mapping_slot)
        {
            spdlog::error("--mapping-slot must be a non-negative integer");
            return 1;
        }
        extract_cfg.mapping_slot = *mapping_slot;
    }

    if(arg_parser.contains("--chain-id"))
    {
        const auto chain_id = _nonNegativeArg(arg_parser, "--chain-id");
        if(!chain_id)
        {
            spdlog::error("--chain-id must be a non-negative integer");
            return 1;
        }
        extract_cfg.chain_id = *chain_id;
    }

    if(arg_parser.contains("--block"))
    {
        extract_cfg.block = _nonNegativeArg(arg_parser, "--block");
        if(!extract_cfg.block)
        {
            spdlog::error("--block must be a non-negative integer");
            return 1;
        }
    }

    if(arg_parser.contains("--concurrency"))
    {
        const auto concurrency = _nonNegativeArg(arg_parser, "--concurrency");
        if(!concurrency || *concurrency == 0)
        {
            spdlog::error("--concurrency must be a positive integer");
            return 1;
        }
        extract_cfg.concurrency = static_cast<std::size_t>(*concurrency);
    }

    std::int64_t timeout_ms = pst::DEFAULT_TIMEOUT_MS;
    if(arg_parser.contains("--timeout-ms"))
    {
        const auto timeout_arg = _nonNegativeArg(arg_parser, "--timeout-ms");
        if(!timeout_arg || *timeout_arg == 0)
        {
            spdlog::error("--timeout-ms must be a positive integer");
            return 1;
        }
        timeout_ms = static_cast<std::int64_t>(*timeout_arg);
    }

    // wallets
    std::vector<std::string> wallet_args = arg_parser.getArg<std::vector<std::string>>("--wallet").value_or(std::vector<std::string>{});
    if(const auto wallets_file_arg = arg_parser.getArg<std::vector<std::string>>("--wallets-file"))
    {
        const auto lines = pst::file::loadListFile(wallets_file_arg->at(0));
        if(!lines)
        {
            spdlog::error("Cannot read wallets file {}", wallets_file_arg->at(0));
            return 1;
        }
        wallet_args.insert(wallet_args.end(), lines->begin(), lines->end());
    }

    const auto wallets_res = pst::extract::parseWallets(wallet_args);
    if(!wallets_res)
    {
        spdlog::error(std::format("{}: {}", wallets_res.error().kind, wallets_res.error().message));
        return 1;
    }

    if(wallets_res->empty())
    {
        spdlog::error("No wallets given, use --wallet or --wallets-file");
        return 1;
    }

    spdlog::info("Contract:     {}", pst::chain::toHex(extract_cfg.contract));
    spdlog::info("Mapping slot: {}", extract_cfg.mapping_slot);
    spdlog::info("Chain id:     {}", extract_cfg.chain_id);
    spdlog::info("Wallets:      {}", wallets_res->size());

    const pst::rpc::EthClient client(pst::rpc::ClientConfig{
        .rpc_url = rpc_url_arg->at(0),
        .timeout = std::chrono::milliseconds(timeout_ms),
        .transport = {}
    });

    const auto run_res = pst::extract::run(extract_cfg, client, *wallets_res);
    if(!run_res)
    {
        spdlog::error(std::format("{}: {}", run_res.error().kind, run_res.error().message));
        return 1;
    }

    const pst::extract::RunSummary & summary = *run_res;
    spdlog::info("Block:          {}", summary.block_number);
    spdlog::info("Entries:        {}", summary.build.entry_count);
    spdlog::info("Stems:          {}", summary.build.stem_count);
    spdlog::info("Zero balances:  {}", summary.stats.zero);
    spdlog::info("Failed fetches: {}", summary.stats.failed);
    spdlog::info("State file:     {}", summary.build.paths.state_file.string());
    spdlog::info("Stem index:     {}", summary.build.paths.stem_index_file.string());
    if(summary.build.paths.wallet_mapping_file)
    {
        spdlog::info("Wallet mapping: {}", summary.build.paths.wallet_mapping_file->string());
    }

    return 0;
}
