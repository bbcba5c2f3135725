#include "unit-tests.hpp"

using namespace pst;
using namespace pst::tests;

TEST_F(UnitTest, Config_LogsLiveOutsideOutputDirectory)
{
    const config::Config cfg = config::makeConfig("/opt/pir/bin/pir-state", "pir-data");

    EXPECT_EQ(cfg.bin_path.string(), "/opt/pir/bin");
    EXPECT_EQ(cfg.logs_path.string(), "/opt/pir/logs");
    EXPECT_EQ(cfg.output_path.string(), "pir-data");

    const config::Config nested = config::makeConfig("/opt/pir/bin/pir-state", "/opt/pir/bin/out");
    const auto relative = nested.logs_path.lexically_relative(nested.output_path);
    EXPECT_TRUE(relative.empty() || *relative.begin() == "..") << relative.string();
}
