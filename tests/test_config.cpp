#include <gtest/gtest.h>
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include <map>
#include <string>

namespace sku_scan {

class ConfigTest : public ::testing::Test {
protected:
    EnvLookup lookup() {
        return [this](const char* k) -> const char* {
            auto it = env.find(k);
            return it == env.end() ? nullptr : it->second.c_str();
        };
    }

    std::map<std::string, std::string> env;
    Config cfg;
    ConfigValidator validator;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_FALSE(cfg.debug);
    EXPECT_TRUE(cfg.interface.empty());
    EXPECT_TRUE(cfg.ignore_macs.empty());
    EXPECT_EQ(cfg.port, 2991);
    EXPECT_EQ(cfg.domain, "local");
    EXPECT_EQ(cfg.ssh_user, "u");
    EXPECT_EQ(cfg.max_tolerance, 5);
    EXPECT_EQ(cfg.scan_period, std::chrono::seconds(10));
    EXPECT_EQ(cfg.device_ttl, std::chrono::seconds(60));
    EXPECT_EQ(cfg.probe_timeout, std::chrono::seconds(2));
}

TEST_F(ConfigTest, EnvironmentOverlay) {
    env["DEBUG"] = "1";
    env["IF"] = "eth1";
    env["IGNORE"] = "aa:bb:cc:dd:ee:ff,11:22:33:44:55:66";
    env["PORT"] = "8080";
    env["SKU_SCAN_DOMAIN"] = "lan";
    env["SKU_SCAN_SSH_USER"] = "root";
    env["SKU_SCAN_SUDO"] = "0";
    load_env_config(cfg, lookup());

    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.interface, "eth1");
    ASSERT_EQ(cfg.ignore_macs.size(), 2u);
    EXPECT_EQ(cfg.ignore_macs[1], "11:22:33:44:55:66");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.domain, "lan");
    EXPECT_EQ(cfg.ssh_user, "root");
    EXPECT_FALSE(cfg.scan_sudo);
}

TEST_F(ConfigTest, EmptyDebugVariableIsOff) {
    env["DEBUG"] = "";
    load_env_config(cfg, lookup());
    EXPECT_FALSE(cfg.debug);
}

TEST_F(ConfigTest, InvalidPortKeepsDefault) {
    env["PORT"] = "http";
    load_env_config(cfg, lookup());
    EXPECT_EQ(cfg.port, 2991);

    env["PORT"] = "80x";
    load_env_config(cfg, lookup());
    EXPECT_EQ(cfg.port, 2991);
}

TEST_F(ConfigTest, SplitCsvDropsEmptyItems) {
    auto parts = split_csv("a,,b,");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
}

TEST_F(ConfigTest, ValidatorAcceptsDefaults) {
    EXPECT_TRUE(validator.validate(cfg));
}

TEST_F(ConfigTest, ValidatorRejectsPortOutOfRange) {
    cfg.port = 0;
    EXPECT_FALSE(validator.validate(cfg));
    cfg.port = 65536;
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigTest, ValidatorRejectsEmptyDomainAndUser) {
    Config a; a.domain = "";
    EXPECT_FALSE(validator.validate(a));
    Config b; b.ssh_user = "";
    EXPECT_FALSE(validator.validate(b));
}

TEST_F(ConfigTest, ValidatorRejectsBadInterface) {
    cfg.interface = "eth0 -x";
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigTest, ValidatorRejectsNonPositiveTimings) {
    Config a; a.scan_period = std::chrono::milliseconds(0);
    EXPECT_FALSE(validator.validate(a));
    Config b; b.probe_timeout = std::chrono::milliseconds(-1);
    EXPECT_FALSE(validator.validate(b));
}

TEST_F(ConfigTest, ValidatorNormalizesIgnoreList) {
    cfg.ignore_macs = {" AA:BB:CC:DD:EE:FF ", "aa:bb:cc:dd:ee:ff", "", "11:22:33:44:55:66"};
    ASSERT_TRUE(validator.validate(cfg));
    ASSERT_EQ(cfg.ignore_macs.size(), 2u);
    EXPECT_EQ(cfg.ignore_macs[0], "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(cfg.ignore_macs[1], "11:22:33:44:55:66");
}

TEST_F(ConfigTest, NormalizeMacLeavesHighBytesAlone) {
    std::string mac = "AA:BB:\xC3\x89:\xFF";
    EXPECT_EQ(ConfigValidator::normalize_mac(mac), "aa:bb:\xC3\x89:\xFF");
    EXPECT_EQ(ConfigValidator::normalize_mac("  Aa:Bb  "), "aa:bb");
}

TEST_F(ConfigTest, GlobalConfigRoundTrip) {
    cfg.port = 4242;
    set_config(cfg);
    EXPECT_EQ(config().port, 4242);
}

} // namespace sku_scan

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
