#include <gtest/gtest.h>
#include "core/DeviceWriter.h"
#include <nlohmann/json.hpp>

namespace sku_scan {

class DeviceWriterTest : public ::testing::Test {
protected:
    static Device make(const std::string& mac, const std::string& ip, std::optional<std::string> host,
                       std::optional<std::string> stamp) {
        Device d;
        d.mac = mac; d.ip = ip; d.hostname = host; d.build_stamp = stamp;
        return d;
    }

    DeviceWriter writer;
};

TEST_F(DeviceWriterTest, EmptyTable) {
    EXPECT_EQ(writer.write_json({}), "{}");
    EXPECT_EQ(writer.write_text({}), "");
}

TEST_F(DeviceWriterTest, JsonContainsOnlySkuDevices) {
    Device sku = make("aa:bb", "10.0.0.5", "box", "2024-01-01");
    sku.bios_version = "F.21";
    sku.kernel = "6.1.0-13-amd64";
    std::vector<Device> devices = {
        sku,
        make("cc:dd", "10.0.0.6", "printer", std::nullopt),
        make("ee:ff", "10.0.0.7", std::nullopt, std::nullopt),
    };

    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(writer.write_json(devices)));
    ASSERT_TRUE(parsed.is_object());
    EXPECT_EQ(parsed.size(), 1u);
    ASSERT_TRUE(parsed.contains("box"));
    const auto& box = parsed["box"];
    EXPECT_EQ(box["ip"], "10.0.0.5");
    EXPECT_EQ(box["mac"], "aa:bb");
    EXPECT_EQ(box["buildStamp"], "2024-01-01");
    EXPECT_EQ(box["biosVersion"], "F.21");
    EXPECT_EQ(box["kernel"], "6.1.0-13-amd64");
    EXPECT_EQ(box.size(), 5u);
    EXPECT_FALSE(box.contains("hostname"));
    EXPECT_FALSE(box.contains("tolerance"));
}

TEST_F(DeviceWriterTest, MissingOptionalFieldsAreNull) {
    std::vector<Device> devices = { make("aa:bb", "10.0.0.5", "box", "stamp") };
    auto parsed = nlohmann::json::parse(writer.write_json(devices));
    EXPECT_TRUE(parsed["box"]["biosVersion"].is_null());
    EXPECT_TRUE(parsed["box"]["kernel"].is_null());
}

TEST_F(DeviceWriterTest, JsonEscapesValues) {
    std::vector<Device> devices = { make("aa:bb", "10.0.0.5", "b\"ox", "line\\one") };
    auto parsed = nlohmann::json::parse(writer.write_json(devices));
    ASSERT_TRUE(parsed.contains("b\"ox"));
    EXPECT_EQ(parsed["b\"ox"]["buildStamp"], "line\\one");
}

TEST_F(DeviceWriterTest, DuplicateHostnameLaterWins) {
    std::vector<Device> devices = {
        make("aa:aa", "10.0.0.1", "box", "first"),
        make("bb:bb", "10.0.0.2", "box", "second"),
    };
    auto parsed = nlohmann::json::parse(writer.write_json(devices));
    EXPECT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed["box"]["buildStamp"], "second");
}

TEST_F(DeviceWriterTest, TextListsSkuHostnames) {
    std::vector<Device> devices = {
        make("aa:aa", "10.0.0.1", "alpha", "s1"),
        make("bb:bb", "10.0.0.2", "printer", std::nullopt),
        make("cc:cc", "10.0.0.3", "gamma", "s3"),
    };
    EXPECT_EQ(writer.write_text(devices), "alpha,gamma");
}

TEST_F(DeviceWriterTest, ResolvedHostnameAloneIsNotEnough) {
    std::vector<Device> devices = { make("aa:aa", "10.0.0.1", "printer", std::nullopt) };
    EXPECT_EQ(writer.write_text(devices), "");
    EXPECT_EQ(writer.write_json(devices), "{}");
}

TEST_F(DeviceWriterTest, ContentNegotiation) {
    EXPECT_TRUE(DeviceWriter::wants_json("application/json"));
    EXPECT_TRUE(DeviceWriter::wants_json("text/html, application/json;q=0.9"));
    EXPECT_FALSE(DeviceWriter::wants_json("text/plain"));
    EXPECT_FALSE(DeviceWriter::wants_json("*/*"));
    EXPECT_FALSE(DeviceWriter::wants_json(""));
}

} // namespace sku_scan

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
