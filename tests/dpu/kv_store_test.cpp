#include "ftr/dpu/kv_store.hpp"
#include "support/test_util.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace ftr;
using namespace ftr::dpu;

namespace fs = std::filesystem;

TEST(MemoryKeyValueStoreTest, MissingKeyIsEmptyNotError) {
    MemoryKeyValueStore store;
    auto entry = store.get_all("nope");
    ASSERT_TRUE(entry.is_ok());
    EXPECT_FALSE(entry.value().has_value());
}

TEST(MemoryKeyValueStoreTest, PutSetFieldAndErase) {
    MemoryKeyValueStore store;
    store.put("DPU|dpu0", {{"gnmi_port", "50052"}});
    store.set_field("DPU|dpu0", "extra", "1");

    auto entry = store.get_all("DPU|dpu0");
    ASSERT_TRUE(entry.is_ok());
    ASSERT_TRUE(entry.value().has_value());
    EXPECT_EQ(entry.value()->at("gnmi_port"), "50052");
    EXPECT_EQ(entry.value()->at("extra"), "1");

    store.erase("DPU|dpu0");
    EXPECT_FALSE(store.get_all("DPU|dpu0").value().has_value());
}

TEST(JsonFileKeyValueStoreTest, ReadsEntriesAndStringifiesScalars) {
    const auto dir = test::create_temp_dir("ftr_kv");
    const auto path = dir / "state.json";
    test::write_file(path, R"({
        "CHASSIS_MIDPLANE_TABLE|DPU0": { "ip_address": "10.0.0.1", "access": true },
        "DPU|dpu0": { "gnmi_port": 50052 }
    })");

    JsonFileKeyValueStore store(path.string());

    auto state = store.get_all("CHASSIS_MIDPLANE_TABLE|DPU0");
    ASSERT_TRUE(state.is_ok());
    ASSERT_TRUE(state.value().has_value());
    EXPECT_EQ(state.value()->at("ip_address"), "10.0.0.1");
    EXPECT_EQ(state.value()->at("access"), "true");

    auto config = store.get_all("DPU|dpu0");
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value()->at("gnmi_port"), "50052");

    EXPECT_FALSE(store.get_all("DPU|dpu9").value().has_value());

    fs::remove_all(dir);
}

TEST(JsonFileKeyValueStoreTest, SeesEditsWithoutReopening) {
    const auto dir = test::create_temp_dir("ftr_kv");
    const auto path = dir / "state.json";
    test::write_file(path, R"({"k": {"f": "old"}})");

    JsonFileKeyValueStore store(path.string());
    EXPECT_EQ(store.get_all("k").value()->at("f"), "old");

    test::write_file(path, R"({"k": {"f": "new"}})");
    EXPECT_EQ(store.get_all("k").value()->at("f"), "new");

    fs::remove_all(dir);
}

TEST(JsonFileKeyValueStoreTest, UnreadableOrMalformedFileIsInternal) {
    const auto dir = test::create_temp_dir("ftr_kv");

    JsonFileKeyValueStore missing((dir / "absent.json").string());
    auto result = missing.get_all("k");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Internal);

    test::write_file(dir / "bad.json", "{ not json");
    JsonFileKeyValueStore bad((dir / "bad.json").string());
    EXPECT_EQ(bad.get_all("k").error().code, StatusCode::Internal);

    test::write_file(dir / "list.json", "[1, 2]");
    JsonFileKeyValueStore list((dir / "list.json").string());
    EXPECT_TRUE(list.get_all("k").is_error());

    fs::remove_all(dir);
}
