#include <gtest/gtest.h>
#include "../src/sink/component_registry.hpp"
#include "../src/sink/bytearray_format.hpp"
#include "../src/sink/json_format.hpp"
#include "../src/sink/sink_errors.hpp"
#include "../src/config.hpp"
#include "fake_s3_client.hpp"
#include <algorithm>
#include <memory>

namespace {

class TopicOnlyPartitioner : public Partitioner {
public:
    std::string encodePartition(const SinkRecord& record) const override {
        return "topic=" + record.topic;
    }
};

}  // namespace

TEST(ComponentRegistryTest, BuiltInsRegistered) {
    ComponentRegistry registry;

    EXPECT_TRUE(registry.hasFormat("bytearray"));
    EXPECT_TRUE(registry.hasFormat("json"));
    EXPECT_TRUE(registry.hasFormat("parquet"));
    EXPECT_TRUE(registry.hasPartitioner("default"));
    EXPECT_TRUE(registry.hasPartitioner("time"));
    EXPECT_TRUE(registry.hasPartitioner("hourly"));
    EXPECT_TRUE(registry.hasPartitioner("daily"));
    EXPECT_EQ(registry.getFormatNames().size(), 3u);
    EXPECT_EQ(registry.getPartitionerNames().size(), 4u);
}

TEST(ComponentRegistryTest, UnknownNamesThrowConfigException) {
    ComponentRegistry registry;
    auto client = std::make_shared<FakeS3Client>("test-bucket");
    SinkConfig config = SinkConfig::fromMap({{"s3.bucket.name", "test-bucket"}, {"flush.size", "1"}});
    S3Storage storage(config, "", client);

    EXPECT_THROW(registry.createFormat("avro", storage, config), ConfigException);
    EXPECT_THROW(registry.createPartitioner("field"), ConfigException);
}

TEST(ComponentRegistryTest, CreatesBuiltInFormat) {
    ComponentRegistry registry;
    auto client = std::make_shared<FakeS3Client>("test-bucket");
    SinkConfig config = SinkConfig::fromMap({{"s3.bucket.name", "test-bucket"}, {"flush.size", "1"}});
    S3Storage storage(config, "", client);

    auto provider = registry.createFormat("json", storage, config);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->getExtension(), ".json");

    auto partitioner = registry.createPartitioner("default");
    ASSERT_NE(partitioner, nullptr);
}

TEST(ComponentRegistryTest, BuiltInFactoriesBuildTheirTypes) {
    ComponentRegistry registry;
    auto client = std::make_shared<FakeS3Client>("test-bucket");
    SinkConfig config = SinkConfig::fromMap({{"s3.bucket.name", "test-bucket"}, {"flush.size", "1"}});
    S3Storage storage(config, "", client);

    auto bytearray = registry.createFormat("bytearray", storage, config);
    EXPECT_NE(dynamic_cast<ByteArrayRecordWriterProvider*>(bytearray.get()), nullptr);
    auto json = registry.createFormat("json", storage, config);
    EXPECT_NE(dynamic_cast<JsonRecordWriterProvider*>(json.get()), nullptr);

    EXPECT_NE(dynamic_cast<DefaultPartitioner*>(registry.createPartitioner("default").get()), nullptr);
    EXPECT_NE(dynamic_cast<TimeBasedPartitioner*>(registry.createPartitioner("time").get()), nullptr);
    EXPECT_NE(dynamic_cast<HourlyPartitioner*>(registry.createPartitioner("hourly").get()), nullptr);
    EXPECT_NE(dynamic_cast<DailyPartitioner*>(registry.createPartitioner("daily").get()), nullptr);
}

TEST(ComponentRegistryTest, RegisterCustomPartitioner) {
    ComponentRegistry registry;
    registry.registerPartitioner("topic", []() {
        return std::make_unique<TopicOnlyPartitioner>();
    });

    auto partitioner = registry.createPartitioner("topic");
    SinkRecord record;
    record.topic = "events";
    EXPECT_EQ(partitioner->encodePartition(record), "topic=events");

    auto names = registry.getPartitionerNames();
    EXPECT_NE(std::find(names.begin(), names.end(), "topic"), names.end());
}
