// BackupCodecTests.cpp
// JSON backup document: tagged values, identifiers and malformed input.
//

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "Backup/BackupCodec.hpp"

using namespace BACN;
using namespace BACN::Backup;
using nlohmann::json;

namespace {

Device::ConfigBackup SampleBackup() {
    Device::ConfigBackup backup;
    backup.config.deviceId = 4242;
    backup.config.broadcastAddress = "192.168.1.255";
    backup.config.localAddress = "192.168.1.10";
    backup.config.port = 47809;
    backup.config.apduTimeoutMs = 3000;
    backup.tunables.retries = 4;
    backup.tunables.segWindow = 8;

    ObjectRecord setpoint;
    setpoint.identifier = ObjectIdentifier{ObjectType::AnalogValue, 1};
    setpoint.properties[PropertyId::ObjectName] = "zone-setpoint";
    setpoint.properties[PropertyId::PresentValue] = 72.5;
    setpoint.properties[PropertyId::Units] = static_cast<uint32_t>(64);
    setpoint.properties[PropertyId::OutOfService] = false;
    backup.objects.push_back(setpoint);

    ObjectRecord schedule;
    schedule.identifier = ObjectIdentifier{ObjectType::Schedule, 7};
    schedule.properties[PropertyId::ObjectName] = "occupancy";
    schedule.properties[PropertyId::PriorityArray] =
        PropertyList{PropertyValue{}, PropertyValue(int64_t{-3}), PropertyValue(ObjectIdentifier{ObjectType::BinaryValue, 2})};
    backup.objects.push_back(schedule);
    return backup;
}

std::string ValidDocumentWith(const std::string& objects) {
    return R"({"config": {"device-id": 10, "broadcast-address": "10.0.0.255", "port": 47808,
                          "destination-port": 47808, "local-address": "10.0.0.1", "timeout": 10000,
                          "apdu-timeout": 10000, "retries": 2, "seg-timeout": 5000, "seg-window": 5},
               "tunables": {"retries": 2, "seg-timeout": 5000, "seg-window": 5, "timeout": 10000})" +
           objects + "}";
}

} // namespace

// =============================================================================
// Values
// =============================================================================

TEST(BackupCodec, ValuesCarryTheirTypeTag) {
    EXPECT_EQ(EncodeValue(PropertyValue{}), json::parse(R"({"null": null})"));
    EXPECT_EQ(EncodeValue(true), json::parse(R"({"boolean": true})"));
    EXPECT_EQ(EncodeValue(static_cast<uint32_t>(7)), json::parse(R"({"unsigned": 7})"));
    EXPECT_EQ(EncodeValue(int64_t{-7}), json::parse(R"({"signed": -7})"));
    EXPECT_EQ(EncodeValue(72.5), json::parse(R"({"real": 72.5})"));
    EXPECT_EQ(EncodeValue("lobby"), json::parse(R"({"character-string": "lobby"})"));
    EXPECT_EQ(EncodeValue(ObjectIdentifier{ObjectType::AnalogInput, 3}),
              json::parse(R"({"object-identifier": ["analog-input", 3]})"));
}

TEST(BackupCodec, SignedTagSurvivesNonNegativeValue) {
    // JSON alone cannot tell 5 from 5u; the tag does.
    auto decoded = DecodeValue(json::parse(R"({"signed": 5})"));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->Is<int64_t>());
    EXPECT_EQ(*decoded->As<int64_t>(), 5);
}

TEST(BackupCodec, NonFiniteRealsSurviveSerializeAndParse) {
    constexpr double kInf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(EncodeValue(std::numeric_limits<double>::quiet_NaN()), json::parse(R"({"real": "nan"})"));
    EXPECT_EQ(EncodeValue(kInf), json::parse(R"({"real": "inf"})"));
    EXPECT_EQ(EncodeValue(-kInf), json::parse(R"({"real": "-inf"})"));

    Device::ConfigBackup backup = SampleBackup();
    ObjectRecord sensor;
    sensor.identifier = ObjectIdentifier{ObjectType::AnalogInput, 4};
    sensor.properties[PropertyId::PresentValue] = std::numeric_limits<double>::quiet_NaN();
    sensor.properties[PropertyId::CovIncrement] = kInf;
    sensor.properties[PropertyId::RelinquishDefault] = -kInf;
    backup.objects.push_back(sensor);

    auto parsed = Parse(Serialize(backup));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->objects.size(), 3u);
    const auto& restored = parsed->objects.back();

    const auto* nan = restored.Find(PropertyId::PresentValue)->As<double>();
    ASSERT_NE(nan, nullptr);
    EXPECT_TRUE(std::isnan(*nan));
    EXPECT_EQ(*restored.Find(PropertyId::CovIncrement), PropertyValue(kInf));
    EXPECT_EQ(*restored.Find(PropertyId::RelinquishDefault), PropertyValue(-kInf));
}

TEST(BackupCodec, UnknownObjectTypeIsWrittenAsNumber) {
    const ObjectIdentifier vendorSpecific{static_cast<ObjectType>(130), 9};
    auto encoded = EncodeObjectIdentifier(vendorSpecific);
    EXPECT_EQ(encoded, json::parse("[130, 9]"));

    auto decoded = DecodeObjectIdentifier(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, vendorSpecific);
}

TEST(BackupCodec, MalformedValuesAreParseErrors) {
    EXPECT_TRUE(DecodeValue(json::parse(R"({"real": "hot"})")).error().Is(NodeStatus::kParseError));
    EXPECT_TRUE(DecodeValue(json::parse(R"({"bitstring": [1, 0]})")).error().Is(NodeStatus::kParseError));
    EXPECT_TRUE(DecodeValue(json::parse(R"({"real": 1, "signed": 2})")).error().Is(NodeStatus::kParseError));
    EXPECT_TRUE(DecodeValue(json::parse("42")).error().Is(NodeStatus::kParseError));
    EXPECT_TRUE(DecodeObjectIdentifier(json::parse(R"(["no-such-type", 1])")).error().Is(NodeStatus::kParseError));
    EXPECT_TRUE(DecodeObjectIdentifier(json::parse(R"(["analog-value"])")).error().Is(NodeStatus::kParseError));
}

// =============================================================================
// Documents
// =============================================================================

TEST(BackupCodec, SerializeThenParseReproducesBackup) {
    const auto backup = SampleBackup();
    auto parsed = Parse(Serialize(backup));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, backup);
}

TEST(BackupCodec, DocumentUsesNamedKeys) {
    const auto document = Encode(SampleBackup());
    EXPECT_EQ(document["config"]["device-id"], 4242);
    EXPECT_EQ(document["tunables"]["seg-window"], 8);
    ASSERT_EQ(document["objects"].size(), 2u);
    EXPECT_EQ(document["objects"][0]["properties"]["present-value"], json::parse(R"({"real": 72.5})"));
}

TEST(BackupCodec, ObjectsSectionIsOptional) {
    auto parsed = Parse(ValidDocumentWith(""));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->config.deviceId, 10u);
    EXPECT_TRUE(parsed->objects.empty());
}

TEST(BackupCodec, NumericPropertyKeyIsAccepted) {
    auto parsed = Parse(ValidDocumentWith(
        R"(, "objects": [{"object-identifier": ["analog-value", 1],
                          "properties": {"5000": {"unsigned": 1}}}])"));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->objects.size(), 1u);
    EXPECT_NE(parsed->objects.front().Find(static_cast<PropertyId>(5000)), nullptr);
}

TEST(BackupCodec, InvalidJsonIsParseError) {
    auto parsed = Parse("{\"config\": ");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_TRUE(parsed.error().Is(NodeStatus::kParseError));
}

TEST(BackupCodec, MissingSectionsAreParseErrors) {
    EXPECT_TRUE(Parse("{}").error().Is(NodeStatus::kParseError));
    EXPECT_TRUE(Parse("[]").error().Is(NodeStatus::kParseError));

    auto document = Encode(SampleBackup());
    document["config"].erase("port");
    EXPECT_TRUE(Parse(document.dump()).error().Is(NodeStatus::kParseError));

    document = Encode(SampleBackup());
    document.erase("tunables");
    EXPECT_TRUE(Parse(document.dump()).error().Is(NodeStatus::kParseError));
}

TEST(BackupCodec, UnknownPropertyKeyIsParseError) {
    auto parsed = Parse(ValidDocumentWith(
        R"(, "objects": [{"object-identifier": ["analog-value", 1],
                          "properties": {"present-valu": {"real": 1.0}}}])"));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_TRUE(parsed.error().Is(NodeStatus::kParseError));
}
