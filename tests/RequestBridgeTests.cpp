// RequestBridgeTests.cpp
// Blocking request/response over the callback transport:
//   - local preconditions fail before anything reaches the wire
//   - exactly one outcome per request, whoever completes first
//   - every response kind maps to its own outcome
//

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <thread>
#include <vector>

#include "Request/RequestBridge.hpp"
#include "SimNodeHarness.hpp"
#include "Transport/ProtocolCodes.hpp"
#include "mocks/MockLocalTransport.hpp"

using namespace BACN;
using namespace BACN::Request;
using namespace BACN::Testing;
using namespace std::chrono_literals;
using BACN::Transport::Mocks::MockLocalTransport;
using BACN::Transport::Mocks::MockTransportFactory;
using ::testing::_;
using ::testing::ByMove;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

// =============================================================================
// Mocked transport: preconditions and guard timer
// =============================================================================

class RequestBridgeMockTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto transport = std::make_unique<NiceMock<MockLocalTransport>>();
        transport_ = transport.get();
        std::unique_ptr<Transport::ILocalTransport> owned = std::move(transport);
        EXPECT_CALL(factory_, Create(_)).WillOnce(Return(ByMove(std::move(owned))));
        ASSERT_TRUE(node_.Create(TestOverrides()).has_value());
    }

    MockTransportFactory factory_;
    Device::LocalDeviceManager node_{factory_};
    RequestBridge bridge_{node_, BridgeParams{}};
    NiceMock<MockLocalTransport>* transport_{nullptr};
};

TEST_F(RequestBridgeMockTest, NotInitializedSendsNothing) {
    EXPECT_CALL(*transport_, GetRemoteDevice(_)).Times(0);
    EXPECT_CALL(*transport_, Send(_, _, _)).Times(0);

    auto result = bridge_.SendAndWait(1234, Transport::DeleteObjectRequest{});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(NodeStatus::kNotInitialized));
    EXPECT_FALSE(bridge_.LastResponse().has_value());
}

TEST_F(RequestBridgeMockTest, UnknownDeviceIsNotFoundWithoutSending) {
    ASSERT_TRUE(node_.Initialize().has_value());
    EXPECT_CALL(*transport_, GetRemoteDevice(1234)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*transport_, Send(_, _, _)).Times(0);

    auto result = bridge_.SendAndWait(1234, Transport::DeleteObjectRequest{});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(NodeStatus::kNotFound));
}

TEST_F(RequestBridgeMockTest, SendFailureIsReturnedAsError) {
    ASSERT_TRUE(node_.Initialize().has_value());
    Transport::RemoteDeviceInfo info;
    info.deviceId = 1234;
    EXPECT_CALL(*transport_, GetRemoteDevice(1234)).WillOnce(Return(info));
    EXPECT_CALL(*transport_, Send(_, _, _)).WillOnce(Return(BACN_ERROR_IO("socket closed")));

    auto result = bridge_.SendAndWait(1234, Transport::DeleteObjectRequest{});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(NodeStatus::kIOError));
}

TEST_F(RequestBridgeMockTest, GuardTimerCompletesWhenTransportNeverAnswers) {
    ASSERT_TRUE(node_.Initialize().has_value());
    Transport::RemoteDeviceInfo info;
    info.deviceId = 1234;
    Transport::CompletionCallback captured;
    EXPECT_CALL(*transport_, GetRemoteDevice(1234)).WillOnce(Return(info));
    EXPECT_CALL(*transport_, Send(_, _, _))
        .WillOnce(::testing::DoAll(SaveArg<2>(&captured), Return(Result<void>{})));

    const auto start = std::chrono::steady_clock::now();
    auto result = bridge_.SendAndWait(1234, Transport::DeleteObjectRequest{}, 30ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(KindOf(*result), OutcomeKind::Timeout);
    EXPECT_GE(elapsed, 30ms);

    // The transport finally answers: dropped, the outcome already went out.
    ASSERT_TRUE(static_cast<bool>(captured));
    captured(Transport::Ack{});
    ASSERT_TRUE(bridge_.LastResponse().has_value());
    EXPECT_TRUE(std::holds_alternative<Transport::TransportException>(*bridge_.LastResponse()));
}

TEST_F(RequestBridgeMockTest, CallbackFromTransportThreadCompletesRequest) {
    ASSERT_TRUE(node_.Initialize().has_value());
    Transport::RemoteDeviceInfo info;
    info.deviceId = 1234;
    std::thread responder;
    EXPECT_CALL(*transport_, GetRemoteDevice(1234)).WillOnce(Return(info));
    EXPECT_CALL(*transport_, Send(_, _, _))
        .WillOnce([&responder](const Transport::RemoteDeviceInfo&, const Transport::ConfirmedRequest&,
                               Transport::CompletionCallback callback) {
            responder = std::thread([callback] {
                std::this_thread::sleep_for(5ms);
                callback(Transport::RejectPdu{
                    static_cast<uint32_t>(Protocol::RejectReason::InvalidTag)});
            });
            return Result<void>{};
        });

    auto result = bridge_.SendAndWait(1234, Transport::DeleteObjectRequest{}, 2s);
    responder.join();

    ASSERT_TRUE(result.has_value());
    const auto* reject = std::get_if<Reject>(&*result);
    ASSERT_NE(reject, nullptr);
    EXPECT_EQ(reject->reason, Protocol::RejectReason::InvalidTag);
}

// =============================================================================
// Classification
// =============================================================================

TEST(RequestBridgeClassify, EachResponseKindHasItsOwnOutcome) {
    using namespace BACN::Transport;

    EXPECT_EQ(KindOf(RequestBridge::Classify(Ack{})), OutcomeKind::Success);
    EXPECT_EQ(KindOf(RequestBridge::Classify(AbortPdu{4})), OutcomeKind::Abort);
    EXPECT_EQ(KindOf(RequestBridge::Classify(RejectPdu{9})), OutcomeKind::Reject);
    EXPECT_EQ(KindOf(RequestBridge::Classify(ErrorPdu{2, 32})), OutcomeKind::Error);
    EXPECT_EQ(KindOf(RequestBridge::Classify(TransportException{"x"})), OutcomeKind::Timeout);

    auto error = RequestBridge::Classify(ErrorPdu{2, 32});
    const auto* remote = std::get_if<RemoteError>(&error);
    ASSERT_NE(remote, nullptr);
    EXPECT_EQ(remote->errorClass, Protocol::ErrorClass::Property);
    EXPECT_EQ(remote->errorCode, Protocol::ErrorCode::UnknownProperty);
    EXPECT_EQ(Describe(error), "error (property/unknown-property)");
}

// =============================================================================
// Simulated network
// =============================================================================

class RequestBridgeSimTest : public SimNodeTest {
protected:
    void SetUp() override {
        remote_ = AddRemote(network_, 1234);
        ASSERT_TRUE(remote_->AddObject(AnalogValue(1, 68.0)).has_value());
        BootNode();
        ASSERT_TRUE(node_.Current()->Endpoint().SendGlobalBroadcast(Transport::WhoIsRequest{}).has_value());
        network_.Flush();
    }

    std::shared_ptr<Transport::Sim::SimRemoteDevice> remote_;
    RequestBridge bridge_{node_};
};

TEST_F(RequestBridgeSimTest, AckCarriesPropertyMap) {
    auto result = bridge_.SendAndWait(
        1234, Transport::ReadPropertyMultipleRequest{{ObjectType::AnalogValue, 1}, {PropertyId::PresentValue}});
    ASSERT_TRUE(result.has_value());
    const auto* payload = ValueOf(*result);
    ASSERT_NE(payload, nullptr);
    const auto& map = std::get<PropertyMap>(*payload);
    EXPECT_EQ(map.at(PropertyId::PresentValue), PropertyValue(68.0));
}

TEST_F(RequestBridgeSimTest, SilentDeviceYieldsTimeoutOutcome) {
    remote_->ScriptFailure(Transport::ConfirmedService::ReadPropertyMultiple, Transport::Sim::Silence{});

    auto result = bridge_.SendAndWait(
        1234, Transport::ReadPropertyMultipleRequest{DeviceObject(1234), {PropertyId::All}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(KindOf(*result), OutcomeKind::Timeout);
}

TEST_F(RequestBridgeSimTest, LastResponseTracksMostRecentRequest) {
    remote_->ScriptFailure(Transport::ConfirmedService::DeleteObject,
                           Transport::AbortPdu{static_cast<uint32_t>(Protocol::AbortReason::OutOfResources)});

    auto result = bridge_.SendAndWait(1234, Transport::DeleteObjectRequest{{ObjectType::AnalogValue, 1}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(KindOf(*result), OutcomeKind::Abort);

    auto last = bridge_.LastResponse();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(Transport::Describe(*last), "abort out-of-resources");
}

// =============================================================================
// Concurrent callers
// =============================================================================

class RequestBridgeConcurrencyTest : public SimNodeTest {
protected:
    static constexpr DeviceId kFirstAnswering = 1001;
    static constexpr DeviceId kSilent = 1004;
    static constexpr DeviceId kAborting = 1005;
    static constexpr DeviceId kMissingProperty = 1006;

    void SetUp() override {
        for (DeviceId id = kFirstAnswering; id <= kMissingProperty; ++id) {
            auto remote = AddRemote(network_, id);
            const uint32_t instance = id - 1000;
            ASSERT_TRUE(remote->AddObject(AnalogValue(instance, static_cast<double>(instance))).has_value());
            if (id == kSilent) {
                remote->ScriptFailure(Transport::ConfirmedService::ReadPropertyMultiple,
                                      Transport::Sim::Silence{});
            } else if (id == kAborting) {
                remote->ScriptFailure(Transport::ConfirmedService::ReadPropertyMultiple,
                                      Transport::AbortPdu{static_cast<uint32_t>(Protocol::AbortReason::OutOfResources)});
            }
        }
        BootNode();
        ASSERT_TRUE(node_.Current()->Endpoint().SendGlobalBroadcast(Transport::WhoIsRequest{}).has_value());
        network_.Flush();
    }

    RequestBridge bridge_{node_};
};

TEST_F(RequestBridgeConcurrencyTest, EachCallerGetsItsOwnOutcome) {
    constexpr size_t kCallers = kMissingProperty - kFirstAnswering + 1;
    std::vector<std::optional<Result<RawOutcome>>> results(kCallers);
    std::vector<std::thread> callers;

    for (size_t i = 0; i < kCallers; ++i) {
        callers.emplace_back([this, i, &results] {
            const DeviceId id = kFirstAnswering + static_cast<DeviceId>(i);
            const ObjectIdentifier object{ObjectType::AnalogValue, id - 1000};
            const PropertyId property =
                id == kMissingProperty ? PropertyId::CovIncrement : PropertyId::PresentValue;
            results[i] = bridge_.SendAndWait(id, Transport::ReadPropertyMultipleRequest{object, {property}});
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    for (size_t i = 0; i < kCallers; ++i) {
        ASSERT_TRUE(results[i].has_value());
        ASSERT_TRUE(results[i]->has_value());
    }

    // Answering devices each return their own object's value.
    for (DeviceId id = kFirstAnswering; id < kSilent; ++id) {
        const auto& outcome = **results[id - kFirstAnswering];
        const auto* payload = ValueOf(outcome);
        ASSERT_NE(payload, nullptr) << "device " << id;
        const auto& map = std::get<PropertyMap>(*payload);
        EXPECT_EQ(map.at(PropertyId::PresentValue), PropertyValue(static_cast<double>(id - 1000)));
    }

    EXPECT_EQ(KindOf(**results[kSilent - kFirstAnswering]), OutcomeKind::Timeout);

    const auto* abort = std::get_if<Abort>(&**results[kAborting - kFirstAnswering]);
    ASSERT_NE(abort, nullptr);
    EXPECT_EQ(abort->reason, Protocol::AbortReason::OutOfResources);

    const auto* error = std::get_if<RemoteError>(&**results[kMissingProperty - kFirstAnswering]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->errorCode, Protocol::ErrorCode::UnknownProperty);
}
