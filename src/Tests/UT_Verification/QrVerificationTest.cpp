//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Components/Verification/Messages.hpp"
#include "Components/Verification/QrCode.hpp"
#include "Components/Verification/QrVerifier.hpp"
#include "Components/Verification/Request.hpp"
#include "Components/Verification/Service.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Verification::Cancellation const* GetCancellation(std::shared_future<Verification::Outcome> const& future);
[[nodiscard]] bool IsVerified(std::shared_future<Verification::Outcome> const& future);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class QrVerificationSuite : public testing::Test
{
protected:
    QrVerificationSuite()
        : m_clock()
        , m_network(m_clock)
        , m_alice(m_network, m_clock, Verification::Test::AliceLaptop, 0x01)
        , m_bob(m_network, m_clock, Verification::Test::BobDesktop, 0x21)
    {
        Verification::Test::Introduce(m_alice, m_bob);
        m_alice.spStore->SetOwnMasterKeyTrusted(true);
    }

    Verification::Test::ManualClock m_clock;
    Verification::Test::Network m_network;
    Verification::Test::Party m_alice;
    Verification::Test::Party m_bob;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, CrossUserTest)
{
    using namespace Verification::Test;

    auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);

    // The code stays the same for the lifetime of the request.
    EXPECT_EQ(spShowing->GenerateQrCode(), optPayload);

    auto const optCode = Verification::QrCode::Decode(*optPayload);
    ASSERT_TRUE(optCode);
    EXPECT_EQ(optCode->GetMode(), Verification::QrCode::Mode::CrossUser);
    EXPECT_EQ(optCode->GetTransactionId(), spShowing->GetTransactionId());
    EXPECT_EQ(optCode->GetSecret().size(), m_alice.upService->GetSettings().qrSecretSize);
    EXPECT_EQ(Security::EncodeBase64(optCode->GetFirstKey()), m_alice.GetMasterKey());
    EXPECT_EQ(Security::EncodeBase64(optCode->GetSecondKey()), m_bob.GetMasterKey());

    EXPECT_FALSE(spScanning->ScanQrCode(*optPayload));
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Started);
    EXPECT_EQ(spScanning->GetChosenMethod(), Verification::Method::Reciprocate);

    auto const spScanner = spScanning->GetQrVerifier();
    ASSERT_TRUE(spScanner);
    EXPECT_EQ(spScanner->GetRole(), Verification::QrVerifier::Role::Scan);
    EXPECT_EQ(spScanner->GetState(), Verification::QrVerifier::State::AwaitingDone);
    EXPECT_TRUE(spScanner->IsStarter());
    EXPECT_TRUE(spScanner->HasKeyMaterial());
    EXPECT_EQ(m_bob.spTransport->CountSent(Verification::MessageType::Start), std::size_t{ 1 });
    EXPECT_EQ(m_bob.spTransport->CountSent(Verification::MessageType::Done), std::size_t{ 1 });

    m_network.Pump();
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Started);
    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);
    EXPECT_EQ(spShower->GetRole(), Verification::QrVerifier::Role::Show);
    EXPECT_EQ(spShower->GetState(), Verification::QrVerifier::State::AwaitingConfirmation);
    EXPECT_EQ(spShower->GetMode(), Verification::QrCode::Mode::CrossUser);
    EXPECT_FALSE(spShower->IsStarter());
    EXPECT_TRUE(spShower->GetReciprocatePresentation());
    EXPECT_FALSE(spScanner->GetReciprocatePresentation());

    // Nothing is trusted until the showing user confirms the scan.
    EXPECT_FALSE(m_alice.spStore->HasRecordedTrust());
    EXPECT_FALSE(m_bob.spStore->HasRecordedTrust());
    EXPECT_EQ(spScanner->Confirm(), Verification::Error::InvalidState);

    EXPECT_FALSE(spShower->Confirm());
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_TRUE(local::IsVerified(spShower->Verify()));

    m_network.Pump();
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Done);
    EXPECT_TRUE(local::IsVerified(spScanner->Verify()));
    EXPECT_FALSE(spScanner->HasKeyMaterial());

    EXPECT_TRUE(m_alice.spStore->IsMasterKeyVerified(BobUserId));
    EXPECT_FALSE(m_alice.spStore->IsDeviceVerified(BobDesktop));
    EXPECT_TRUE(m_bob.spStore->IsMasterKeyVerified(AliceUserId));
    EXPECT_FALSE(m_bob.spStore->IsDeviceVerified(AliceLaptop));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, ConfirmBeforeDoneTest)
{
    auto const [spShowing, spScanning] = Verification::Test::OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));

    // Only the start has been delivered, the scanner's done is still in flight.
    EXPECT_EQ(m_network.Pump(1), std::size_t{ 1 });
    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);

    // The showing device finishes on its own confirmation, the late done is dropped by the finished request.
    EXPECT_FALSE(spShower->Confirm());
    EXPECT_EQ(spShower->GetState(), Verification::QrVerifier::State::Finished);
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_TRUE(local::IsVerified(spShower->Verify()));

    m_network.Pump();
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Done);
    EXPECT_EQ(m_alice.spTransport->CountSent(Verification::MessageType::Cancel), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, MissingScannerDoneTest)
{
    using namespace Verification::Test;

    // The scanner's done never reaches the showing device.
    m_network.SetInterceptor([] (Network::Pending& pending) -> bool {
        return !(pending.type == Verification::MessageType::Done && pending.sender == BobDesktop);
    });

    auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));
    m_network.Pump();

    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);
    EXPECT_EQ(spShower->GetState(), Verification::QrVerifier::State::AwaitingConfirmation);

    auto const optPresentation = spShower->GetReciprocatePresentation();
    ASSERT_TRUE(optPresentation);
    EXPECT_EQ(optPresentation->otherUserId, BobUserId);
    EXPECT_EQ(optPresentation->otherDeviceId, BobDesktop.deviceId);

    // The user confirms through the callbacks handed to the interface.
    optPresentation->confirm();
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_TRUE(local::IsVerified(spShower->Verify()));
    EXPECT_FALSE(spShower->HasKeyMaterial());
    EXPECT_TRUE(m_alice.spStore->IsMasterKeyVerified(BobUserId));
    EXPECT_EQ(m_alice.spTransport->CountSent(Verification::MessageType::Done), std::size_t{ 1 });

    m_network.Pump();
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Done);
    EXPECT_TRUE(m_bob.spStore->IsMasterKeyVerified(AliceUserId));

    // Invoking the callbacks once the exchange has finished has no effect.
    optPresentation->cancel();
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_EQ(m_alice.spTransport->CountSent(Verification::MessageType::Cancel), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, ScanOnlyReadyTest)
{
    using namespace Verification::Test;

    // The counterparty advertises the scanning method alone, without the reciprocation method.
    m_network.SetInterceptor([] (Network::Pending& pending) -> bool {
        if (pending.type == Verification::MessageType::Ready) {
            pending.content["methods"] = boost::json::array{ "m.qr_code.scan.v1" };
        }
        return true;
    });

    auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Ready);
    EXPECT_EQ(m_alice.spTransport->CountSent(Verification::MessageType::Cancel), std::size_t{ 0 });

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    EXPECT_EQ(spShowing->ScanQrCode(*optPayload), Verification::Error::MethodUnsupported);

    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));
    m_network.Pump();

    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);
    EXPECT_FALSE(spShower->Confirm());
    m_network.Pump();

    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Done);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, DuplicateDoneTest)
{
    using namespace Verification::Test;

    auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));
    m_network.Pump();

    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);

    auto const optDone = m_bob.spTransport->GetLastSent(Verification::MessageType::Done);
    ASSERT_TRUE(optDone);

    Verification::Envelope envelope{};
    envelope.type = Verification::MessageType::Done;
    envelope.senderUserId = BobUserId;
    envelope.timestamp = m_clock.Now();
    envelope.content = optDone->content;
    m_alice.upService->HandleMessage(envelope);

    auto const pCancellation = local::GetCancellation(spShower->Verify());
    ASSERT_NE(pCancellation, nullptr);
    EXPECT_EQ(pCancellation->error, Verification::Error::Protocol);
    EXPECT_EQ(pCancellation->code, "m.unexpected_message");
    EXPECT_FALSE(m_alice.spStore->HasRecordedTrust());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, UntrustedMasterKeyTest)
{
    m_alice.spStore->SetOwnMasterKeyTrusted(false);

    auto const [spShowing, spScanning] = Verification::Test::OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    // A device can only vouch for another user with a master key it trusts.
    EXPECT_FALSE(spShowing->GenerateQrCode());
    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Ready);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, PhaseRequirementsTest)
{
    using namespace Verification::Test;

    auto const spShowing = m_alice.upService->RequestVerification(BobUserId);
    ASSERT_TRUE(spShowing);
    m_network.Pump();

    auto const spScanning = m_bob.upService->FindRequest(AliceUserId, spShowing->GetTransactionId());
    ASSERT_TRUE(spScanning);

    EXPECT_FALSE(spShowing->GenerateQrCode());
    EXPECT_FALSE(spScanning->GenerateQrCode());

    Security::Buffer const payload(64, 0x01);
    EXPECT_EQ(spScanning->ScanQrCode(payload), Verification::Error::InvalidState);
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Requested);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, InvalidPayloadTest)
{
    using namespace Verification::Test;

    {
        auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
        ASSERT_TRUE(spShowing && spScanning);

        Security::Buffer const payload(64, 0x01);
        EXPECT_EQ(spScanning->ScanQrCode(payload), Verification::Error::QrCodeInvalid);
        EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Cancelled);

        auto const optLocal = spScanning->GetCancellation();
        ASSERT_TRUE(optLocal);
        EXPECT_EQ(optLocal->error, Verification::Error::QrCodeInvalid);
        EXPECT_EQ(optLocal->code, "m.invalid_message");

        m_network.Pump();
        auto const optRemote = spShowing->GetCancellation();
        ASSERT_TRUE(optRemote);
        EXPECT_EQ(optRemote->error, Verification::Error::Protocol);
        EXPECT_TRUE(optRemote->isRemote);
    }

    {
        // A well formed code that was generated for a different transaction.
        auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
        ASSERT_TRUE(spShowing && spScanning);

        auto const optPayload = spShowing->GenerateQrCode();
        ASSERT_TRUE(optPayload);
        auto const optCode = Verification::QrCode::Decode(*optPayload);
        ASSERT_TRUE(optCode);

        Verification::QrCode const other{
            optCode->GetMode(), "kN7yRtX2QpL0aZc4", optCode->GetFirstKey(), optCode->GetSecondKey(), optCode->GetSecret() };
        auto const optOther = other.Encode();
        ASSERT_TRUE(optOther);

        EXPECT_EQ(spScanning->ScanQrCode(*optOther), Verification::Error::QrCodeInvalid);
        EXPECT_EQ(spScanning->GetCancellation()->error, Verification::Error::QrCodeInvalid);
        m_network.Drop();
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, ScannedKeyMismatchTest)
{
    using namespace Verification::Test;

    auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);

    // The scanning device holds a different master key for the showing user.
    m_bob.spStore->SetMasterKey(AliceUserId, GenerateEncodedKey(0x55));

    EXPECT_EQ(spScanning->ScanQrCode(*optPayload), Verification::Error::KeyMismatch);
    auto const optLocal = spScanning->GetCancellation();
    ASSERT_TRUE(optLocal);
    EXPECT_EQ(optLocal->error, Verification::Error::KeyMismatch);
    EXPECT_EQ(optLocal->code, "m.key_mismatch");
    EXPECT_FALSE(spScanning->GetQrVerifier());

    m_network.Pump();
    auto const optRemote = spShowing->GetCancellation();
    ASSERT_TRUE(optRemote);
    EXPECT_EQ(optRemote->error, Verification::Error::KeyMismatch);
    EXPECT_TRUE(optRemote->isRemote);
    EXPECT_FALSE(m_alice.spStore->HasRecordedTrust());
    EXPECT_FALSE(m_bob.spStore->HasRecordedTrust());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(QrVerificationSuite, ForgedSecretTest)
{
    using namespace Verification::Test;

    m_network.SetInterceptor([] (Network::Pending& pending) {
        if (pending.type == Verification::MessageType::Start) {
            Security::Buffer const forged(Configuration::Defaults::QrSecretSize, 0x00);
            pending.content["secret"] = Security::EncodeBase64(forged);
        }
        return true;
    });

    auto const [spShowing, spScanning] = OpenReadyRequests(m_network, m_alice, m_bob);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));
    auto const spScanner = spScanning->GetQrVerifier();
    ASSERT_TRUE(spScanner);

    m_network.Pump();

    auto const optLocal = spShowing->GetCancellation();
    ASSERT_TRUE(optLocal);
    EXPECT_EQ(optLocal->error, Verification::Error::KeyMismatch);
    EXPECT_EQ(optLocal->code, "m.key_mismatch");

    auto const pRemote = local::GetCancellation(spScanner->Verify());
    ASSERT_NE(pRemote, nullptr);
    EXPECT_EQ(pRemote->error, Verification::Error::KeyMismatch);
    EXPECT_TRUE(pRemote->isRemote);
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Cancelled);

    EXPECT_FALSE(m_alice.spStore->HasRecordedTrust());
    EXPECT_FALSE(m_bob.spStore->HasRecordedTrust());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrSelfVerificationSuite, TrustedShowerTest)
{
    using namespace Verification::Test;

    ManualClock clock;
    Network network{ clock };
    Party laptop{ network, clock, AliceLaptop, 0x01 };
    Party phone{ network, clock, AlicePhone, 0x41 };
    Introduce(laptop, phone);
    laptop.spStore->SetOwnMasterKeyTrusted(true);

    auto const [spShowing, spScanning] = OpenReadyRequests(network, laptop, phone);
    ASSERT_TRUE(spShowing && spScanning);
    EXPECT_TRUE(spShowing->IsSelfVerification());
    EXPECT_TRUE(spScanning->IsSelfVerification());

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    auto const optCode = Verification::QrCode::Decode(*optPayload);
    ASSERT_TRUE(optCode);
    EXPECT_EQ(optCode->GetMode(), Verification::QrCode::Mode::SelfTrusted);
    EXPECT_EQ(Security::EncodeBase64(optCode->GetFirstKey()), laptop.GetMasterKey());
    EXPECT_EQ(Security::EncodeBase64(optCode->GetSecondKey()), phone.GetDeviceKey());

    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));
    network.Pump();

    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);
    EXPECT_FALSE(spShower->Confirm());
    network.Pump();

    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Done);

    // The untrusted device learns that it may trust the master key, the trusted device vouches for the other device.
    EXPECT_TRUE(laptop.spStore->IsDeviceVerified(AlicePhone));
    EXPECT_FALSE(laptop.spStore->IsMasterKeyVerified(AliceUserId));
    EXPECT_TRUE(phone.spStore->IsDeviceVerified(AliceLaptop));
    EXPECT_TRUE(phone.spStore->IsMasterKeyVerified(AliceUserId));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(QrSelfVerificationSuite, UntrustedShowerTest)
{
    using namespace Verification::Test;

    ManualClock clock;
    Network network{ clock };
    Party laptop{ network, clock, AliceLaptop, 0x01 };
    Party phone{ network, clock, AlicePhone, 0x41 };
    Introduce(laptop, phone);
    laptop.spStore->SetOwnMasterKeyTrusted(true);

    auto const [spScanning, spShowing] = OpenReadyRequests(network, laptop, phone);
    ASSERT_TRUE(spShowing && spScanning);

    auto const optPayload = spShowing->GenerateQrCode();
    ASSERT_TRUE(optPayload);
    auto const optCode = Verification::QrCode::Decode(*optPayload);
    ASSERT_TRUE(optCode);
    EXPECT_EQ(optCode->GetMode(), Verification::QrCode::Mode::SelfUntrusted);
    EXPECT_EQ(Security::EncodeBase64(optCode->GetFirstKey()), phone.GetDeviceKey());
    EXPECT_EQ(Security::EncodeBase64(optCode->GetSecondKey()), phone.GetMasterKey());

    ASSERT_FALSE(spScanning->ScanQrCode(*optPayload));
    network.Pump();

    auto const spShower = spShowing->GetQrVerifier();
    ASSERT_TRUE(spShower);
    EXPECT_FALSE(spShower->Confirm());
    network.Pump();

    EXPECT_EQ(spShowing->GetPhase(), Verification::Phase::Done);
    EXPECT_EQ(spScanning->GetPhase(), Verification::Phase::Done);

    EXPECT_TRUE(phone.spStore->IsDeviceVerified(AliceLaptop));
    EXPECT_TRUE(phone.spStore->IsMasterKeyVerified(AliceUserId));
    EXPECT_TRUE(laptop.spStore->IsDeviceVerified(AlicePhone));
    EXPECT_FALSE(laptop.spStore->IsMasterKeyVerified(AliceUserId));
}

//----------------------------------------------------------------------------------------------------------------------

Verification::Cancellation const* local::GetCancellation(std::shared_future<Verification::Outcome> const& future)
{
    if (future.wait_for(std::chrono::seconds::zero()) != std::future_status::ready) { return nullptr; }
    return Verification::GetCancellation(future.get());
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsVerified(std::shared_future<Verification::Outcome> const& future)
{
    if (future.wait_for(std::chrono::seconds::zero()) != std::future_status::ready) { return false; }
    return Verification::IsVerified(future.get());
}

//----------------------------------------------------------------------------------------------------------------------
