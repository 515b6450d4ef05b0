//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Verification/Request.hpp"
#include "Components/Verification/RequestStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view FirstTransactionId = "kN7yRtX2QpL0aZc4";
constexpr std::string_view SecondTransactionId = "Vb3mWq8sJd1eHf6u";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class RequestStoreSuite : public testing::Test
{
protected:
    RequestStoreSuite() : m_clock(), m_network(m_clock) {}

    void SetUp() override
    {
        using namespace Verification::Test;
        m_spTransport = std::make_shared<LoopbackTransport>(m_network, AliceLaptop);
        m_spIdentityStore = std::make_shared<FakeIdentityStore>(AliceLaptop);
        m_spRandomSource = std::make_shared<Security::SystemRandomSource>();
        m_context = Verification::Request::Context{
            m_spTransport, m_spIdentityStore, m_spRandomSource, CreateSettings(), m_clock.GetClock() };
    }

    [[nodiscard]] std::shared_ptr<Verification::Request> CreateRequest(
        std::string_view userId, std::string_view transactionId)
    {
        return std::make_shared<Verification::Request>(m_context, transactionId, userId, std::nullopt, true);
    }

    Verification::Test::ManualClock m_clock;
    Verification::Test::Network m_network;
    std::shared_ptr<Verification::Test::LoopbackTransport> m_spTransport;
    std::shared_ptr<Verification::Test::FakeIdentityStore> m_spIdentityStore;
    std::shared_ptr<Security::SystemRandomSource> m_spRandomSource;
    Verification::Request::Context m_context;
    Verification::RequestStore m_store;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RequestStoreSuite, InsertTest)
{
    using namespace Verification::Test;
    EXPECT_EQ(m_store.Size(), std::size_t{ 0 });

    auto const spRequest = CreateRequest(BobUserId, test::FirstTransactionId);
    EXPECT_TRUE(m_store.Insert(spRequest));
    EXPECT_EQ(m_store.Size(), std::size_t{ 1 });

    // The same transaction with the same counterparty is only tracked once.
    EXPECT_FALSE(m_store.Insert(spRequest));
    EXPECT_FALSE(m_store.Insert(CreateRequest(BobUserId, test::FirstTransactionId)));
    EXPECT_EQ(m_store.Size(), std::size_t{ 1 });

    // Transaction identifiers are scoped to the counterparty.
    EXPECT_TRUE(m_store.Insert(CreateRequest(AliceUserId, test::FirstTransactionId)));
    EXPECT_EQ(m_store.Size(), std::size_t{ 2 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RequestStoreSuite, FindTest)
{
    using namespace Verification::Test;
    auto const spFirst = CreateRequest(BobUserId, test::FirstTransactionId);
    auto const spSecond = CreateRequest(BobUserId, test::SecondTransactionId);
    ASSERT_TRUE(m_store.Insert(spFirst));
    ASSERT_TRUE(m_store.Insert(spSecond));

    EXPECT_EQ(m_store.Find(BobUserId, test::FirstTransactionId), spFirst);
    EXPECT_EQ(m_store.Find(BobUserId, test::SecondTransactionId), spSecond);
    EXPECT_EQ(m_store.Find(AliceUserId, test::FirstTransactionId), nullptr);
    EXPECT_EQ(m_store.Find(BobUserId, "unknown"), nullptr);

    EXPECT_EQ(m_store.Find(test::SecondTransactionId), spSecond);
    EXPECT_EQ(m_store.Find("unknown"), nullptr);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RequestStoreSuite, FindByCounterpartyTest)
{
    using namespace Verification::Test;
    auto const spFirst = CreateRequest(BobUserId, test::FirstTransactionId);
    auto const spSecond = CreateRequest(BobUserId, test::SecondTransactionId);
    auto const spOther = CreateRequest(AliceUserId, test::FirstTransactionId);
    ASSERT_TRUE(m_store.Insert(spFirst));
    ASSERT_TRUE(m_store.Insert(spSecond));
    ASSERT_TRUE(m_store.Insert(spOther));

    auto const requests = m_store.FindByCounterparty(BobUserId);
    EXPECT_EQ(requests.size(), std::size_t{ 2 });
    EXPECT_NE(std::ranges::find(requests, spFirst), requests.end());
    EXPECT_NE(std::ranges::find(requests, spSecond), requests.end());

    spFirst->Teardown();
    auto const live = m_store.FindByCounterparty(BobUserId, [] (Verification::Request const& request) {
        return !Verification::IsTerminal(request.GetPhase());
    });
    ASSERT_EQ(live.size(), std::size_t{ 1 });
    EXPECT_EQ(live.front(), spSecond);

    EXPECT_TRUE(m_store.FindByCounterparty("@carol:example.org").empty());
    EXPECT_EQ(m_store.GetRequests().size(), std::size_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RequestStoreSuite, EraseTest)
{
    using namespace Verification::Test;
    ASSERT_TRUE(m_store.Insert(CreateRequest(BobUserId, test::FirstTransactionId)));
    ASSERT_TRUE(m_store.Insert(CreateRequest(BobUserId, test::SecondTransactionId)));

    EXPECT_FALSE(m_store.Erase(AliceUserId, test::FirstTransactionId));
    EXPECT_TRUE(m_store.Erase(BobUserId, test::FirstTransactionId));
    EXPECT_FALSE(m_store.Erase(BobUserId, test::FirstTransactionId));
    EXPECT_EQ(m_store.Size(), std::size_t{ 1 });
    EXPECT_EQ(m_store.Find(test::FirstTransactionId), nullptr);

    m_store.Clear();
    EXPECT_EQ(m_store.Size(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(RequestStoreSuite, EvictExpiredTest)
{
    using namespace Verification::Test;
    auto const spFinished = CreateRequest(BobUserId, test::FirstTransactionId);
    auto const spLive = CreateRequest(BobUserId, test::SecondTransactionId);
    ASSERT_TRUE(m_store.Insert(spFinished));
    ASSERT_TRUE(m_store.Insert(spLive));

    spFinished->Teardown();
    EXPECT_EQ(spFinished->GetPhase(), Verification::Phase::Cancelled);

    // A terminal request is retained for the retention period so late messages still find it.
    auto const retention = m_context.settings.retentionPeriod;
    EXPECT_EQ(m_store.EvictExpired(m_clock.Now() + retention - std::chrono::milliseconds{ 1 }), std::size_t{ 0 });
    EXPECT_EQ(m_store.Size(), std::size_t{ 2 });

    EXPECT_EQ(m_store.EvictExpired(m_clock.Now() + retention), std::size_t{ 1 });
    EXPECT_EQ(m_store.Size(), std::size_t{ 1 });
    EXPECT_EQ(m_store.Find(BobUserId, test::FirstTransactionId), nullptr);
    EXPECT_EQ(m_store.Find(BobUserId, test::SecondTransactionId), spLive);

    // Live requests are never evicted, regardless of their age.
    EXPECT_EQ(m_store.EvictExpired(m_clock.Now() + std::chrono::hours{ 48 }), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------
