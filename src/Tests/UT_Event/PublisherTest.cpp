//----------------------------------------------------------------------------------------------------------------------
#include "Components/Event/Publisher.hpp"
#include "Components/Verification/VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class PublisherSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_upPublisher = std::make_unique<Event::Publisher>();
    }

    std::unique_ptr<Event::Publisher> m_upPublisher;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, PublishContentTest)
{
    using Verification::Phase;

    std::vector<std::pair<Phase, Phase>> transitions;
    m_upPublisher->Subscribe<Event::Type::PhaseChanged>(
        [&transitions] (Phase previous, Phase current) { transitions.emplace_back(previous, current); });

    EXPECT_TRUE(m_upPublisher->IsSubscribed(Event::Type::PhaseChanged));
    EXPECT_FALSE(m_upPublisher->IsSubscribed(Event::Type::VerifierCancelled));

    EXPECT_EQ(m_upPublisher->Publish<Event::Type::PhaseChanged>(Phase::Requested, Phase::Ready), std::size_t{ 1 });
    EXPECT_EQ(m_upPublisher->Publish<Event::Type::PhaseChanged>(Phase::Ready, Phase::Started), std::size_t{ 1 });

    ASSERT_EQ(transitions.size(), std::size_t{ 2 });
    EXPECT_EQ(transitions[0], std::make_pair(Phase::Requested, Phase::Ready));
    EXPECT_EQ(transitions[1], std::make_pair(Phase::Ready, Phase::Started));

    // Events without listeners are dropped.
    auto const cancellation = Verification::CreateCancellation(Verification::CancelCode::Timeout);
    EXPECT_EQ(m_upPublisher->Publish<Event::Type::VerifierCancelled>(cancellation), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, SubscriptionOrderTest)
{
    std::vector<std::size_t> invoked;
    for (std::size_t idx = 0; idx < 3; ++idx) {
        m_upPublisher->Subscribe<Event::Type::VerifierCancelled>(
            [&invoked, idx] (Verification::Cancellation const&) { invoked.emplace_back(idx); });
    }
    EXPECT_EQ(m_upPublisher->ListenerCount(), std::size_t{ 3 });

    auto const cancellation = Verification::CreateCancellation(Verification::CancelCode::User);
    EXPECT_EQ(m_upPublisher->Publish<Event::Type::VerifierCancelled>(cancellation), std::size_t{ 3 });
    EXPECT_EQ(invoked, (std::vector<std::size_t>{ 0, 1, 2 }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, UnsubscribeTest)
{
    std::size_t first = 0;
    std::size_t second = 0;
    auto const firstToken = m_upPublisher->Subscribe<Event::Type::RequestReceived>(
        [&first] (std::shared_ptr<Verification::Request> const&) { ++first; });
    auto const secondToken = m_upPublisher->Subscribe<Event::Type::RequestReceived>(
        [&second] (std::shared_ptr<Verification::Request> const&) { ++second; });
    EXPECT_NE(firstToken, secondToken);

    std::shared_ptr<Verification::Request> const spRequest;
    EXPECT_EQ(m_upPublisher->Publish<Event::Type::RequestReceived>(spRequest), std::size_t{ 2 });

    EXPECT_TRUE(m_upPublisher->Unsubscribe(firstToken));
    EXPECT_FALSE(m_upPublisher->Unsubscribe(firstToken));
    EXPECT_EQ(m_upPublisher->Publish<Event::Type::RequestReceived>(spRequest), std::size_t{ 1 });
    EXPECT_EQ(first, std::size_t{ 1 });
    EXPECT_EQ(second, std::size_t{ 2 });

    EXPECT_TRUE(m_upPublisher->Unsubscribe(secondToken));
    EXPECT_FALSE(m_upPublisher->IsSubscribed(Event::Type::RequestReceived));
    EXPECT_EQ(m_upPublisher->ListenerCount(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, SubscribeDuringDispatchTest)
{
    using Verification::Phase;

    // Changes made by a listener take effect for the next event.
    std::size_t late = 0;
    std::optional<Event::SubscriptionToken> optSelf;
    optSelf = m_upPublisher->Subscribe<Event::Type::PhaseChanged>([&] (Phase, Phase) {
        m_upPublisher->Subscribe<Event::Type::PhaseChanged>([&late] (Phase, Phase) { ++late; });
        if (optSelf) { EXPECT_TRUE(m_upPublisher->Unsubscribe(*optSelf)); }
    });

    EXPECT_EQ(m_upPublisher->Publish<Event::Type::PhaseChanged>(Phase::Requested, Phase::Ready), std::size_t{ 1 });
    EXPECT_EQ(late, std::size_t{ 0 });

    EXPECT_EQ(m_upPublisher->Publish<Event::Type::PhaseChanged>(Phase::Ready, Phase::Done), std::size_t{ 1 });
    EXPECT_EQ(late, std::size_t{ 1 });
    EXPECT_EQ(m_upPublisher->ListenerCount(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(PublisherSuite, ClearTest)
{
    std::size_t invoked = 0;
    m_upPublisher->Subscribe<Event::Type::ShowSas>(
        [&invoked] (Verification::SasPresentation const&) { ++invoked; });
    m_upPublisher->Subscribe<Event::Type::ShowReciprocate>(
        [&invoked] (Verification::ReciprocatePresentation const&) { ++invoked; });
    EXPECT_EQ(m_upPublisher->ListenerCount(), std::size_t{ 2 });

    m_upPublisher->Clear();
    EXPECT_EQ(m_upPublisher->ListenerCount(), std::size_t{ 0 });
    EXPECT_FALSE(m_upPublisher->IsSubscribed(Event::Type::ShowSas));

    Verification::ReciprocatePresentation const presentation{ "@bob:example.org", "BOBDESKTOP", {}, {} };
    EXPECT_EQ(m_upPublisher->Publish<Event::Type::ShowReciprocate>(presentation), std::size_t{ 0 });
    EXPECT_EQ(invoked, std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------
