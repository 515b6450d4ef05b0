//----------------------------------------------------------------------------------------------------------------------
// File: RequestStore.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "RequestStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/tuple/tuple.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

Verification::RequestStore::RequestStore()
    : m_mutex()
    , m_requests()
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::RequestStore::Insert(std::shared_ptr<Request> const& spRequest)
{
    assert(spRequest);
    std::scoped_lock lock{ m_mutex };
    auto const [itr, emplaced] = m_requests.emplace(spRequest);
    return emplaced;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::RequestStore::Find(
    std::string_view userId, std::string_view transactionId) const
{
    std::shared_lock lock{ m_mutex };
    auto const& index = m_requests.get<CounterpartyTransactionIndex>();
    if (auto const itr = index.find(boost::make_tuple(std::string{ userId }, std::string{ transactionId }));
        itr != index.end()) {
        return *itr;
    }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Verification::Request> Verification::RequestStore::Find(std::string_view transactionId) const
{
    std::shared_lock lock{ m_mutex };
    auto const& index = m_requests.get<TransactionIndex>();
    if (auto const itr = index.find(std::string{ transactionId }); itr != index.end()) { return *itr; }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::RequestStore::Requests Verification::RequestStore::FindByCounterparty(
    std::string_view userId, Predicate const& predicate) const
{
    // The requests are copied out such that the predicate never runs under the store's lock. 
    Requests candidates;
    {
        std::shared_lock lock{ m_mutex };
        auto const [begin, end] = m_requests.get<CounterpartyIndex>().equal_range(std::string{ userId });
        candidates.assign(begin, end);
    }

    if (!predicate) { return candidates; }

    Requests matches;
    for (auto const& spRequest : candidates) {
        if (predicate(*spRequest)) { matches.emplace_back(spRequest); }
    }
    return matches;
}

//----------------------------------------------------------------------------------------------------------------------

Verification::RequestStore::Requests Verification::RequestStore::GetRequests() const
{
    std::shared_lock lock{ m_mutex };
    return Requests{ m_requests.begin(), m_requests.end() };
}

//----------------------------------------------------------------------------------------------------------------------

bool Verification::RequestStore::Erase(std::string_view userId, std::string_view transactionId)
{
    // A released request is destroyed after the store's lock has been dropped.
    std::shared_ptr<Request> spReleased;
    {
        std::scoped_lock lock{ m_mutex };
        auto& index = m_requests.get<CounterpartyTransactionIndex>();
        auto const itr = index.find(boost::make_tuple(std::string{ userId }, std::string{ transactionId }));
        if (itr == index.end()) { return false; }
        spReleased = *itr;
        index.erase(itr);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Verification::RequestStore::EvictExpired(TimeUtils::Timepoint const& now)
{
    // Requests take their own lock when queried, the store's lock is not held while they are inspected. 
    Requests expired;
    for (auto const& spRequest : GetRequests()) {
        if (spRequest->IsExpired(now)) { expired.emplace_back(spRequest); }
    }

    if (expired.empty()) { return 0; }

    std::size_t evicted = 0;
    std::scoped_lock lock{ m_mutex };
    auto& index = m_requests.get<CounterpartyTransactionIndex>();
    for (auto const& spRequest : expired) {
        evicted += index.erase(boost::make_tuple(spRequest->GetOtherUserId(), spRequest->GetTransactionId()));
    }
    return evicted;
}

//----------------------------------------------------------------------------------------------------------------------

void Verification::RequestStore::Clear()
{
    RequestMap released;
    std::scoped_lock lock{ m_mutex };
    released.swap(m_requests);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Verification::RequestStore::Size() const
{
    std::shared_lock lock{ m_mutex };
    return m_requests.size();
}

//----------------------------------------------------------------------------------------------------------------------
