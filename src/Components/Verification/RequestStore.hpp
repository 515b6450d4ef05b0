//----------------------------------------------------------------------------------------------------------------------
// File: RequestStore.hpp
// Description: Tracks the live and recently finished verification requests. Requests are indexed by the pair of the 
// counterparty and the transaction, by the transaction alone, and by the counterparty. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Request.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/tag.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class RequestStore;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::RequestStore
{
public:
    using Requests = std::vector<std::shared_ptr<Request>>;
    using Predicate = std::function<bool(Request const&)>;

    RequestStore();

    RequestStore(RequestStore const&) = delete;
    RequestStore& operator=(RequestStore const&) = delete;

    // Returns false when a request for the same counterparty and transaction is already tracked.
    [[nodiscard]] bool Insert(std::shared_ptr<Request> const& spRequest);

    [[nodiscard]] std::shared_ptr<Request> Find(std::string_view userId, std::string_view transactionId) const;

    // Transaction identifiers are only unique per counterparty, the first match is returned. 
    [[nodiscard]] std::shared_ptr<Request> Find(std::string_view transactionId) const;

    [[nodiscard]] Requests FindByCounterparty(std::string_view userId, Predicate const& predicate = {}) const;
    [[nodiscard]] Requests GetRequests() const;

    bool Erase(std::string_view userId, std::string_view transactionId);

    // Removes the requests that have been terminal for longer than their retention period.
    std::size_t EvictExpired(TimeUtils::Timepoint const& now);

    void Clear();
    [[nodiscard]] std::size_t Size() const;

private:
    struct CounterpartyTransactionIndex {};
    struct TransactionIndex {};
    struct CounterpartyIndex {};

    using TransactionKey = boost::multi_index::const_mem_fun<
        Request, std::string const&, &Request::GetTransactionId>;
    using CounterpartyKey = boost::multi_index::const_mem_fun<
        Request, std::string const&, &Request::GetOtherUserId>;

    using RequestMap = boost::multi_index_container<
        std::shared_ptr<Request>,
        boost::multi_index::indexed_by<
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<CounterpartyTransactionIndex>,
                boost::multi_index::composite_key<std::shared_ptr<Request>, CounterpartyKey, TransactionKey>>,
            boost::multi_index::hashed_non_unique<boost::multi_index::tag<TransactionIndex>, TransactionKey>,
            boost::multi_index::hashed_non_unique<boost::multi_index::tag<CounterpartyIndex>, CounterpartyKey>>>;

    mutable std::shared_mutex m_mutex;
    RequestMap m_requests;
};

//----------------------------------------------------------------------------------------------------------------------
