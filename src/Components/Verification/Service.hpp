//----------------------------------------------------------------------------------------------------------------------
// File: Service.hpp
// Description: The entry point of the verification engine. The service opens outbound requests, routes inbound 
// messages to the request they belong to, and drives the request timeouts. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
#include "Request.hpp"
#include "RequestStore.hpp"
#include "VerificationDefinitions.hpp"
#include "Components/Event/Publisher.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

class IIdentityStore;
class IRandomSource;
class ITransport;

//----------------------------------------------------------------------------------------------------------------------
namespace Verification {
//----------------------------------------------------------------------------------------------------------------------

class Service;

//----------------------------------------------------------------------------------------------------------------------
} // Verification namespace
//----------------------------------------------------------------------------------------------------------------------

class Verification::Service
{
public:
    Service(
        std::shared_ptr<ITransport> const& spTransport,
        std::shared_ptr<IIdentityStore> const& spIdentityStore,
        std::shared_ptr<IRandomSource> const& spRandomSource,
        Settings const& settings,
        TimeUtils::Clock const& clock = TimeUtils::GetSystemTimepoint);

    ~Service();

    Service(Service const&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service const&) = delete;
    Service& operator=(Service&&) = delete;

    // Opens a direct request to the specified devices, or to every known device of the user when none are provided.
    [[nodiscard]] std::shared_ptr<Request> RequestVerification(
        std::string_view userId, std::vector<std::string> const& deviceIds = {});

    [[nodiscard]] std::shared_ptr<Request> RequestVerificationInRoom(std::string_view userId, std::string_view roomId);

    // Opens a direct request to the local user's other devices.
    [[nodiscard]] std::shared_ptr<Request> RequestOwnUserVerification();

    void HandleMessage(Envelope const& envelope);

    [[nodiscard]] std::shared_ptr<Request> FindRequest(std::string_view userId, std::string_view transactionId) const;
    [[nodiscard]] std::shared_ptr<Request> FindRequest(std::string_view transactionId) const;
    [[nodiscard]] RequestStore::Requests GetRequestsInProgress(std::string_view userId) const;
    [[nodiscard]] std::size_t GetRequestCount() const;

    [[nodiscard]] Settings const& GetSettings() const;
    [[nodiscard]] Event::Publisher& GetPublisher();

    // Expires the requests whose window has elapsed and evicts the requests past their retention period.
    std::size_t Execute();

    // Cancels every live request locally and releases all requests.
    void Teardown();

private:
    [[nodiscard]] std::shared_ptr<Request> OpenRequest(
        std::string_view userId, std::optional<std::string> const& optRoomId, std::vector<std::string> const& deviceIds);

    void OnRequest(Envelope const& envelope);
    [[nodiscard]] bool IsFresh(TimeUtils::Timepoint const& timestamp) const;

    Request::Context const m_context;
    RequestStore m_store;
    Event::Publisher m_publisher;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
