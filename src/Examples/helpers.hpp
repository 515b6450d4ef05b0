//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Identifier/Identifier.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Components/Verification/Messages.hpp"
#include "Components/Verification/Service.hpp"
#include "Interfaces/IdentityStore.hpp"
#include "Interfaces/Transport.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Examples {
//----------------------------------------------------------------------------------------------------------------------

class LoopbackBus;
class LoopbackTransport;
class MemoryIdentityStore;

[[nodiscard]] std::shared_ptr<spdlog::logger> GenerateLogger(std::string_view executable);
[[nodiscard]] std::optional<Security::EncodedKey> GenerateEncodedKey();

//----------------------------------------------------------------------------------------------------------------------
} // Examples namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Carries the messages of every attached device within the process. Messages are queued when sent and
// delivered in order when the bus is pumped, so no handler runs while another one is still on the stack.
//----------------------------------------------------------------------------------------------------------------------
class Examples::LoopbackBus
{
public:
    void Attach(Identifier::Device const& device, Verification::Service* pService)
    {
        std::scoped_lock lock{ m_mutex };
        m_services[device] = pService;
    }

    void Enqueue(Identifier::Device const& sender, ITransport::Destination const& destination,
        Verification::MessageType type, boost::json::object const& content)
    {
        std::scoped_lock lock{ m_mutex };
        m_pending.emplace_back(Pending{ sender, destination, type, content });
    }

    std::size_t Pump()
    {
        std::size_t delivered = 0;
        while (auto optPending = Next()) {
            Deliver(*optPending);
            ++delivered;
        }
        return delivered;
    }

private:
    struct Pending
    {
        Identifier::Device sender;
        ITransport::Destination destination;
        Verification::MessageType type;
        boost::json::object content;
    };

    [[nodiscard]] std::optional<Pending> Next()
    {
        std::scoped_lock lock{ m_mutex };
        if (m_pending.empty()) { return {}; }
        auto pending = std::move(m_pending.front());
        m_pending.pop_front();
        return pending;
    }

    void Deliver(Pending const& pending)
    {
        Verification::Envelope envelope{};
        envelope.type = pending.type;
        envelope.senderUserId = pending.sender.userId;
        envelope.roomId = pending.destination.roomId;
        envelope.timestamp = TimeUtils::GetSystemTimepoint();
        envelope.content = pending.content;

        std::map<Identifier::Device, Verification::Service*> services;
        {
            std::scoped_lock lock{ m_mutex };
            services = m_services;
        }

        for (auto const& [device, pService] : services) {
            if (device == pending.sender || device.userId != pending.destination.userId) { continue; }
            if (!pending.destination.roomId && device.deviceId != pending.destination.deviceId) { continue; }
            pService->HandleMessage(envelope);
        }
    }

    mutable std::mutex m_mutex;
    std::deque<Pending> m_pending;
    std::map<Identifier::Device, Verification::Service*> m_services;
};

//----------------------------------------------------------------------------------------------------------------------

class Examples::LoopbackTransport : public ITransport
{
public:
    LoopbackTransport(LoopbackBus& bus, Identifier::Device const& self) : m_bus(bus), m_self(self) {}

    // ITransport {
    [[nodiscard]] virtual bool Send(
        Destination const& destination, Verification::MessageType type, boost::json::object const& content) override
    {
        m_bus.Enqueue(m_self, destination, type, content);
        return true;
    }
    // } ITransport

private:
    LoopbackBus& m_bus;
    Identifier::Device const m_self;
};

//----------------------------------------------------------------------------------------------------------------------

class Examples::MemoryIdentityStore : public IIdentityStore
{
public:
    explicit MemoryIdentityStore(Identifier::Device const& self) 
        : m_mutex()
        , m_self(self)
        , m_devices()
        , m_masterKeys()
        , m_trusted()
    {
    }

    // IIdentityStore {
    [[nodiscard]] virtual Identifier::Device const& GetOwnDevice() const override { return m_self; }

    [[nodiscard]] virtual std::vector<std::string> GetDeviceIds(std::string_view userId) const override
    {
        std::scoped_lock lock{ m_mutex };
        std::vector<std::string> deviceIds;
        for (auto const& [device, key] : m_devices) {
            if (device.userId == userId) { deviceIds.emplace_back(device.deviceId); }
        }
        return deviceIds;
    }

    [[nodiscard]] virtual std::optional<Security::EncodedKey> GetDeviceKey(
        std::string_view userId, std::string_view deviceId) const override
    {
        std::scoped_lock lock{ m_mutex };
        auto const itr = m_devices.find(Identifier::Device{ std::string{ userId }, std::string{ deviceId } });
        if (itr == m_devices.end()) { return {}; }
        return itr->second;
    }

    [[nodiscard]] virtual std::optional<Security::EncodedKey> GetMasterKey(std::string_view userId) const override
    {
        std::scoped_lock lock{ m_mutex };
        auto const itr = m_masterKeys.find(std::string{ userId });
        if (itr == m_masterKeys.end()) { return {}; }
        return itr->second;
    }

    [[nodiscard]] virtual bool IsOwnMasterKeyTrusted() const override { return false; }

    [[nodiscard]] virtual bool MarkDeviceVerified(std::string_view userId, std::string_view deviceId) override
    {
        std::scoped_lock lock{ m_mutex };
        m_trusted.emplace(Identifier::CreateDeviceKeyIdentifier(deviceId) + " of " + std::string{ userId });
        return true;
    }

    [[nodiscard]] virtual bool MarkMasterKeyVerified(std::string_view userId) override
    {
        std::scoped_lock lock{ m_mutex };
        m_trusted.emplace("master key of " + std::string{ userId });
        return true;
    }
    // } IIdentityStore

    void AddDevice(Identifier::Device const& device, Security::EncodedKey const& key)
    {
        std::scoped_lock lock{ m_mutex };
        m_devices[device] = key;
    }

    void SetMasterKey(std::string_view userId, Security::EncodedKey const& key)
    {
        std::scoped_lock lock{ m_mutex };
        m_masterKeys[std::string{ userId }] = key;
    }

    [[nodiscard]] std::set<std::string> GetTrusted() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_trusted;
    }

private:
    mutable std::mutex m_mutex;
    Identifier::Device const m_self;
    std::map<Identifier::Device, Security::EncodedKey> m_devices;
    std::map<std::string, Security::EncodedKey> m_masterKeys;
    std::set<std::string> m_trusted;
};

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::logger> Examples::GenerateLogger(std::string_view executable)
{
    constexpr std::string_view Prefix = "==";
    constexpr std::string_view TagOpen = "[";
    constexpr std::string_view TagClose = "]";
    constexpr std::string_view TagSeperator = " ";
    constexpr std::string_view Date = "[%a, %d %b %Y %T]";
    constexpr std::string_view Message = "%^[%l] - %v%$";

    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    for (auto const& tag : { std::string_view{ "examples" }, executable }) {
        oss << TagOpen << tag << TagClose << TagSeperator;
    }
    oss << Message;

    auto const logger = std::make_shared<spdlog::logger>("examples");
    auto const sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    sink->set_pattern(oss.str());
    logger->sinks().emplace_back(sink);

    spdlog::register_logger(logger);
    logger->set_level(spdlog::level::trace);

    return logger;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<Security::EncodedKey> Examples::GenerateEncodedKey()
{
    auto const optKey = Security::GenerateRandomData(Security::Ed25519KeySize);
    if (!optKey) { return {}; }
    return Security::EncodeBase64(*optKey);
}

//----------------------------------------------------------------------------------------------------------------------
