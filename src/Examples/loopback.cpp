//----------------------------------------------------------------------------------------------------------------------
#include "helpers.hpp"
#include "StartupOptions.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Security/RandomSource.hpp"
#include "Components/Verification/Request.hpp"
#include "Components/Verification/SasVerifier.hpp"
#include "Components/Verification/Service.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

struct Party;

[[nodiscard]] std::unique_ptr<Party> CreateParty(
    Examples::LoopbackBus& bus, Identifier::Device const& device, Verification::Settings const& settings);

void Introduce(Party& first, Party& second);

[[nodiscard]] std::string FormatDecimals(Verification::Decimals const& decimals);
[[nodiscard]] std::string FormatEmojis(std::optional<Verification::Emojis> const& optEmojis);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace defaults {
//----------------------------------------------------------------------------------------------------------------------

Identifier::Device const Alice{ "@alice:example.org", "ALICELAPTOP" };
Identifier::Device const Bob{ "@bob:example.org", "BOBDESKTOP" };

//----------------------------------------------------------------------------------------------------------------------
} // defaults namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

struct local::Party
{
    Identifier::Device device;
    Security::EncodedKey deviceKey;
    Security::EncodedKey masterKey;
    std::shared_ptr<Examples::MemoryIdentityStore> spStore;
    std::unique_ptr<Verification::Service> upService;
    std::vector<Verification::SasPresentation> presentations;
};

//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    Startup::Options options;
    if (auto const result = options.Parse(argc, argv); result != Startup::ParseCode::Success) {
        return (result == Startup::ParseCode::ExitRequested) ? 0 : 1;
    }

    auto const logger = Examples::GenerateLogger("loopback");
    logger->set_level(options.GetVerbosity());

    Configuration::Parser parser{ std::filesystem::path{ options.GetConfigPath() }, options };
    if (auto const [status, message] = parser.FetchOptions(); status != Configuration::StatusCode::Success) {
        if (status != Configuration::StatusCode::FileError || std::filesystem::exists(parser.GetFilepath())) {
            logger->error("Failed to read the configuration! Reason: {}", message);
            return 1;
        }

        logger->info("Generating a default configuration file at: {}.", parser.GetFilepath().string());
        if (auto const [written, reason] = parser.Serialize(); written != Configuration::StatusCode::Success) {
            logger->error("Failed to write the configuration! Reason: {}", reason);
            return 1;
        }
    }

    Logger::Initialize(parser.GetVerbosity(), parser.UseStdOutSink());

    auto const settings = parser.GetVerificationSettings();
    Examples::LoopbackBus bus;
    auto const upAlice = local::CreateParty(bus, defaults::Alice, settings);
    auto const upBob = local::CreateParty(bus, defaults::Bob, settings);
    if (!upAlice || !upBob) {
        logger->error("Failed to generate the device keys!");
        return 1;
    }

    local::Introduce(*upAlice, *upBob);

    // Bob's device surfaces the incoming request and starts listening for the handshake once it begins.
    std::shared_ptr<Verification::Request> spInbound;
    upBob->upService->GetPublisher().Subscribe<Event::Type::RequestReceived>(
        [&] (std::shared_ptr<Verification::Request> const& spRequest) {
            logger->info("{} received a verification request from {}.", upBob->device.userId, spRequest->GetOtherUserId());
            spInbound = spRequest;
            spInbound->GetPublisher().Subscribe<Event::Type::PhaseChanged>(
                [&] (Verification::Phase, Verification::Phase current) {
                    if (current != Verification::Phase::Started) { return; }
                    if (auto const spVerifier = spInbound->GetSasVerifier(); spVerifier) {
                        spVerifier->GetPublisher().Subscribe<Event::Type::ShowSas>(
                            [&] (Verification::SasPresentation const& presentation) {
                                upBob->presentations.emplace_back(presentation);
                            });
                    }
                });
        });

    auto const spOutbound = upAlice->upService->RequestVerification(defaults::Bob.userId, { defaults::Bob.deviceId });
    if (!spOutbound) {
        logger->error("Failed to send the verification request!");
        return 1;
    }

    bus.Pump();
    if (!spInbound) {
        logger->error("The verification request was not delivered!");
        return 1;
    }

    if (auto const optError = spInbound->Accept().get(); optError) {
        logger->error("Failed to accept the verification request! Reason: {}", Verification::ToString(*optError));
        return 1;
    }

    bus.Pump();
    if (spOutbound->GetPhase() != Verification::Phase::Ready) {
        logger->error("The verification request was not accepted!");
        return 1;
    }

    if (auto const optError = spOutbound->BeginVerification(Verification::Method::Sas); optError) {
        logger->error("Failed to start the verification! Reason: {}", Verification::ToString(*optError));
        return 1;
    }

    auto const spInitiator = spOutbound->GetSasVerifier();
    if (!spInitiator) {
        logger->error("The verification did not start!");
        return 1;
    }

    spInitiator->GetPublisher().Subscribe<Event::Type::ShowSas>(
        [&] (Verification::SasPresentation const& presentation) { upAlice->presentations.emplace_back(presentation); });

    bus.Pump();
    if (upAlice->presentations.empty() || upBob->presentations.empty()) {
        logger->error("The short authentication strings were not presented!");
        return 1;
    }

    // Both users compare the strings shown on their screens before confirming.
    for (auto const* pParty : { upAlice.get(), upBob.get() }) {
        auto const& presentation = pParty->presentations.front();
        logger->info("{} sees {}", pParty->device.deviceId, local::FormatDecimals(presentation.decimals));
        logger->info("{} sees {}", pParty->device.deviceId, local::FormatEmojis(presentation.emojis));
    }

    bool const matched = upAlice->presentations.front().decimals == upBob->presentations.front().decimals;
    for (auto const* pParty : { upAlice.get(), upBob.get() }) {
        auto const& presentation = pParty->presentations.front();
        if (matched) { presentation.confirm(); } else { presentation.mismatch(); }
    }

    bus.Pump();

    auto const outcome = spOutbound->GetCompletion().get();
    if (auto const pCancellation = Verification::GetCancellation(outcome); pCancellation) {
        logger->error(
            "The verification was cancelled with {}! Reason: {}",
            pCancellation->code, pCancellation->reason);
        return 1;
    }

    for (auto const* pParty : { upAlice.get(), upBob.get() }) {
        for (auto const& trusted : pParty->spStore->GetTrusted()) {
            logger->info("{} now trusts the {}.", pParty->device.deviceId, trusted);
        }
    }

    upAlice->upService->Teardown();
    upBob->upService->Teardown();

    logger->info("Verification complete.");
    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<local::Party> local::CreateParty(
    Examples::LoopbackBus& bus, Identifier::Device const& device, Verification::Settings const& settings)
{
    auto const optDeviceKey = Examples::GenerateEncodedKey();
    auto const optMasterKey = Examples::GenerateEncodedKey();
    if (!optDeviceKey || !optMasterKey) { return nullptr; }

    auto upParty = std::make_unique<Party>();
    upParty->device = device;
    upParty->deviceKey = *optDeviceKey;
    upParty->masterKey = *optMasterKey;
    upParty->spStore = std::make_shared<Examples::MemoryIdentityStore>(device);
    upParty->spStore->AddDevice(device, upParty->deviceKey);
    upParty->spStore->SetMasterKey(device.userId, upParty->masterKey);

    upParty->upService = std::make_unique<Verification::Service>(
        std::make_shared<Examples::LoopbackTransport>(bus, device),
        upParty->spStore,
        std::make_shared<Security::SystemRandomSource>(),
        settings);

    bus.Attach(device, upParty->upService.get());
    return upParty;
}

//----------------------------------------------------------------------------------------------------------------------

void local::Introduce(Party& first, Party& second)
{
    first.spStore->AddDevice(second.device, second.deviceKey);
    first.spStore->SetMasterKey(second.device.userId, second.masterKey);
    second.spStore->AddDevice(first.device, first.deviceKey);
    second.spStore->SetMasterKey(first.device.userId, first.masterKey);
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::FormatDecimals(Verification::Decimals const& decimals)
{
    std::ostringstream oss;
    for (auto const decimal : decimals) { oss << decimal << " "; }
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::FormatEmojis(std::optional<Verification::Emojis> const& optEmojis)
{
    if (!optEmojis) { return "no emojis"; }
    std::ostringstream oss;
    for (auto const& emoji : *optEmojis) { oss << emoji.symbol << " (" << emoji.description << ") "; }
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
