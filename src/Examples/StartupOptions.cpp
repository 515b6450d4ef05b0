//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Defaults.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsOptionSupplied(boost::program_options::variables_map const& options, std::string_view option);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
namespace defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ConfigurationFilepath = "verification.json";

//----------------------------------------------------------------------------------------------------------------------
} // defaults namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    boost::program_options::options_description general("General Options");
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };

        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    AddGeneralOption(
        Quiet.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Disables all output to the console.");

    m_descriptions.add(general);

    boost::program_options::options_description configuration("Configuration Options");
    auto AddConfigurationOption = configuration.add_options();

    // If the file does not exist, one holding the default settings is written in its place.
    {
        std::ostringstream oss;
        oss << "Set the configuration filepath. This may specify a complete filepath or ";
        oss << "directory. If a directory is specified \"verification.json\" is assumed.";
        AddConfigurationOption(
            ConfigurationFilepath.data(),
            boost::program_options::value(&m_configurationFilepath)->value_name("<filepath>")->default_value(
                std::string{ defaults::ConfigurationFilepath }),
            oss.str().c_str());
    }

    m_descriptions.add(configuration);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
{
    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);
        boost::program_options::notify(m_options);
    } catch (std::exception const& e) {
        std::cout << "An error occurred parsing startup options due to: " << e.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (local::IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (local::IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (local::IsOptionSupplied(m_options, Verbosity) && local::IsOptionSupplied(m_options, Quiet)) {
        std::cout << "Conflicting options '" << Verbosity << "' and '" << Quiet << "'." << std::endl;
        return ParseCode::Malformed;
    }

    if (local::IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (m_options[Quiet.data()].as<bool>()) { m_verbosity = spdlog::level::off; }

    if (m_configurationFilepath.empty()) {
        std::cout << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText(char** argv) const
{
    std::ostringstream oss;
    std::string const name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText(char** argv) const
{
    std::ostringstream oss;
    std::string const name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (vouch) " << Configuration::Defaults::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosity() const
{
    return m_verbosity;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetConfigPath() const
{
    return m_configurationFilepath;
}

//----------------------------------------------------------------------------------------------------------------------

Startup::Options::operator Configuration::Options::Runtime() const
{
    return { .verbosity = m_verbosity, .useStdOutSink = (m_verbosity != spdlog::level::off) };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsOptionSupplied(boost::program_options::variables_map const& options, std::string_view option)
{
    return options.count(option.data()) && !options[option.data()].defaulted();
}

//----------------------------------------------------------------------------------------------------------------------
