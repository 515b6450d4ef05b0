//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: The shared logger used by every verification component. Components fetch the logger through Get()
// which guarantees a usable (possibly silent) logger even when the host never initialized logging.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Name = "vouch";
constexpr std::string_view Pattern = "== [%a, %d %b %Y %T] [%^%n%$] %^[%l] - %v%$";

namespace Color {

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";

} // Color namespace

void Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);
[[nodiscard]] std::shared_ptr<spdlog::logger> Get();

//----------------------------------------------------------------------------------------------------------------------
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    static std::mutex mutex;
    std::scoped_lock lock{ mutex };

    auto spLogger = spdlog::get(Name.data());
    if (!spLogger) {
        spLogger = std::make_shared<spdlog::logger>(Name.data());
        spdlog::register_logger(spLogger);
    }

    if (useStdOutSink && spLogger->sinks().empty()) {
        auto const spConsole = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        spConsole->set_color(spdlog::level::info, Color::Info);
        spConsole->set_color(spdlog::level::warn, Color::Warn);
        spConsole->set_color(spdlog::level::err, Color::Error);
        spConsole->set_color(spdlog::level::debug, Color::Debug);
        spConsole->set_pattern(Pattern.data());
        spLogger->sinks().emplace_back(spConsole);
    }

    spLogger->set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    auto const spLogger = Get();
    assert(spLogger);
    spLogger->sinks().emplace_back(spSink);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::logger> Logger::Get()
{
    if (auto spLogger = spdlog::get(Name.data()); spLogger) [[likely]] { return spLogger; }
    Initialize(spdlog::level::info, false); // A logger without sinks is silent until the host attaches one.
    return spdlog::get(Name.data());
}

//----------------------------------------------------------------------------------------------------------------------
