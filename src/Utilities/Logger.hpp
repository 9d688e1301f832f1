//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Registration of the core logger shared by every component. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Name = "core";
constexpr std::string_view MessagePattern = "[%Y-%m-%d %T.%e] [%^%l%$] %v";

void Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);
[[nodiscard]] bool AttachFileSink(std::filesystem::path const& filepath);
void SetVerbosity(spdlog::level::level_enum verbosity);

[[nodiscard]] std::optional<spdlog::level::level_enum> ParseVerbosity(std::string_view verbosity);

//----------------------------------------------------------------------------------------------------------------------
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    if (auto const spCore = spdlog::get(Name.data()); !spCore) {
        spdlog::register_logger(std::make_shared<spdlog::logger>(Name.data()));
    
        if (useStdOutSink) {
            auto const spCoreSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            spCoreSink->set_pattern(MessagePattern.data());
            AttachSink(spCoreSink);
        }
    }

    SetVerbosity(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    auto spCore = spdlog::get(Name.data());
    assert(spCore);
    spCore->sinks().emplace_back(spSink);
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Logger::AttachFileSink(std::filesystem::path const& filepath)
{
    try {
        auto const spFileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath.string());
        spFileSink->set_pattern(MessagePattern.data());
        AttachSink(spFileSink);
    } catch (spdlog::spdlog_ex const& exception) {
        if (auto const spCore = spdlog::get(Name.data()); spCore) {
            spCore->error("Failed to open the log file at: {}! Reason: {}", filepath.string(), exception.what());
        }
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::SetVerbosity(spdlog::level::level_enum verbosity)
{
    auto const spCore = spdlog::get(Name.data());
    assert(spCore);
    spCore->set_level(verbosity);
    spCore->flush_on(spdlog::level::warn);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<spdlog::level::level_enum> Logger::ParseVerbosity(std::string_view verbosity)
{
    // Note: spdlog maps unknown names onto "off", so an explicit check is needed to detect bad input. 
    auto const level = spdlog::level::from_str(std::string{ verbosity });
    if (level == spdlog::level::off && verbosity != "off") { return {}; }
    return level;
}

//----------------------------------------------------------------------------------------------------------------------
