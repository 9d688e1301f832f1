//----------------------------------------------------------------------------------------------------------------------
// File: PendingSessionPersistor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PendingSessionPersistor.hpp"
#include "Defaults.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Configuration::PendingSessionPersistor::PendingSessionPersistor(std::filesystem::path const& filepath)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_mutex()
    , m_filepath(filepath)
    , m_optCached()
{
    assert(m_logger);

    if (m_filepath.empty()) { return; }

    if (!FileUtils::CreateFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the filepath at: {}!", m_filepath.string());
        m_filepath.clear(); // If we failed to create the filepath, we are unable to use the filesystem. 
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::PendingSessionPersistor::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Authentication::PendingSessionData> Configuration::PendingSessionPersistor::Load() const
{
    std::scoped_lock lock{ m_mutex };
    if (m_filepath.empty() || !std::filesystem::exists(m_filepath)) { return m_optCached; }

    auto const optSerialized = FileUtils::ReadBoundedFile(m_filepath, Defaults::RecordSizeLimit);
    if (!optSerialized) {
        m_logger->warn("Failed to read the pending session record at: {}.", m_filepath.string());
        return {};
    }

    boost::json::error_code error;
    auto const json = boost::json::parse(*optSerialized, error);
    if (error) {
        m_logger->warn("The pending session record at: {} is not valid JSON.", m_filepath.string());
        return {};
    }

    auto optData = Authentication::PendingSessionData::Read(json);
    if (!optData) { m_logger->warn("Discarding the malformed pending session record at: {}.", m_filepath.string()); }
    return optData;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::StatusCode Configuration::PendingSessionPersistor::Save(Authentication::PendingSessionData const& data)
{
    std::scoped_lock lock{ m_mutex };
    m_optCached = data;

    if (m_filepath.empty()) { return StatusCode::Success; }

    if (!FileUtils::WriteFile(m_filepath, JSON::ToPrettyString(data.Write()))) {
        m_logger->error("Failed to write the pending session record at: {}!", m_filepath.string());
        return StatusCode::FileError;
    }

    return StatusCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::StatusCode Configuration::PendingSessionPersistor::Delete()
{
    std::scoped_lock lock{ m_mutex };
    m_optCached.reset();

    if (m_filepath.empty()) { return StatusCode::Success; }

    std::error_code error;
    std::filesystem::remove(m_filepath, error);
    if (error) {
        m_logger->error("Failed to remove the pending session record at: {}!", m_filepath.string());
        return StatusCode::FileError;
    }

    return StatusCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------
