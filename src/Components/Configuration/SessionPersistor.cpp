//----------------------------------------------------------------------------------------------------------------------
// File: SessionPersistor.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "SessionPersistor.hpp"
#include "Defaults.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Sessions = "sessions";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema. 
//----------------------------------------------------------------------------------------------------------------------
// {
//     "sessions": [
//         {
//             "credentials": Object,
//             "config": Object,
//             "token_valid": Boolean
//         },
//         ...
//     ]
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::SessionPersistor::SessionPersistor(std::filesystem::path const& filepath)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_mutex()
    , m_filepath(filepath)
    , m_records()
{
    assert(m_logger);

    if (m_filepath.empty()) { return; }

    if (!FileUtils::CreateFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the filepath at: {}!", m_filepath.string());
        m_filepath.clear();
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::SessionPersistor::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::StatusCode Configuration::SessionPersistor::FetchSessions()
{
    std::scoped_lock lock{ m_mutex };
    if (m_filepath.empty() || !std::filesystem::exists(m_filepath)) { return StatusCode::Success; }

    m_logger->debug("Reading the sessions file at: {}.", m_filepath.string());

    auto const optSerialized = FileUtils::ReadBoundedFile(m_filepath, Defaults::RecordSizeLimit);
    if (!optSerialized) {
        m_logger->error("Failed to read the sessions file at: {}!", m_filepath.string());
        return StatusCode::FileError;
    }

    boost::json::error_code error;
    auto const json = boost::json::parse(*optSerialized, error);
    auto const* const pObject = (!error) ? json.if_object() : nullptr;
    if (!pObject) {
        m_logger->error("The sessions file at: {} is not a valid JSON object!", m_filepath.string());
        return StatusCode::DecodeError;
    }

    auto const itr = pObject->find(symbols::Sessions);
    if (itr == pObject->end() || !itr->value().is_array()) {
        m_logger->error("The sessions file at: {} is missing the list of sessions!", m_filepath.string());
        return StatusCode::DecodeError;
    }

    SessionRecords records;
    for (auto const& entry : itr->value().get_array()) {
        auto optParams = Session::Params::Read(entry);
        if (!optParams) {
            m_logger->warn("Skipping a malformed record in the sessions file at: {}.", m_filepath.string());
            continue;
        }
        std::erase_if(records, [&] (auto const& record) { return record.GetSessionId() == optParams->GetSessionId(); });
        records.emplace_back(std::move(*optParams));
    }

    m_records = std::move(records);
    return StatusCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Configuration::SessionPersistor::Count() const
{
    std::scoped_lock lock{ m_mutex };
    return m_records.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Session::Params> Configuration::SessionPersistor::Get(std::string_view sessionId) const
{
    std::scoped_lock lock{ m_mutex };
    auto const itr = std::ranges::find_if(m_records, [&] (auto const& record) {
        return record.GetSessionId() == sessionId;
    });
    if (itr == m_records.end()) { return {}; }
    return *itr;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Session::Params> Configuration::SessionPersistor::GetLast() const
{
    std::scoped_lock lock{ m_mutex };
    if (m_records.empty()) { return {}; }
    return m_records.back();
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Session::Params> Configuration::SessionPersistor::GetAll() const
{
    std::scoped_lock lock{ m_mutex };
    return m_records;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::StatusCode Configuration::SessionPersistor::Save(Session::Params const& params)
{
    std::scoped_lock lock{ m_mutex };
    
    // Saving an existing session replaces the record and marks it as the most recent. 
    std::erase_if(m_records, [&] (auto const& record) { return record.GetSessionId() == params.GetSessionId(); });
    m_records.emplace_back(params);

    return Serialize();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::StatusCode Configuration::SessionPersistor::Delete(std::string_view sessionId)
{
    std::scoped_lock lock{ m_mutex };
    auto const erased = std::erase_if(m_records, [&] (auto const& record) { return record.GetSessionId() == sessionId; });
    if (erased == 0) { return StatusCode::InputError; }
    return Serialize();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::StatusCode Configuration::SessionPersistor::Serialize() const
{
    if (m_filepath.empty()) { return StatusCode::Success; } // If the filesystem is disabled, there is nothing to do.

    boost::json::array sessions;
    sessions.reserve(m_records.size());
    for (auto const& record : m_records) { sessions.emplace_back(record.Write()); }

    boost::json::object json;
    json[symbols::Sessions] = std::move(sessions);

    if (!FileUtils::WriteFile(m_filepath, JSON::ToPrettyString(json))) {
        m_logger->error("Failed to write the sessions file at: {}!", m_filepath.string());
        return StatusCode::FileError;
    }

    return StatusCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------
