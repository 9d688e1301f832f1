//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Indented rendering of JSON documents written to the homeport records. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

class PrettyPrinter;

[[nodiscard]] std::string ToPrettyString(boost::json::value const& json);

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

class JSON::PrettyPrinter
{
public:
    static constexpr std::string_view ValueSeperator = ": ";
    static constexpr std::string_view FieldSeperator = ",\n";
    static constexpr std::string_view Newline = "\n";
    static constexpr std::size_t DefaultTabSize = 4;

    explicit PrettyPrinter(std::size_t tabSize = DefaultTabSize);

    void Format(boost::json::value const& json, std::ostream& os);

private:
    template<typename ContainerType, typename WriterType>
    void FormatContainer(
        ContainerType const& container, char open, char close, std::ostream& os, WriterType const& writer);

    std::string m_indentation;
    std::size_t m_tabSize;
};

//----------------------------------------------------------------------------------------------------------------------

inline JSON::PrettyPrinter::PrettyPrinter(std::size_t tabSize)
    : m_indentation()
    , m_tabSize(tabSize)
{
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Format(boost::json::value const& json, std::ostream& os)
{
    bool const isRoot = m_indentation.empty();
    switch (json.kind()) {
        case boost::json::kind::object: {
            FormatContainer(json.get_object(), '{', '}', os, [this, &os] (auto const& entry) {
                os << boost::json::serialize(entry.key()) << ValueSeperator;
                Format(entry.value(), os);
            });
        } break;
        case boost::json::kind::array: {
            FormatContainer(json.get_array(), '[', ']', os, [this, &os] (auto const& element) {
                Format(element, os);
            });
        } break;
        // Scalars have a compact form that matches their pretty form. 
        default: os << boost::json::serialize(json); break;
    }

    if (isRoot) { os << Newline; }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename ContainerType, typename WriterType>
void JSON::PrettyPrinter::FormatContainer(
    ContainerType const& container, char open, char close, std::ostream& os, WriterType const& writer)
{
    if (container.empty()) { os << open << close; return; }

    os << open << Newline;
    m_indentation.append(m_tabSize, ' ');
    for (auto itr = container.begin(); itr != container.end(); ++itr) {
        if (itr != container.begin()) { os << FieldSeperator; }
        os << m_indentation;
        writer(*itr);
    }
    m_indentation.resize(m_indentation.size() - m_tabSize);
    os << Newline << m_indentation << close;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string JSON::ToPrettyString(boost::json::value const& json)
{
    std::ostringstream oss;
    PrettyPrinter{}.Format(json, oss);
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
