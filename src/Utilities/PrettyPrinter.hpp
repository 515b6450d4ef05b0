//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Writes JSON with one field per line, used for files a person is expected to edit.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <ostream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

class PrettyPrinter;

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

class JSON::PrettyPrinter
{
public:
    static constexpr std::string_view ValueSeparator = ": ";
    static constexpr std::string_view FieldSeparator = ",\n";
    static constexpr std::string_view Newline = "\n";

    static constexpr std::size_t DefaultTabSize = 4;

    explicit PrettyPrinter(std::size_t tabSize = DefaultTabSize);

    void Format(boost::json::value const& json, std::ostream& os);

private:
    template<typename Container, typename Writer>
    void FormatContainer(
        Container const& container, std::string_view open, std::string_view close, std::ostream& os, Writer&& write);

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
    switch (json.kind()) {
        case boost::json::kind::object: {
            FormatContainer(json.get_object(), "{", "}", os, [this, &os] (auto const& field) {
                os << boost::json::serialize(field.key()) << ValueSeparator;
                Format(field.value(), os);
            });
        } break;
        case boost::json::kind::array: {
            FormatContainer(json.get_array(), "[", "]", os, [this, &os] (auto const& element) {
                Format(element, os);
            });
        } break;
        case boost::json::kind::bool_: { os << (json.get_bool() ? "true" : "false"); } break;
        case boost::json::kind::string: { os << boost::json::serialize(json.get_string()); } break;
        case boost::json::kind::uint64: { os << json.get_uint64(); } break;
        case boost::json::kind::int64: { os << json.get_int64(); } break;
        case boost::json::kind::double_: { os << json.get_double(); } break;
        case boost::json::kind::null: { os << "null"; } break;
    }

    if (m_indentation.empty()) { os << Newline; }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Container, typename Writer>
void JSON::PrettyPrinter::FormatContainer(
    Container const& container, std::string_view open, std::string_view close, std::ostream& os, Writer&& write)
{
    if (container.empty()) {
        os << open << close;
        return;
    }

    os << open << Newline;
    m_indentation.append(m_tabSize, ' ');
    for (auto itr = container.begin(); itr != container.end(); ++itr) {
        if (itr != container.begin()) { os << FieldSeparator; }
        os << m_indentation;
        write(*itr);
    }
    os << Newline;
    m_indentation.resize(m_indentation.size() - m_tabSize);
    os << m_indentation << close;
}

//----------------------------------------------------------------------------------------------------------------------
