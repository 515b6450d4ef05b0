//----------------------------------------------------------------------------------------------------------------------
// File: Events.hpp
// Description: The notifications raised by the verification service, its requests, and their verifiers. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Verification/Presentation.hpp"
#include "Components/Verification/VerificationDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/facilities/empty.hpp>
#include <boost/preprocessor/facilities/va_opt.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <tuple>
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

namespace Verification { class Request; }

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint32_t
{
    RequestReceived,
    PhaseChanged,
    ShowSas,
    ShowReciprocate,
    VerifierCancelled
};

class IMessage;

// By default, the message constructor is deleted to prevent usage of unspecialized types. 
template<Type SpecificType>
class Message { Message() = delete; }; 

template<Type SpecificType>
concept MessageWithContent = requires { typename Message<SpecificType>::EventContent; };

template<Type SpecificType>
concept MessageWithoutContent = !MessageWithContent<SpecificType>;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::IMessage
{
public:
    virtual ~IMessage() = default;
    [[nodiscard]] virtual Event::Type GetType() const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
// Note: The following macros define the boilerplate types, methods, and variables that should be present in event 
// specializations. 
//----------------------------------------------------------------------------------------------------------------------

// Converts a callback type into an unqualified content store type (e.g. std::string const& becomes std::string).
#define EVENT_MESSAGE_CONTENT_STORE_TYPES(r, data, i, elem) BOOST_PP_COMMA_IF(i) std::remove_cvref_t<elem>
// Converts a callback type into a named parameter (e.g. std::string const& becomes std::string const& arg_0).
#define EVENT_MESSAGE_CONTENT_STORE_ARGS(r, data, i, elem) BOOST_PP_COMMA_IF(i) elem arg_##i
// Converted a callback type into the name argument (e.g. std::string const& becomes arg_0)
#define EVENT_MESSAGE_CONTENT_STORE_NAMES(r, data, i, elem) BOOST_PP_COMMA_IF(i) arg_##i

// Creates the types, methods, and variables needed to support storing and providing callback content. 
#define EVENT_MESSAGE_CONTENT_STORE(...) \
public:\
    using EventContent = std::tuple<\
        BOOST_PP_SEQ_FOR_EACH_I(EVENT_MESSAGE_CONTENT_STORE_TYPES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))>; \
    explicit Message(BOOST_PP_SEQ_FOR_EACH_I(\
        EVENT_MESSAGE_CONTENT_STORE_ARGS, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))) \
        : m_content(std::make_tuple(BOOST_PP_SEQ_FOR_EACH_I( \
            EVENT_MESSAGE_CONTENT_STORE_NAMES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))) {} \
    explicit Message(EventContent&& content) : m_content(std::move(content)) {} \
    auto const& GetContent() const { return m_content; } \
private: \
    EventContent m_content;
#define EVENT_MESSAGE_CONTENT_STORE_EMPTY \
private: \
    using EventContent = void;

// Creates the core types and methods needed to define an event specialization. 
#define EVENT_MESSAGE_CORE(type, ...) \
public:\
    using CallbackTrait = std::function<void(__VA_ARGS__)>; \
    static constexpr Event::Type Type = type; \
    Message() = default; \
    ~Message() = default; \
    Message(Message const&) = delete; \
    Message(Message&& ) = default; \
    Message& operator=(Message const&) = delete; \
    Message& operator=(Message&&) = default; \
    [[nodiscard]] virtual Event::Type GetType() const override { return Type; } \
    BOOST_PP_VA_OPT((EVENT_MESSAGE_CONTENT_STORE(__VA_ARGS__)), (EVENT_MESSAGE_CONTENT_STORE_EMPTY), __VA_ARGS__)

//----------------------------------------------------------------------------------------------------------------------
// Schema: A request opened by a counterparty that passed the freshness checks. Raised by the service.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::RequestReceived> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::RequestReceived, std::shared_ptr<Verification::Request> const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The previous and the current phase of a request. Raised by the request.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::PhaseChanged> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::PhaseChanged, Verification::Phase, Verification::Phase)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The short authentication string and the user's decision callbacks. Raised by a SAS verifier.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ShowSas> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::ShowSas, Verification::SasPresentation const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The scanning party and the user's decision callbacks. Raised by a QR verifier in the showing role.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::ShowReciprocate> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::ShowReciprocate, Verification::ReciprocatePresentation const&)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The reason the verifier was cancelled. Raised by either verifier.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::VerifierCancelled> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::VerifierCancelled, Verification::Cancellation const&)
};

//----------------------------------------------------------------------------------------------------------------------
