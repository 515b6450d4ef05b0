//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.hpp
// Description: Handle the subscription and publishing of events for a single entity (the service, a request, or a 
// verifier). Events are dispatched synchronously to the listeners in subscription order on the publishing thread.
// Notes: Listeners are copied out of the lock before being invoked, a listener may subscribe or unsubscribe while an 
// event is being dispatched. Such changes take effect for the next published event. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Events.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

class Publisher;

using SubscriptionToken = std::uint64_t;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::Publisher
{
public:
    Publisher();

    Publisher(Publisher const&) = delete; 
    Publisher(Publisher&& ) = delete; 
    Publisher& operator=(Publisher const&) = delete; 
    Publisher& operator=(Publisher&&) = delete; 

    template<Type SpecificType> requires MessageWithContent<SpecificType>
    SubscriptionToken Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        // In the case of events with content, the listener will need to cast to the derived event type to access the 
        // event's content and then forward them to the supplied handler. 
        return Subscribe(SpecificType, [callback] (IMessage const& message) {
            // Dispatch needs to ensure this callback is provided the correct event. 
            assert(message.GetType() == SpecificType);
            auto const& event = static_cast<Event::Message<SpecificType> const&>(message);
            std::apply(callback, event.GetContent());
        });
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    SubscriptionToken Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        // In the case of events without content, the listener will simply invoke the callback.
        return Subscribe(SpecificType, [callback] (IMessage const&) { std::invoke(callback); });
    }

    bool Unsubscribe(SubscriptionToken token);

    template<Type SpecificType, typename... Arguments> requires MessageWithContent<SpecificType>
    std::size_t Publish(Arguments&&... arguments)
    {
        Event::Message<SpecificType> const message{ std::forward<Arguments>(arguments)... };
        return Publish(message);
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    std::size_t Publish()
    {
        Event::Message<SpecificType> const message;
        return Publish(message);
    }

    [[nodiscard]] bool IsSubscribed(Type type) const;
    [[nodiscard]] std::size_t ListenerCount() const;

    void Clear();

private:
    using ListenerProxy = std::function<void(IMessage const& message)>;
    using Subscription = std::pair<SubscriptionToken, ListenerProxy>;
    using Listeners = std::unordered_map<Type, std::vector<Subscription>>;

    SubscriptionToken Subscribe(Type type, ListenerProxy&& proxy);
    std::size_t Publish(IMessage const& message);

    mutable std::shared_mutex m_mutex;
    SubscriptionToken m_next;
    Listeners m_listeners;
};

//----------------------------------------------------------------------------------------------------------------------
