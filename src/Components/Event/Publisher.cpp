//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
//----------------------------------------------------------------------------------------------------------------------

Event::Publisher::Publisher()
    : m_mutex()
    , m_next(0)
    , m_listeners()
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::Unsubscribe(SubscriptionToken token)
{
    std::scoped_lock lock{ m_mutex };
    for (auto itr = m_listeners.begin(); itr != m_listeners.end(); ++itr) {
        auto& subscriptions = itr->second;
        auto const found = std::ranges::find_if(subscriptions, [&token] (auto const& entry) {
            return entry.first == token;
        });

        if (found != subscriptions.end()) {
            subscriptions.erase(found);
            if (subscriptions.empty()) { m_listeners.erase(itr); }
            return true;
        }
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsSubscribed(Type type) const
{
    std::shared_lock lock{ m_mutex };
    return m_listeners.contains(type);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::ListenerCount() const
{
    std::shared_lock lock{ m_mutex };
    std::size_t count = 0;
    for (auto const& [type, subscriptions] : m_listeners) { count += subscriptions.size(); }
    return count;
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Clear()
{
    std::scoped_lock lock{ m_mutex };
    m_listeners.clear();
}

//----------------------------------------------------------------------------------------------------------------------

Event::SubscriptionToken Event::Publisher::Subscribe(Type type, ListenerProxy&& proxy)
{
    std::scoped_lock lock{ m_mutex };
    auto const token = ++m_next;
    m_listeners[type].emplace_back(token, std::move(proxy));
    return token;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::Publish(IMessage const& message)
{
    // Copy the listeners for the event to allow them to modify the subscriptions during dispatch.
    std::vector<Subscription> subscriptions;
    {
        std::shared_lock lock{ m_mutex };
        if (auto const itr = m_listeners.find(message.GetType()); itr != m_listeners.end()) {
            subscriptions = itr->second;
        }
    }

    for (auto const& [token, listenerProxy] : subscriptions) { std::invoke(listenerProxy, message); }
    return subscriptions.size(); // Return the number of listeners notified.
}

//----------------------------------------------------------------------------------------------------------------------
