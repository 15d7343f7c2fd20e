#pragma once

#include <demuxpp/subscription.hpp>

#include <sharedpp/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace JsonDemux
{
    /**
     * Hands values to subscribers in the order they subscribed. Subscriptions are held weakly, dropping the
     * returned shared_ptr ends a subscription.
     */
    class Dispatcher final
    {
      public:
        [[nodiscard]] std::shared_ptr<Subscription> subscribe(Subscription::FunctionType const& callback);

        /**
         * Subscribes a callback that never stops delivery to later subscribers.
         */
        [[nodiscard]] std::shared_ptr<Subscription> listen(std::function<void(Subscription::ParameterType const&)> const& callback);

        /**
         * @return The number of subscribers the value was delivered to.
         */
        std::size_t dispatch(json const& value);

        std::size_t subscriberCount();

      private:
        std::vector<std::weak_ptr<Subscription>> subscribers_;
        std::mutex subscriberGuard_;
    };
}
