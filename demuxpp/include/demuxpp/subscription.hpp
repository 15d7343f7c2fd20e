#pragma once

#include <sharedpp/json.hpp>

#include <functional>

namespace JsonDemux
{
    class Subscription
    {
      public:
        using ParameterType = json;

        /**
         * Returning false stops delivery of the current value to subscribers that subscribed later.
         */
        using FunctionType = std::function<bool(ParameterType const&)>;

        explicit Subscription(FunctionType cb);
        bool operator()(ParameterType const& param)
        {
            return callback_(param);
        }

      private:
        FunctionType callback_;
    };
}
