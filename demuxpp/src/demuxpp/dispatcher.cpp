#include <demuxpp/dispatcher.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace JsonDemux
{
    //#####################################################################################################################
    std::size_t Dispatcher::dispatch(json const& value)
    {
        std::vector<std::weak_ptr<Subscription>> snapshot;
        {
            std::scoped_lock lock{subscriberGuard_};
            std::erase_if(subscribers_, [](auto const& weak) {
                return weak.expired();
            });
            snapshot = subscribers_;
        }

        if (snapshot.empty())
            spdlog::warn("Dispatcher: no subscriber for value, it is dropped.");

        // Locked one at a time, so a subscription released by an earlier subscriber is not called anymore.
        std::size_t delivered = 0;
        for (auto const& weak : snapshot)
        {
            auto held = weak.lock();
            if (!held)
                continue;

            ++delivered;
            if (!std::invoke(*held, value))
                break;
        }
        return delivered;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::shared_ptr<Subscription> Dispatcher::subscribe(Subscription::FunctionType const& callback)
    {
        std::scoped_lock lock{subscriberGuard_};
        auto subscriber = std::make_shared<Subscription>(callback);
        subscribers_.push_back(subscriber);
        return subscriber;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::shared_ptr<Subscription> Dispatcher::listen(std::function<void(Subscription::ParameterType const&)> const& callback)
    {
        return subscribe(Subscription::FunctionType{[callback](Subscription::ParameterType const& value) -> bool {
            callback(value);
            return true;
        }});
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t Dispatcher::subscriberCount()
    {
        std::scoped_lock lock{subscriberGuard_};
        return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(), [](auto const& weak) {
            return !weak.expired();
        }));
    }
    //#####################################################################################################################
}
