#include <demuxpp/subscription.hpp>

namespace JsonDemux
{
    //#####################################################################################################################
    Subscription::Subscription(FunctionType cb)
        : callback_{std::move(cb)}
    {}
    //#####################################################################################################################
}
