#pragma once

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <string>

namespace JsonDemux
{
    class UuidGenerator
    {
      public:
        std::string generateId() const
        {
            return boost::uuids::to_string(gen_());
        }

        /**
         * First group of a fresh uuid, long enough to tell concurrent streams apart in a log.
         */
        std::string generateShortId() const
        {
            return generateId().substr(0, 8);
        }

      private:
        mutable boost::uuids::random_generator gen_;
    };
}
