#pragma once

#include <crock/uuid_traits.hpp>
#include <boost/uuid/uuid.hpp>
#include <algorithm>

namespace crock {

// boost::uuids::uuid stores its 16 bytes in network order, same as ours.
template<>
struct UuidTraits<boost::uuids::uuid> {
    static Bytes16 to_bytes(const boost::uuids::uuid& u) {
        Bytes16 out;
        std::copy(u.begin(), u.end(), out.begin());
        return out;
    }

    static boost::uuids::uuid from_bytes(const Bytes16& b) {
        boost::uuids::uuid u;
        std::copy(b.begin(), b.end(), u.begin());
        return u;
    }
};

} // namespace crock
