#pragma once

#include <crock/base32.hpp>

namespace crock {

// Capability seam for foreign UUID types: anything that can hand out its
// 16 bytes in RFC 4122 (network) order and be rebuilt from them.
//
// Specialize for your type:
//
//   template<> struct UuidTraits<MyUuid> {
//       static Bytes16 to_bytes(const MyUuid& u);
//       static MyUuid from_bytes(const Bytes16& b);
//   };
//
// crock ships specializations for crock::Uuid (uuid.hpp) and
// boost::uuids::uuid (boost_uuid.hpp).
template<typename T>
struct UuidTraits;

} // namespace crock
