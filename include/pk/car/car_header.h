// =============================================================================
// piece-kit - CARv1 Header Encoding
// =============================================================================
// Builds the verbatim header bytes that open a piece.
//
// Layout:
//   <uvarint N><N bytes of DAG-CBOR: {"roots": [CID...], "version": 1}>
//
// Roots are encoded as CBOR tag 42 over a byte string holding 0x00 followed
// by the binary CID. Map keys are emitted in DAG-CBOR canonical order.
// =============================================================================

#ifndef PK_CAR_CAR_HEADER_H
#define PK_CAR_CAR_HEADER_H

#include <span>

#include "pk/car/cid.h"
#include "pk/common/types.h"

namespace pk::car {

/// @brief CAR format version written into the header.
inline constexpr std::uint64_t kCarVersion = 1;

/// @brief Encode a CARv1 header for the given roots.
[[nodiscard]] Bytes encodeCarHeader(std::span<const Cid> roots);

}  // namespace pk::car

#endif  // PK_CAR_CAR_HEADER_H
