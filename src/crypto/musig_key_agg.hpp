/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace anchorwatch::crypto {
  /// secp256k1 point x coordinate, the point with even y is implied
  using XOnlyPubkey = qtils::ByteArr<32>;

  enum class MusigError : uint8_t {
    INVALID_PUBKEY = 1,
    INFINITY_POINT,
    CRYPTO_FAILURE,
  };
  Q_ENUM_ERROR_CODE(MusigError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_PUBKEY:
        return "Public key is not a valid secp256k1 point";
      case E::INFINITY_POINT:
        return "Aggregated key is the point at infinity";
      case E::CRYPTO_FAILURE:
        return "Elliptic curve operation failed";
    }
    abort();
  }

  /**
   * Drops the parity of a SEC1 public key.
   * Accepts 33-byte compressed, 65-byte uncompressed or an already x-only
   * 32-byte key; the point must lie on the curve.
   */
  outcome::result<XOnlyPubkey> convertToXOnly(qtils::BytesIn pubkey);

  /**
   * MuSig2 KeyAgg (BIP-327) over x-only keys, each lifted to its even-y
   * point. The result depends on the order of `pubkeys`.
   * @return x coordinate of the aggregate point
   */
  outcome::result<XOnlyPubkey> musigAggregatePubkeys(
      const std::vector<XOnlyPubkey> &pubkeys);
}  // namespace anchorwatch::crypto
