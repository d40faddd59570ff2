/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/musig_key_agg.hpp"

#include <algorithm>
#include <array>
#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <qtils/byte_vec.hpp>

#include "crypto/sha/sha256.hpp"

namespace anchorwatch::crypto {
  namespace {
    constexpr size_t kXOnlySize = 32;
    constexpr size_t kCompressedSize = kXOnlySize + 1;
    constexpr size_t kUncompressedSize = 2 * kXOnlySize + 1;
    constexpr uint8_t kEvenYPrefix = 0x02;

    using CompressedPubkey = std::array<uint8_t, kCompressedSize>;

    struct GroupDeleter {
      void operator()(EC_GROUP *p) const {
        EC_GROUP_free(p);
      }
    };
    struct PointDeleter {
      void operator()(EC_POINT *p) const {
        EC_POINT_free(p);
      }
    };
    struct BnDeleter {
      void operator()(BIGNUM *p) const {
        BN_free(p);
      }
    };
    struct BnCtxDeleter {
      void operator()(BN_CTX *p) const {
        BN_CTX_free(p);
      }
    };
    using Group = std::unique_ptr<EC_GROUP, GroupDeleter>;
    using Point = std::unique_ptr<EC_POINT, PointDeleter>;
    using Bn = std::unique_ptr<BIGNUM, BnDeleter>;
    using BnCtx = std::unique_ptr<BN_CTX, BnCtxDeleter>;

    struct Curve {
      Group group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
      BnCtx ctx{BN_CTX_new()};

      outcome::result<void> check() const {
        if (not group or not ctx) {
          return MusigError::CRYPTO_FAILURE;
        }
        return outcome::success();
      }

      outcome::result<Point> decode(qtils::BytesIn sec1) const {
        Point point{EC_POINT_new(group.get())};
        if (not point) {
          return MusigError::CRYPTO_FAILURE;
        }
        if (EC_POINT_oct2point(
                group.get(), point.get(), sec1.data(), sec1.size(), ctx.get())
            != 1) {
          return MusigError::INVALID_PUBKEY;
        }
        return point;
      }

      outcome::result<CompressedPubkey> compress(const EC_POINT *point) const {
        CompressedPubkey out{};
        if (EC_POINT_point2oct(group.get(),
                               point,
                               POINT_CONVERSION_COMPRESSED,
                               out.data(),
                               out.size(),
                               ctx.get())
            != out.size()) {
          return MusigError::CRYPTO_FAILURE;
        }
        return out;
      }
    };

    CompressedPubkey liftToEvenY(const XOnlyPubkey &x) {
      CompressedPubkey out{};
      out[0] = kEvenYPrefix;
      std::ranges::copy(x, out.begin() + 1);
      return out;
    }

    XOnlyPubkey dropPrefix(const CompressedPubkey &pk) {
      XOnlyPubkey out;
      std::copy(pk.begin() + 1, pk.end(), out.begin());
      return out;
    }
  }  // namespace

  outcome::result<XOnlyPubkey> convertToXOnly(qtils::BytesIn pubkey) {
    Curve curve;
    BOOST_OUTCOME_TRY(curve.check());
    if (pubkey.size() == kXOnlySize) {
      XOnlyPubkey x;
      std::ranges::copy(pubkey, x.begin());
      auto lifted = liftToEvenY(x);
      BOOST_OUTCOME_TRY(curve.decode(lifted));
      return x;
    }
    if (pubkey.size() != kCompressedSize
        and pubkey.size() != kUncompressedSize) {
      return MusigError::INVALID_PUBKEY;
    }
    BOOST_OUTCOME_TRY(auto point, curve.decode(pubkey));
    BOOST_OUTCOME_TRY(auto compressed, curve.compress(point.get()));
    return dropPrefix(compressed);
  }

  outcome::result<XOnlyPubkey> musigAggregatePubkeys(
      const std::vector<XOnlyPubkey> &pubkeys) {
    if (pubkeys.empty()) {
      return MusigError::INVALID_PUBKEY;
    }
    Curve curve;
    BOOST_OUTCOME_TRY(curve.check());
    const BIGNUM *order = EC_GROUP_get0_order(curve.group.get());

    qtils::ByteVec key_list;
    key_list.reserve(pubkeys.size() * kCompressedSize);
    for (auto &pk : pubkeys) {
      auto lifted = liftToEvenY(pk);
      key_list.insert(key_list.end(), lifted.begin(), lifted.end());
    }
    const auto list_hash = taggedHash("KeyAgg list", key_list);

    // keys equal to the first key distinct from pubkeys[0] get coefficient 1
    auto second = std::ranges::find_if(
        pubkeys, [&](const XOnlyPubkey &pk) { return pk != pubkeys.front(); });

    Point aggregate{EC_POINT_new(curve.group.get())};
    Point term{EC_POINT_new(curve.group.get())};
    Bn coefficient{BN_new()};
    if (not aggregate or not term or not coefficient
        or EC_POINT_set_to_infinity(curve.group.get(), aggregate.get()) != 1) {
      return MusigError::CRYPTO_FAILURE;
    }

    for (auto &pk : pubkeys) {
      auto lifted = liftToEvenY(pk);
      BOOST_OUTCOME_TRY(auto point, curve.decode(lifted));

      if (second != pubkeys.end() and pk == *second) {
        if (BN_one(coefficient.get()) != 1) {
          return MusigError::CRYPTO_FAILURE;
        }
      } else {
        qtils::ByteVec preimage;
        preimage.reserve(list_hash.size() + lifted.size());
        preimage.insert(preimage.end(), list_hash.begin(), list_hash.end());
        preimage.insert(preimage.end(), lifted.begin(), lifted.end());
        auto hash = taggedHash("KeyAgg coefficient", preimage);
        if (BN_bin2bn(hash.data(), static_cast<int>(hash.size()),
                      coefficient.get())
                == nullptr
            or BN_nnmod(coefficient.get(),
                        coefficient.get(),
                        order,
                        curve.ctx.get())
                   != 1) {
          return MusigError::CRYPTO_FAILURE;
        }
      }

      if (EC_POINT_mul(curve.group.get(),
                       term.get(),
                       nullptr,
                       point.get(),
                       coefficient.get(),
                       curve.ctx.get())
              != 1
          or EC_POINT_add(curve.group.get(),
                          aggregate.get(),
                          aggregate.get(),
                          term.get(),
                          curve.ctx.get())
                 != 1) {
        return MusigError::CRYPTO_FAILURE;
      }
    }

    if (EC_POINT_is_at_infinity(curve.group.get(), aggregate.get()) == 1) {
      return MusigError::INFINITY_POINT;
    }
    BOOST_OUTCOME_TRY(auto compressed, curve.compress(aggregate.get()));
    return dropPrefix(compressed);
  }
}  // namespace anchorwatch::crypto
