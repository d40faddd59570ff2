/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/byte_view.hpp>

#include "crypto/hash_types.hpp"

namespace anchorwatch::crypto {

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::ByteView input);

  /**
   * BIP-340 tagged hash: sha256(sha256(tag) || sha256(tag) || input)
   */
  Hash256 taggedHash(std::string_view tag, qtils::ByteView input);

}  // namespace anchorwatch::crypto
