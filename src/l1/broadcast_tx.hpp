/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/l1_types.hpp"

namespace anchorwatch::rpc {
  class L1Client;
}  // namespace anchorwatch::rpc

namespace anchorwatch {
  enum class BroadcastError : uint8_t {
    NOT_FINALIZED = 1,
  };
  Q_ENUM_ERROR_CODE(BroadcastError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_FINALIZED:
        return "Wallet could not finalize the transaction";
    }
    abort();
  }

  /**
   * Funds, signs and sends a transaction paying `outputs` from the node
   * wallet.
   * @return txid of the broadcast transaction
   */
  outcome::result<L1Txid> broadcastTx(rpc::L1Client &l1,
                                      const PsbtOutputs &outputs,
                                      const PsbtOptions &options);
}  // namespace anchorwatch
