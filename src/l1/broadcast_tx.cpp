/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "l1/broadcast_tx.hpp"

#include "rpc/l1_client.hpp"

namespace anchorwatch {
  outcome::result<L1Txid> broadcastTx(rpc::L1Client &l1,
                                      const PsbtOutputs &outputs,
                                      const PsbtOptions &options) {
    BOOST_OUTCOME_TRY(auto funded, l1.walletCreateFundedPsbt(outputs, options));
    BOOST_OUTCOME_TRY(auto signed_psbt, l1.walletProcessPsbt(funded.psbt));
    BOOST_OUTCOME_TRY(auto finalized, l1.finalizePsbt(signed_psbt.psbt));
    if (not finalized.complete or not finalized.hex.has_value()) {
      return BroadcastError::NOT_FINALIZED;
    }
    return l1.sendRawTransaction(finalized.hex.value());
  }
}  // namespace anchorwatch
