#pragma once

#include <events/event_models.hpp>
#include <vector>

namespace ChainReplay {

/**
 * @brief principal_stx_txs rows for one transaction.
 *
 * Principals are the sender, token-transfer recipient, called contract,
 * deployed contract and every STX event sender/recipient, in that order of
 * first appearance. Rows are unique on (principal, tx_id, index_block_hash,
 * microblock_hash): the table's unique index is disabled during bulk load,
 * so duplicates must never reach it.
 */
std::vector<PrincipalStxTx> principal_links(const TxEventData& entry);

} // namespace ChainReplay
