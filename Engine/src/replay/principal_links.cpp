#include <replay/principal_links.hpp>
#include <string>
#include <unordered_set>

namespace ChainReplay {

std::vector<PrincipalStxTx> principal_links(const TxEventData& entry) {
    const Tx& tx = entry.tx;

    std::vector<std::string> principals;
    auto add = [&](const std::optional<std::string>& principal) {
        if (principal && !principal->empty()) principals.push_back(*principal);
    };

    add(tx.sender_address);
    add(tx.token_transfer_recipient_address);
    add(tx.contract_call_contract_id);
    add(tx.smart_contract_contract_id);
    for (const auto& event : entry.stx_events) {
        add(event.sender);
        add(event.recipient);
    }

    // Same columns as the unique index on principal_stx_txs
    std::unordered_set<std::string> inserted_keys;
    std::vector<PrincipalStxTx> rows;
    for (const auto& principal : principals) {
        std::string key = principal + ',' + tx.tx_id + ',' + tx.index_block_hash + ',' + tx.microblock_hash;
        if (!inserted_keys.insert(std::move(key)).second) continue;

        PrincipalStxTx row;
        row.principal = principal;
        row.tx_id = tx.tx_id;
        row.block_height = tx.block_height;
        row.index_block_hash = tx.index_block_hash;
        row.microblock_hash = tx.microblock_hash;
        row.microblock_sequence = tx.microblock_sequence;
        row.tx_index = tx.tx_index;
        row.canonical = tx.canonical;
        row.microblock_canonical = tx.microblock_canonical;
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace ChainReplay
