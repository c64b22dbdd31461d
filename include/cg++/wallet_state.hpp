#ifndef CG_WALLET_STATE_HPP
#define CG_WALLET_STATE_HPP

#include <cstdint>
#include <vector>
#include <utility>
#include <functional>
#include <boost/thread.hpp>
#include <absl/types/optional.h>
#include <cg++/local_chain.hpp>
#include <cg++/tx_graph.hpp>
#include <cg++/changeset.hpp>
#include <cg++/canonical_view.hpp>
#include <cg++/block.hpp>

namespace cg {

// graph and chain of one wallet, for callers that mutate from more than
// one thread. every method takes the lock itself
struct wallet_state
{
    boost::shared_mutex lookup_mtx; // IMPORTANT: graph and chain must be guarded with the lookup_mtx

    cg::tx_graph    graph;
    cg::local_chain chain;

    wallet_state()
    {}

    explicit wallet_state(const cg::blockhash& genesis_hash);

    // all or nothing, the chain part is validated before anything is touched
    cg::status apply_changeset(const cg::changeset& changeset);

    // checkpoints the block and anchors every transaction accepted by filter
    cg::changeset apply_block(
        const cg::block& block,
        const std::uint32_t height,
        const std::function<bool(const cg::transaction&)>& filter = nullptr
    );

    cg::changeset apply_unconfirmed_txs(
        const std::vector<std::pair<cg::transaction, std::uint64_t>>& txs
    );

    cg::changeset disconnect_from(const std::uint32_t height);

    // canonical view at the local chain tip
    cg::canonical_view_response canonical_view();

    cg::canonical_view_response canonical_view(const std::uint32_t query_height);

    cg::changeset initial_changeset();

    absl::optional<cg::block_id> tip();
};

}

#endif
