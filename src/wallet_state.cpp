#include <cstdint>
#include <vector>

#include <boost/thread.hpp>
#include <spdlog/spdlog.h>

#include <cg++/wallet_state.hpp>
#include <cg++/anchor.hpp>

namespace cg {

wallet_state::wallet_state(const cg::blockhash& genesis_hash)
: chain(genesis_hash)
{}

cg::status wallet_state::apply_changeset(const cg::changeset& changeset)
{
    boost::lock_guard<boost::shared_mutex> lock(lookup_mtx);

    const cg::status s = chain.apply_changeset(changeset.chain);
    if (s != cg::status::OK) {
        spdlog::error("wallet_state: rejected changeset: {}", cg::to_string(s));
        return s;
    }

    graph.apply_changeset(changeset.graph);

    return cg::status::OK;
}

cg::changeset wallet_state::apply_block(
    const cg::block& block,
    const std::uint32_t height,
    const std::function<bool(const cg::transaction&)>& filter
) {
    boost::lock_guard<boost::shared_mutex> lock(lookup_mtx);

    cg::changeset ret;
    ret.chain = chain.apply_block(block, height);

    const cg::anchor anchor(cg::confirmation_time_anchor(
        cg::block_id(height, block.block_hash),
        height,
        block.timestamp
    ));

    std::size_t total_added = 0;
    for (const cg::transaction & tx : block.txs) {
        if (filter && ! filter(tx)) {
            continue;
        }

        ret.graph.append(graph.insert_tx(tx));
        ret.graph.append(graph.insert_anchor(tx.txid, anchor));
        ++total_added;
    }

    spdlog::info("wallet_state: block {} {} relevant txs {}",
        height, block.block_hash.decompress(true), total_added);

    return ret;
}

cg::changeset wallet_state::apply_unconfirmed_txs(
    const std::vector<std::pair<cg::transaction, std::uint64_t>>& txs
) {
    boost::lock_guard<boost::shared_mutex> lock(lookup_mtx);

    cg::changeset ret;
    for (const auto & m : txs) {
        ret.graph.append(graph.insert_tx(m.first));
        ret.graph.append(graph.insert_seen_at(m.first.txid, m.second));
    }

    return ret;
}

cg::changeset wallet_state::disconnect_from(const std::uint32_t height)
{
    boost::lock_guard<boost::shared_mutex> lock(lookup_mtx);

    cg::changeset ret;
    ret.chain = chain.disconnect_from(height);
    return ret;
}

cg::canonical_view_response wallet_state::canonical_view()
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    const absl::optional<cg::block_id> chain_tip = chain.tip();
    return cg::build_canonical_view(graph, chain, chain_tip ? chain_tip->height : 0);
}

cg::canonical_view_response wallet_state::canonical_view(const std::uint32_t query_height)
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    return cg::build_canonical_view(graph, chain, query_height);
}

cg::changeset wallet_state::initial_changeset()
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    return cg::changeset(chain.initial_changeset(), graph.initial_changeset());
}

absl::optional<cg::block_id> wallet_state::tip()
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    return chain.tip();
}

}
