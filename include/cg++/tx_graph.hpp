#ifndef CG_TX_GRAPH_HPP
#define CG_TX_GRAPH_HPP

#include <cstdint>
#include <map>
#include <set>
#include <vector>
#include <utility>
#include <absl/types/optional.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/node_hash_map.h>
#include <cg++/bhash.hpp>
#include <cg++/outpoint.hpp>
#include <cg++/transaction.hpp>
#include <cg++/anchor.hpp>

namespace cg {

// a transaction known by id; the body may be missing (id-only) while
// anchors, last seen or individual outputs are already known
struct tx_node
{
    absl::optional<cg::transaction>   tx;
    std::map<std::uint32_t, cg::txout> txouts; // only used while tx is unknown

    tx_node()
    {}

    bool is_full() const
    { return tx.has_value(); }

    bool operator==(const tx_node& o) const
    { return tx == o.tx && txouts == o.txouts; }

    bool operator!=(const tx_node& o) const
    { return ! operator==(o); }
};

// of two bodies with one txid (witness malleation) the one with the
// greater serialization is kept, so the outcome does not depend on order
bool preferred_body(const cg::transaction& a, const cg::transaction& b);

// delta to a tx_graph. append is a union (pointwise max for last_seen) so
// it is associative, commutative and idempotent
struct tx_graph_changeset
{
    std::map<cg::txid, cg::transaction>        txs;
    std::map<cg::outpoint, cg::txout>          txouts;
    std::set<std::pair<cg::anchor, cg::txid>>  anchors;
    std::map<cg::txid, std::uint64_t>          last_seen;

    tx_graph_changeset()
    {}

    bool is_empty() const;

    void append(const tx_graph_changeset& other);

    void serialize(std::vector<std::uint8_t>& out) const;

    bool hydrate(
        std::vector<std::uint8_t>::const_iterator& it,
        const std::vector<std::uint8_t>::const_iterator& end_it
    );

    bool operator==(const tx_graph_changeset& o) const;

    bool operator!=(const tx_graph_changeset& o) const
    { return ! operator==(o); }
};

// monotone store of everything observed about wallet transactions.
// nothing is ever removed, conflicting versions live side by side and
// canonical_view decides between them. not thread safe, see wallet_state
struct tx_graph
{
    absl::node_hash_map<cg::txid, cg::tx_node>                txs;
    absl::flat_hash_map<cg::outpoint, std::set<cg::txid>>     spends;
    absl::flat_hash_map<cg::txid, std::set<cg::anchor>>       tx_anchors;
    absl::flat_hash_map<cg::txid, std::uint64_t>              last_seen_at;

    tx_graph()
    {}

    static tx_graph from_changeset(const tx_graph_changeset& changeset);

    // all insert_* return what actually changed, empty when nothing did
    tx_graph_changeset insert_tx(const cg::transaction& tx);

    tx_graph_changeset insert_txout(
        const cg::outpoint& outpoint,
        const cg::txout& txout
    );

    tx_graph_changeset insert_anchor(
        const cg::txid& txid,
        const cg::anchor& anchor
    );

    // last seen never decreases
    tx_graph_changeset insert_seen_at(
        const cg::txid& txid,
        const std::uint64_t seen_at
    );

    void apply_changeset(const tx_graph_changeset& changeset);

    // union with other, returns the part of other that was new to us
    tx_graph_changeset merge(const tx_graph& other);

    tx_graph_changeset initial_changeset() const;

    const std::set<cg::txid>& outspends(const cg::outpoint& outpoint) const;

    const std::set<cg::txid>& outspends(
        const cg::txid& txid,
        const std::uint32_t vout
    ) const;

    // nullptr when the body is unknown
    const cg::transaction* get_tx(const cg::txid& txid) const;

    const cg::txout* get_txout(const cg::outpoint& outpoint) const;

    const std::set<cg::anchor>& anchors(const cg::txid& txid) const;

    absl::optional<std::uint64_t> last_seen(const cg::txid& txid) const;

    bool has(const cg::txid& txid) const
    { return txs.count(txid) == 1; }

    // other known spenders of each input as (input index, txid)
    std::vector<std::pair<std::uint32_t, cg::txid>> direct_conflicts(
        const cg::transaction& tx
    ) const;

    // every known transaction spending outputs of txid, transitively
    std::vector<cg::txid> walk_descendants(const cg::txid& txid) const;

    std::size_t size() const
    { return txs.size(); }

    std::size_t full_tx_count() const;

    bool operator==(const tx_graph& o) const;

    bool operator!=(const tx_graph& o) const
    { return ! operator==(o); }

private:
    tx_graph_changeset apply(const tx_graph_changeset& changeset);
};

}

#endif
