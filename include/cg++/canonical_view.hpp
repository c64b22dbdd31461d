#ifndef CG_CANONICAL_VIEW_HPP
#define CG_CANONICAL_VIEW_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <absl/types/variant.h>
#include <absl/types/optional.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <cg++/bhash.hpp>
#include <cg++/outpoint.hpp>
#include <cg++/transaction.hpp>
#include <cg++/anchor.hpp>
#include <cg++/status.hpp>
#include <cg++/tx_graph.hpp>
#include <cg++/chain_oracle.hpp>

namespace cg {

enum class canonical_status
{
    CANONICAL,
    NOT_CANONICAL,
    UNKNOWN, // graph never heard of the txid
};

struct confirmed_position
{
    cg::anchor    anchor;
    std::uint32_t height;
};

struct unconfirmed_position
{
    std::uint64_t last_seen;
};

struct chain_position
{
    absl::variant<cg::confirmed_position, cg::unconfirmed_position> v;

    chain_position()
    : v(cg::unconfirmed_position{ 0 })
    {}

    chain_position(const cg::confirmed_position& m)
    : v(m)
    {}

    chain_position(const cg::unconfirmed_position& m)
    : v(m)
    {}

    bool is_confirmed() const
    { return absl::holds_alternative<cg::confirmed_position>(v); }

    absl::optional<std::uint32_t> confirmation_height() const;
    absl::optional<std::uint64_t> last_seen() const;

    std::string to_string() const;

    bool operator==(const chain_position& o) const;

    bool operator!=(const chain_position& o) const
    { return ! operator==(o); }
};

struct canonical_tx
{
    cg::txid           txid;
    cg::chain_position position;
    cg::transaction    tx;
};

struct spent_by
{
    cg::txid           txid;
    cg::chain_position position;
};

struct canonical_txout
{
    cg::outpoint       outpoint;
    cg::txout          txout;
    cg::chain_position position;
    bool               is_coinbase;
    absl::optional<cg::spent_by> spent;
};

// transaction with more than one still valid anchor at different heights
struct consistency_hazard
{
    cg::txid                txid;
    std::vector<cg::anchor> valid_anchors;
};

// immutable snapshot of which transactions are canonical at query_height.
// holds copies, the graph may be mutated after it was built
struct canonical_view
{
    std::uint32_t query_height;
    absl::flat_hash_map<cg::txid, cg::canonical_tx> canonical;
    absl::flat_hash_set<cg::txid>                   not_canonical;
    absl::flat_hash_map<cg::outpoint, cg::txid>     canonical_spends;
    std::vector<cg::consistency_hazard>             hazard_list;

    canonical_view()
    : query_height(0)
    {}

    cg::canonical_status status(const cg::txid& txid) const;

    absl::optional<cg::chain_position> position(const cg::txid& txid) const;

    // nullopt when the output is unspent in the canonical history
    absl::optional<cg::spent_by> spend_status(const cg::outpoint& outpoint) const;

    // confirmed by height, then unconfirmed by last seen, ties by txid
    std::vector<cg::canonical_tx> canonical_txs() const;

    std::vector<cg::canonical_txout> canonical_txouts() const;

    std::vector<cg::canonical_txout> unspent() const;

    const std::vector<cg::consistency_hazard>& hazards() const
    { return hazard_list; }
};

using canonical_view_response = std::pair<cg::status, cg::canonical_view>;

// decide, for every transaction in graph, whether it is part of the
// canonical history as seen by oracle at query_height.
//
// fails with ORACLE_UNAVAILABLE if the oracle cannot answer and with
// DATA_INCONSISTENCY on a dependency cycle or when two spenders of one
// output are both confirmed in the best chain
cg::canonical_view_response build_canonical_view(
    const cg::tx_graph& graph,
    const cg::chain_oracle& oracle,
    const std::uint32_t query_height
);

}

#endif
