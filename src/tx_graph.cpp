#include <cstdint>
#include <vector>
#include <set>
#include <map>
#include <deque>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <absl/container/flat_hash_set.h>

#include <cg++/tx_graph.hpp>
#include <cg++/util.hpp>

namespace cg {

namespace {

const std::set<cg::txid>   empty_txid_set;
const std::set<cg::anchor> empty_anchor_set;

}

bool preferred_body(const cg::transaction& a, const cg::transaction& b)
{
    return a.serialized > b.serialized;
}

bool tx_graph_changeset::is_empty() const
{
    return txs.empty()
        && txouts.empty()
        && anchors.empty()
        && last_seen.empty();
}

void tx_graph_changeset::append(const tx_graph_changeset& other)
{
    for (const auto & m : other.txs) {
        const auto p = txs.insert(m);
        if (! p.second && cg::preferred_body(m.second, p.first->second)) {
            p.first->second = m.second;
        }
    }
    txouts.insert(other.txouts.begin(), other.txouts.end());
    anchors.insert(other.anchors.begin(), other.anchors.end());

    for (const auto & m : other.last_seen) {
        const auto p = last_seen.insert(m);
        if (! p.second) {
            p.first->second = std::max(p.first->second, m.second);
        }
    }
}

void tx_graph_changeset::serialize(std::vector<std::uint8_t>& out) const
{
    cg::util::append_var_int(out, txs.size());
    for (const auto & m : txs) {
        cg::util::append_var_bytes(out, m.second.serialized);
    }

    cg::util::append_var_int(out, txouts.size());
    for (const auto & m : txouts) {
        cg::util::append_bytes(out, m.first.txid.v);
        cg::util::append_u32(out, m.first.vout);
        cg::util::append_u64(out, m.second.value);
        cg::util::append_var_bytes(out, m.second.scriptpubkey.v);
    }

    cg::util::append_var_int(out, anchors.size());
    for (const auto & m : anchors) {
        cg::util::append_bytes(out, m.second.v);
        m.first.serialize(out);
    }

    cg::util::append_var_int(out, last_seen.size());
    for (const auto & m : last_seen) {
        cg::util::append_bytes(out, m.first.v);
        cg::util::append_u64(out, m.second);
    }
}

bool tx_graph_changeset::hydrate(
    std::vector<std::uint8_t>::const_iterator& it,
    const std::vector<std::uint8_t>::const_iterator& end_it
) {
    #define CHECK_END(n) {    \
        if (static_cast<std::uint64_t>(end_it - it) < static_cast<std::uint64_t>(n)) { \
            return false;     \
        }                     \
    }

    #define EXTRACT_COUNT(var) \
        CHECK_END(1); \
        CHECK_END(1+cg::util::var_int_additional_size(it)); \
        const std::uint64_t var = cg::util::extract_var_int(it);

    txs.clear();
    txouts.clear();
    anchors.clear();
    last_seen.clear();

    EXTRACT_COUNT(tx_count);
    for (std::uint64_t i=0; i<tx_count; ++i) {
        EXTRACT_COUNT(tx_len);
        CHECK_END(tx_len);

        const auto tx_end_it = it + tx_len;
        cg::transaction tx;
        if (! tx.hydrate(it, tx_end_it) || tx.serialized.size() != tx_len) {
            spdlog::warn("tx_graph_changeset: bad transaction record {}", i);
            return false;
        }
        it = tx_end_it;

        txs.emplace(tx.txid, std::move(tx));
    }

    EXTRACT_COUNT(txout_count);
    for (std::uint64_t i=0; i<txout_count; ++i) {
        CHECK_END(32+4+8);
        cg::outpoint outpoint;
        std::copy(it, it+32, outpoint.txid.begin());
        it+=32;
        outpoint.vout = cg::util::extract_u32(it);

        cg::txout txout;
        txout.value = cg::util::extract_u64(it);

        EXTRACT_COUNT(script_len);
        CHECK_END(script_len);
        txout.scriptpubkey.v.assign(it, it+script_len);
        it+=script_len;

        txouts.emplace(outpoint, txout);
    }

    EXTRACT_COUNT(anchor_count);
    for (std::uint64_t i=0; i<anchor_count; ++i) {
        CHECK_END(32);
        cg::txid txid;
        std::copy(it, it+32, txid.begin());
        it+=32;

        cg::anchor anchor;
        if (! anchor.hydrate(it, end_it)) {
            return false;
        }

        anchors.emplace(anchor, txid);
    }

    EXTRACT_COUNT(last_seen_count);
    for (std::uint64_t i=0; i<last_seen_count; ++i) {
        CHECK_END(32+8);
        cg::txid txid;
        std::copy(it, it+32, txid.begin());
        it+=32;

        const std::uint64_t seen_at = cg::util::extract_u64(it);
        const auto p = last_seen.insert({ txid, seen_at });
        if (! p.second) {
            p.first->second = std::max(p.first->second, seen_at);
        }
    }

    return true;
#undef EXTRACT_COUNT
#undef CHECK_END
}

bool tx_graph_changeset::operator==(const tx_graph_changeset& o) const
{
    return txs       == o.txs
        && txouts    == o.txouts
        && anchors   == o.anchors
        && last_seen == o.last_seen;
}


tx_graph tx_graph::from_changeset(const tx_graph_changeset& changeset)
{
    tx_graph ret;
    ret.apply_changeset(changeset);
    return ret;
}

tx_graph_changeset tx_graph::insert_tx(const cg::transaction& tx)
{
    tx_graph_changeset changeset;

    cg::tx_node & node = txs[tx.txid];
    if (node.tx) {
        // same txid, different witness. inputs and outputs are identical
        // so the spend index is unaffected, only the stored bytes change
        if (cg::preferred_body(tx, *node.tx)) {
            spdlog::debug("tx_graph: replacing malleated copy of {}", tx.txid.decompress(true));
            node.tx = tx;
            changeset.txs.emplace(tx.txid, tx);
        }
        return changeset;
    }

    node.tx = tx;
    node.txouts.clear();

    if (! tx.is_coinbase()) {
        for (const cg::outpoint & m : tx.inputs) {
            spends[m].insert(tx.txid);
        }
    }

    changeset.txs.emplace(tx.txid, tx);
    return changeset;
}

tx_graph_changeset tx_graph::insert_txout(
    const cg::outpoint& outpoint,
    const cg::txout& txout
) {
    tx_graph_changeset changeset;

    cg::tx_node & node = txs[outpoint.txid];
    if (node.tx) {
        return changeset;
    }

    const auto p = node.txouts.insert({ outpoint.vout, txout });
    if (! p.second) {
        if (p.first->second != txout) {
            spdlog::warn("tx_graph: conflicting txout for {}, keeping the first one",
                outpoint.to_string());
        }
        return changeset;
    }

    changeset.txouts.emplace(outpoint, txout);
    return changeset;
}

tx_graph_changeset tx_graph::insert_anchor(
    const cg::txid& txid,
    const cg::anchor& anchor
) {
    tx_graph_changeset changeset;

    txs[txid]; // id-only until the body arrives

    if (tx_anchors[txid].insert(anchor).second) {
        changeset.anchors.emplace(anchor, txid);
    }

    return changeset;
}

tx_graph_changeset tx_graph::insert_seen_at(
    const cg::txid& txid,
    const std::uint64_t seen_at
) {
    tx_graph_changeset changeset;

    txs[txid];

    const auto p = last_seen_at.insert({ txid, seen_at });
    if (! p.second) {
        if (p.first->second >= seen_at) {
            return changeset;
        }
        p.first->second = seen_at;
    }

    changeset.last_seen.emplace(txid, seen_at);
    return changeset;
}

tx_graph_changeset tx_graph::apply(const tx_graph_changeset& changeset)
{
    tx_graph_changeset ret;

    for (const auto & m : changeset.txs) {
        ret.append(insert_tx(m.second));
    }
    for (const auto & m : changeset.txouts) {
        ret.append(insert_txout(m.first, m.second));
    }
    for (const auto & m : changeset.anchors) {
        ret.append(insert_anchor(m.second, m.first));
    }
    for (const auto & m : changeset.last_seen) {
        ret.append(insert_seen_at(m.first, m.second));
    }

    return ret;
}

void tx_graph::apply_changeset(const tx_graph_changeset& changeset)
{
    apply(changeset);
}

tx_graph_changeset tx_graph::merge(const tx_graph& other)
{
    return apply(other.initial_changeset());
}

tx_graph_changeset tx_graph::initial_changeset() const
{
    tx_graph_changeset ret;

    for (const auto & m : txs) {
        if (m.second.tx) {
            ret.txs.emplace(m.first, *m.second.tx);
        } else {
            for (const auto & o : m.second.txouts) {
                ret.txouts.emplace(cg::outpoint(m.first, o.first), o.second);
            }
        }
    }

    for (const auto & m : tx_anchors) {
        for (const cg::anchor & a : m.second) {
            ret.anchors.emplace(a, m.first);
        }
    }

    ret.last_seen.insert(last_seen_at.begin(), last_seen_at.end());

    return ret;
}

const std::set<cg::txid>& tx_graph::outspends(const cg::outpoint& outpoint) const
{
    const auto it = spends.find(outpoint);
    if (it == spends.end()) {
        return empty_txid_set;
    }

    return it->second;
}

const std::set<cg::txid>& tx_graph::outspends(
    const cg::txid& txid,
    const std::uint32_t vout
) const {
    return outspends(cg::outpoint(txid, vout));
}

const cg::transaction* tx_graph::get_tx(const cg::txid& txid) const
{
    const auto it = txs.find(txid);
    if (it == txs.end() || ! it->second.tx) {
        return nullptr;
    }

    return &(*it->second.tx);
}

const cg::txout* tx_graph::get_txout(const cg::outpoint& outpoint) const
{
    const auto it = txs.find(outpoint.txid);
    if (it == txs.end()) {
        return nullptr;
    }

    const cg::tx_node & node = it->second;
    if (node.tx) {
        if (outpoint.vout >= node.tx->outputs.size()) {
            return nullptr;
        }
        return &node.tx->outputs[outpoint.vout];
    }

    const auto o = node.txouts.find(outpoint.vout);
    if (o == node.txouts.end()) {
        return nullptr;
    }

    return &o->second;
}

const std::set<cg::anchor>& tx_graph::anchors(const cg::txid& txid) const
{
    const auto it = tx_anchors.find(txid);
    if (it == tx_anchors.end()) {
        return empty_anchor_set;
    }

    return it->second;
}

absl::optional<std::uint64_t> tx_graph::last_seen(const cg::txid& txid) const
{
    const auto it = last_seen_at.find(txid);
    if (it == last_seen_at.end()) {
        return absl::nullopt;
    }

    return it->second;
}

std::vector<std::pair<std::uint32_t, cg::txid>> tx_graph::direct_conflicts(
    const cg::transaction& tx
) const {
    std::vector<std::pair<std::uint32_t, cg::txid>> ret;

    if (tx.is_coinbase()) {
        return ret;
    }

    for (std::uint32_t vin=0; vin<tx.inputs.size(); ++vin) {
        for (const cg::txid & spender : outspends(tx.inputs[vin])) {
            if (spender != tx.txid) {
                ret.emplace_back(vin, spender);
            }
        }
    }

    return ret;
}

std::vector<cg::txid> tx_graph::walk_descendants(const cg::txid& txid) const
{
    std::vector<cg::txid> ret;
    absl::flat_hash_set<cg::txid> seen = { txid };
    std::deque<cg::txid> queue = { txid };

    while (! queue.empty()) {
        const cg::txid current = queue.front();
        queue.pop_front();

        const cg::transaction* tx = get_tx(current);
        if (tx == nullptr) {
            continue;
        }

        for (std::uint32_t vout=0; vout<tx->outputs.size(); ++vout) {
            for (const cg::txid & spender : outspends(current, vout)) {
                if (seen.insert(spender).second) {
                    ret.push_back(spender);
                    queue.push_back(spender);
                }
            }
        }
    }

    return ret;
}

std::size_t tx_graph::full_tx_count() const
{
    return std::count_if(txs.begin(), txs.end(), [](const auto & m) {
        return m.second.is_full();
    });
}

bool tx_graph::operator==(const tx_graph& o) const
{
    return txs          == o.txs
        && spends       == o.spends
        && tx_anchors   == o.tx_anchors
        && last_seen_at == o.last_seen_at;
}

}
