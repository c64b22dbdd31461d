#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <cg++/canonical_view.hpp>

namespace cg {

absl::optional<std::uint32_t> chain_position::confirmation_height() const
{
    if (const auto * p = absl::get_if<cg::confirmed_position>(&v)) {
        return p->height;
    }

    return absl::nullopt;
}

absl::optional<std::uint64_t> chain_position::last_seen() const
{
    if (const auto * p = absl::get_if<cg::unconfirmed_position>(&v)) {
        return p->last_seen;
    }

    return absl::nullopt;
}

std::string chain_position::to_string() const
{
    if (const auto * p = absl::get_if<cg::confirmed_position>(&v)) {
        return "confirmed at " + std::to_string(p->height);
    }

    return "unconfirmed, last seen " + std::to_string(absl::get<cg::unconfirmed_position>(v).last_seen);
}

bool chain_position::operator==(const chain_position& o) const
{
    if (v.index() != o.v.index()) {
        return false;
    }

    if (is_confirmed()) {
        const auto & a = absl::get<cg::confirmed_position>(v);
        const auto & b = absl::get<cg::confirmed_position>(o.v);
        return a.height == b.height && a.anchor == b.anchor;
    }

    return last_seen() == o.last_seen();
}


cg::canonical_status canonical_view::status(const cg::txid& txid) const
{
    if (canonical.count(txid)) {
        return cg::canonical_status::CANONICAL;
    }
    if (not_canonical.count(txid)) {
        return cg::canonical_status::NOT_CANONICAL;
    }

    return cg::canonical_status::UNKNOWN;
}

absl::optional<cg::chain_position> canonical_view::position(const cg::txid& txid) const
{
    const auto it = canonical.find(txid);
    if (it == canonical.end()) {
        return absl::nullopt;
    }

    return it->second.position;
}

absl::optional<cg::spent_by> canonical_view::spend_status(const cg::outpoint& outpoint) const
{
    const auto it = canonical_spends.find(outpoint);
    if (it == canonical_spends.end()) {
        return absl::nullopt;
    }

    return cg::spent_by{ it->second, canonical.at(it->second).position };
}

std::vector<cg::canonical_tx> canonical_view::canonical_txs() const
{
    std::vector<cg::canonical_tx> ret;
    ret.reserve(canonical.size());

    for (const auto & m : canonical) {
        ret.push_back(m.second);
    }

    std::sort(ret.begin(), ret.end(), [](const cg::canonical_tx& a, const cg::canonical_tx& b) {
        const bool a_confirmed = a.position.is_confirmed();
        const bool b_confirmed = b.position.is_confirmed();

        if (a_confirmed != b_confirmed) {
            return a_confirmed;
        }

        if (a_confirmed) {
            const std::uint32_t ah = *a.position.confirmation_height();
            const std::uint32_t bh = *b.position.confirmation_height();
            if (ah != bh) {
                return ah < bh;
            }
        } else {
            const std::uint64_t as = *a.position.last_seen();
            const std::uint64_t bs = *b.position.last_seen();
            if (as != bs) {
                return as < bs;
            }
        }

        return a.txid < b.txid;
    });

    return ret;
}

std::vector<cg::canonical_txout> canonical_view::canonical_txouts() const
{
    std::vector<cg::canonical_txout> ret;

    for (const cg::canonical_tx & ctx : canonical_txs()) {
        for (std::uint32_t vout=0; vout<ctx.tx.outputs.size(); ++vout) {
            const cg::outpoint outpoint(ctx.txid, vout);

            ret.push_back(cg::canonical_txout{
                outpoint,
                ctx.tx.outputs[vout],
                ctx.position,
                ctx.tx.is_coinbase(),
                spend_status(outpoint)
            });
        }
    }

    return ret;
}

std::vector<cg::canonical_txout> canonical_view::unspent() const
{
    std::vector<cg::canonical_txout> ret = canonical_txouts();

    ret.erase(std::remove_if(ret.begin(), ret.end(), [](const cg::canonical_txout& m) {
        return m.spent.has_value();
    }), ret.end());

    return ret;
}


namespace {

enum class decision : std::uint8_t
{
    undecided,
    canonical,
    not_canonical,
};

// nullopt position: anchored only to blocks the oracle rejected
struct candidate
{
    const cg::transaction*             tx;
    absl::optional<cg::chain_position> position;
    std::uint64_t                      effective_last_seen;
};

// in-graph parents with a known body, deduplicated
std::vector<cg::txid> known_parents(
    const cg::tx_graph& graph,
    const cg::transaction& tx
) {
    std::vector<cg::txid> ret;
    if (tx.is_coinbase()) {
        return ret;
    }

    for (const cg::outpoint & m : tx.inputs) {
        if (graph.get_tx(m.txid) == nullptr) {
            continue;
        }

        if (std::find(ret.begin(), ret.end(), m.txid) == ret.end()) {
            ret.push_back(m.txid);
        }
    }

    return ret;
}

// ancestors first. iterative so deep chains of unconfirmed transactions
// cannot exhaust the stack
cg::status topological_order(
    const std::vector<cg::txid>& roots,
    const absl::flat_hash_map<cg::txid, std::vector<cg::txid>>& parents,
    std::vector<cg::txid>& order
) {
    enum class color : std::uint8_t { white, grey, black };
    absl::flat_hash_map<cg::txid, color> colors;
    colors.reserve(roots.size());

    order.clear();
    order.reserve(roots.size());

    for (const cg::txid & root : roots) {
        if (colors[root] != color::white) {
            continue;
        }

        std::vector<std::pair<cg::txid, std::size_t>> stack = { { root, 0 } };
        colors[root] = color::grey;

        while (! stack.empty()) {
            const cg::txid current = stack.back().first;
            const std::size_t idx  = stack.back().second;
            const std::vector<cg::txid> & ps = parents.at(current);

            if (idx < ps.size()) {
                ++stack.back().second;

                const cg::txid & parent = ps[idx];
                color & c = colors[parent];

                if (c == color::grey) {
                    spdlog::error("canonical_view: dependency cycle through {}", parent.decompress(true));
                    return cg::status::DATA_INCONSISTENCY;
                }

                if (c == color::white) {
                    c = color::grey;
                    stack.emplace_back(parent, 0);
                }
            } else {
                colors[current] = color::black;
                order.push_back(current);
                stack.pop_back();
            }
        }
    }

    return cg::status::OK;
}

}

cg::canonical_view_response build_canonical_view(
    const cg::tx_graph& graph,
    const cg::chain_oracle& oracle,
    const std::uint32_t query_height
) {
    cg::canonical_view view;
    view.query_height = query_height;

    std::vector<cg::txid> full_txids;
    full_txids.reserve(graph.txs.size());

    for (const auto & m : graph.txs) {
        if (m.second.is_full()) {
            full_txids.push_back(m.first);
        } else {
            view.not_canonical.insert(m.first);
        }
    }
    std::sort(full_txids.begin(), full_txids.end());

    absl::flat_hash_map<cg::txid, std::vector<cg::txid>> parents;
    absl::flat_hash_map<cg::txid, std::vector<cg::txid>> children;
    parents.reserve(full_txids.size());

    for (const cg::txid & txid : full_txids) {
        parents[txid] = known_parents(graph, *graph.get_tx(txid));
        children[txid];
    }
    for (const cg::txid & txid : full_txids) {
        for (const cg::txid & parent : parents[txid]) {
            children[parent].push_back(txid);
        }
    }

    std::vector<cg::txid> order;
    {
        const cg::status s = topological_order(full_txids, parents, order);
        if (s != cg::status::OK) {
            return { s, {} };
        }
    }

    // positions from anchors, every block is asked about once
    absl::flat_hash_map<cg::block_id, absl::optional<bool>> oracle_answers;
    absl::flat_hash_map<cg::txid, candidate> candidates;
    candidates.reserve(full_txids.size());

    for (const cg::txid & txid : full_txids) {
        const std::set<cg::anchor> & anchors = graph.anchors(txid);

        std::vector<cg::anchor> valid;
        bool rejected = false;

        for (const cg::anchor & a : anchors) {
            auto answer = oracle_answers.find(a.anchor_block());
            if (answer == oracle_answers.end()) {
                const cg::block_in_chain_response r = oracle.is_block_in_best_chain(a.anchor_block(), query_height);
                if (r.first != cg::status::OK) {
                    spdlog::error("canonical_view: oracle unavailable for {}", a.anchor_block().to_string());
                    return { cg::status::ORACLE_UNAVAILABLE, {} };
                }

                answer = oracle_answers.insert({ a.anchor_block(), r.second }).first;
            }

            if (! answer->second) {
                continue;
            }

            if (*answer->second) {
                valid.push_back(a);
            } else {
                rejected = true;
            }
        }

        candidate c { graph.get_tx(txid), absl::nullopt, 0 };

        if (! valid.empty()) {
            const auto best = std::min_element(valid.begin(), valid.end(), [](const cg::anchor& a, const cg::anchor& b) {
                if (a.confirmation_height_upper_bound() != b.confirmation_height_upper_bound()) {
                    return a.confirmation_height_upper_bound() < b.confirmation_height_upper_bound();
                }
                return a < b;
            });

            const bool mixed_heights = std::any_of(valid.begin(), valid.end(), [&](const cg::anchor& a) {
                return a.confirmation_height_upper_bound() != best->confirmation_height_upper_bound();
            });
            if (mixed_heights) {
                spdlog::warn("canonical_view: {} has {} valid anchors at different heights, using {}",
                    txid.decompress(true), valid.size(), best->confirmation_height_upper_bound());
                view.hazard_list.push_back(cg::consistency_hazard{ txid, valid });
            }

            c.position = cg::chain_position(cg::confirmed_position{ *best, best->confirmation_height_upper_bound() });
        } else if (! rejected) {
            const std::uint64_t last_seen = graph.last_seen(txid).value_or(0);
            c.position = cg::chain_position(cg::unconfirmed_position{ last_seen });
            c.effective_last_seen = last_seen;
        } else {
            spdlog::debug("canonical_view: {} only anchored to blocks outside the best chain", txid.decompress(true));
        }

        candidates.emplace(txid, c);
    }

    // two confirmed spenders of one output cannot both be in the best chain
    for (const auto & m : graph.spends) {
        if (m.second.size() < 2) {
            continue;
        }

        std::vector<cg::txid> confirmed;
        for (const cg::txid & spender : m.second) {
            const auto it = candidates.find(spender);
            if (it != candidates.end() && it->second.position && it->second.position->is_confirmed()) {
                confirmed.push_back(spender);
            }
        }

        if (confirmed.size() > 1) {
            spdlog::error("canonical_view: {} spent by {} and {}, both confirmed",
                m.first.to_string(), confirmed[0].decompress(true), confirmed[1].decompress(true));
            return { cg::status::DATA_INCONSISTENCY, {} };
        }
    }

    // an unconfirmed child seen in the mempool implies its parents were there too
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        candidate & c = candidates.at(*it);
        if (! c.position || c.position->is_confirmed()) {
            continue;
        }

        for (const cg::txid & child : children.at(*it)) {
            const candidate & cc = candidates.at(child);
            if (cc.position && ! cc.position->is_confirmed()) {
                c.effective_last_seen = std::max(c.effective_last_seen, cc.effective_last_seen);
            }
        }
    }

    std::vector<cg::txid> priority;
    priority.reserve(candidates.size());
    for (const cg::txid & txid : full_txids) {
        if (candidates.at(txid).position) {
            priority.push_back(txid);
        }
    }

    std::sort(priority.begin(), priority.end(), [&](const cg::txid& a, const cg::txid& b) {
        const candidate & ca = candidates.at(a);
        const candidate & cb = candidates.at(b);

        const bool a_confirmed = ca.position->is_confirmed();
        const bool b_confirmed = cb.position->is_confirmed();

        if (a_confirmed != b_confirmed) {
            return a_confirmed;
        }

        if (a_confirmed) {
            const std::uint32_t ah = *ca.position->confirmation_height();
            const std::uint32_t bh = *cb.position->confirmation_height();
            if (ah != bh) {
                return ah < bh;
            }
            return a < b;
        }

        if (ca.effective_last_seen != cb.effective_last_seen) {
            return ca.effective_last_seen > cb.effective_last_seen;
        }

        // deterministic tie break, higher txid wins
        return a > b;
    });

    absl::flat_hash_map<cg::txid, decision> decisions;
    decisions.reserve(full_txids.size());
    for (const cg::txid & txid : full_txids) {
        decisions[txid] = decision::undecided;
    }

    auto reject_with_descendants = [&](const cg::txid& txid) {
        if (decisions[txid] == decision::undecided) {
            decisions[txid] = decision::not_canonical;
        }

        for (const cg::txid & d : graph.walk_descendants(txid)) {
            const auto it = decisions.find(d);
            if (it != decisions.end() && it->second == decision::undecided) {
                it->second = decision::not_canonical;
            }
        }
    };

    for (const cg::txid & txid : priority) {
        if (decisions.at(txid) != decision::undecided) {
            continue;
        }

        // the transaction together with every ancestor not yet accepted
        std::vector<cg::txid> package = { txid };
        absl::flat_hash_set<cg::txid> in_package = { txid };
        bool ok = true;

        for (std::size_t i=0; ok && i<package.size(); ++i) {
            for (const cg::txid & parent : parents.at(package[i])) {
                const decision d = decisions.at(parent);

                if (d == decision::canonical) {
                    continue;
                }

                if (d == decision::not_canonical || ! candidates.at(parent).position) {
                    ok = false;
                    break;
                }

                if (in_package.insert(parent).second) {
                    package.push_back(parent);
                }
            }
        }

        absl::flat_hash_set<cg::outpoint> package_spends;
        for (std::size_t i=0; ok && i<package.size(); ++i) {
            const cg::transaction & tx = *candidates.at(package[i]).tx;
            if (tx.is_coinbase()) {
                continue;
            }

            for (const cg::outpoint & o : tx.inputs) {
                if (! package_spends.insert(o).second) {
                    ok = false;
                    break;
                }

                for (const cg::txid & spender : graph.outspends(o)) {
                    if (spender != tx.txid && decisions.at(spender) == decision::canonical) {
                        ok = false;
                        break;
                    }
                }

                if (! ok) {
                    break;
                }
            }
        }

        if (! ok) {
            spdlog::debug("canonical_view: {} not canonical", txid.decompress(true));
            reject_with_descendants(txid);
            continue;
        }

        for (const cg::txid & m : package) {
            decisions[m] = decision::canonical;
        }

        for (const cg::txid & m : package) {
            const cg::transaction & tx = *candidates.at(m).tx;
            for (const auto & conflict : graph.direct_conflicts(tx)) {
                spdlog::debug("canonical_view: {} replaced by {}",
                    conflict.second.decompress(true), m.decompress(true));
                reject_with_descendants(conflict.second);
            }
        }
    }

    // a confirmed child means an unconfirmed parent was mined no later than
    // it was. children come first so this carries through whole chains
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (decisions.at(*it) != decision::canonical) {
            continue;
        }

        candidate & c = candidates.at(*it);
        if (c.position->is_confirmed()) {
            continue;
        }

        for (const cg::txid & child : children.at(*it)) {
            if (decisions.at(child) != decision::canonical) {
                continue;
            }

            const candidate & cc = candidates.at(child);
            if (! cc.position->is_confirmed()) {
                continue;
            }

            if (! c.position->is_confirmed()
             || *cc.position->confirmation_height() < *c.position->confirmation_height()
            ) {
                c.position = cc.position;
            }
        }
    }

    for (const cg::txid & txid : full_txids) {
        if (decisions.at(txid) != decision::canonical) {
            view.not_canonical.insert(txid);
            continue;
        }

        const candidate & c = candidates.at(txid);
        view.canonical.emplace(txid, cg::canonical_tx{ txid, *c.position, *c.tx });

        if (! c.tx->is_coinbase()) {
            for (const cg::outpoint & o : c.tx->inputs) {
                view.canonical_spends.emplace(o, txid);
            }
        }
    }

    spdlog::debug("canonical_view: {} canonical {} not canonical at height {}",
        view.canonical.size(), view.not_canonical.size(), query_height);

    return { cg::status::OK, view };
}

}
