#define CATCH_CONFIG_MAIN

#include <string>
#include <vector>
#include <fstream>
#include <utility>

#include <boost/filesystem.hpp>

#include <catch2/catch.hpp>

#include <cg++/changeset.hpp>
#include <cg++/changeset_store.hpp>
#include <cg++/wallet_state.hpp>
#include <cg++/block.hpp>
#include "helpers.hpp"

using cg_test::blockhash_of;
using cg_test::external_outpoint;
using cg_test::spend;

namespace {

// removed again when the test case ends
struct temp_path
{
    boost::filesystem::path path;

    explicit temp_path(const std::string& name)
    : path(boost::filesystem::temp_directory_path() / ("cg++-" + name))
    {
        boost::filesystem::remove(path);
    }

    ~temp_path()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(path, ec);
    }
};

cg::block make_block(
    const char hash,
    const std::uint32_t timestamp,
    const std::vector<cg::transaction>& txs
) {
    cg::block block;
    block.block_hash = blockhash_of(hash);
    block.timestamp  = timestamp;
    block.txs        = txs;
    return block;
}

// a short wallet history with a reorg and a double spend,
// every step yields the changeset it produced
std::vector<cg::changeset> run_history(cg::wallet_state& state)
{
    std::vector<cg::changeset> ret;
    ret.push_back(state.initial_changeset());

    const cg::transaction t1 = spend({ external_outpoint('x') }, 1000, 0, 2);
    const cg::transaction t2 = spend({ external_outpoint('x') }, 900);
    const cg::transaction t3 = spend({ cg::outpoint(t1.txid, 1) }, 500);

    ret.push_back(state.apply_unconfirmed_txs({ { t1, 10 }, { t2, 5 } }));
    ret.push_back(state.apply_block(make_block('a', 1000, { t1 }), 1));
    ret.push_back(state.apply_unconfirmed_txs({ { t3, 20 } }));
    ret.push_back(state.disconnect_from(1));
    ret.push_back(state.apply_block(make_block('b', 1100, { t1, t3 }), 1));
    ret.push_back(state.apply_block(make_block('c', 1200, {}), 2));

    return ret;
}

}

TEST_CASE( "changesets survive serialization", "[changeset]" ) {
    cg::wallet_state state(blockhash_of('0'));
    const std::vector<cg::changeset> history = run_history(state);

    for (const cg::changeset & m : history) {
        cg::changeset decoded;
        REQUIRE( decoded.hydrate(m.serialize()) == cg::status::OK );
        REQUIRE( decoded == m );
    }
}

TEST_CASE( "changeset decoding rejects damaged input", "[changeset]" ) {
    cg::wallet_state state(blockhash_of('0'));
    const std::vector<cg::changeset> history = run_history(state);

    std::vector<std::uint8_t> data = history[2].serialize();

    cg::changeset decoded;

    std::vector<std::uint8_t> truncated(data.begin(), data.end()-1);
    REQUIRE( decoded.hydrate(truncated) == cg::status::PARSE_ERROR );

    data.push_back(0x00);
    REQUIRE( decoded.hydrate(data) == cg::status::PARSE_ERROR );

    REQUIRE( decoded.hydrate({}) == cg::status::PARSE_ERROR );
}

TEST_CASE( "replaying changesets reproduces the state", "[changeset]" ) {
    cg::wallet_state state(blockhash_of('0'));
    const std::vector<cg::changeset> history = run_history(state);

    cg::wallet_state replayed;
    for (const cg::changeset & m : history) {
        REQUIRE( replayed.apply_changeset(m) == cg::status::OK );
    }

    REQUIRE( replayed.graph == state.graph );
    REQUIRE( replayed.chain == state.chain );

    cg::changeset aggregate;
    for (const cg::changeset & m : history) {
        aggregate.append(m);
    }

    cg::wallet_state from_aggregate;
    REQUIRE( from_aggregate.apply_changeset(aggregate) == cg::status::OK );
    REQUIRE( from_aggregate.graph == state.graph );
    REQUIRE( from_aggregate.chain == state.chain );

    const cg::canonical_view_response a = state.canonical_view();
    const cg::canonical_view_response b = from_aggregate.canonical_view();
    REQUIRE( a.first == cg::status::OK );
    REQUIRE( b.first == cg::status::OK );
    REQUIRE( a.second.canonical.size() == b.second.canonical.size() );
    REQUIRE( a.second.not_canonical == b.second.not_canonical );
}

TEST_CASE( "wallet state follows blocks", "[wallet_state]" ) {
    cg::wallet_state state(blockhash_of('0'));

    const cg::transaction mine  = spend({ external_outpoint('x') }, 1000);
    const cg::transaction other = spend({ external_outpoint('y') }, 1000);

    const cg::changeset changeset = state.apply_block(
        make_block('a', 1000, { mine, other }),
        1,
        [&](const cg::transaction& tx) { return tx.txid == mine.txid; }
    );

    REQUIRE( changeset.graph.txs.size() == 1 );
    REQUIRE( state.tip() == cg::block_id(1, blockhash_of('a')) );

    const cg::canonical_view_response view = state.canonical_view();
    REQUIRE( view.first == cg::status::OK );
    REQUIRE( view.second.status(mine.txid) == cg::canonical_status::CANONICAL );
    REQUIRE( view.second.status(other.txid) == cg::canonical_status::UNKNOWN );

    const absl::optional<cg::chain_position> position = view.second.position(mine.txid);
    REQUIRE( position );
    REQUIRE( position->is_confirmed() );
    REQUIRE( absl::get<cg::confirmed_position>(position->v).anchor.confirmation_time() == 1000U );

    state.disconnect_from(1);
    REQUIRE( state.canonical_view().second.status(mine.txid) == cg::canonical_status::NOT_CANONICAL );
}

TEST_CASE( "wallet state rejects malformed changesets whole", "[wallet_state]" ) {
    cg::wallet_state state(blockhash_of('0'));

    cg::changeset changeset;
    changeset.chain.blocks.emplace_back(3, blockhash_of('a'));
    changeset.chain.blocks.emplace_back(3, blockhash_of('b'));
    changeset.graph.append(cg::tx_graph().insert_tx(spend({ external_outpoint('x') }, 1000)));

    REQUIRE( state.apply_changeset(changeset) == cg::status::MALFORMED_CHANGESET );
    REQUIRE( state.graph.size() == 0 );
    REQUIRE( state.chain.size() == 1 );
}

TEST_CASE( "store appends and loads changesets in order", "[changeset_store]" ) {
    const temp_path tmp("store-roundtrip");

    cg::wallet_state state(blockhash_of('0'));
    const std::vector<cg::changeset> history = run_history(state);

    const std::pair<cg::status, cg::changeset_store> store = cg::changeset_store::create(tmp.path);
    REQUIRE( store.first == cg::status::OK );

    for (const cg::changeset & m : history) {
        REQUIRE( store.second.append(m) == cg::status::OK );
    }
    REQUIRE( store.second.append(cg::changeset()) == cg::status::OK );

    const std::pair<cg::status, cg::changeset_store> reopened = cg::changeset_store::open(tmp.path);
    REQUIRE( reopened.first == cg::status::OK );

    const std::pair<cg::status, std::vector<cg::changeset>> loaded = reopened.second.load();
    REQUIRE( loaded.first == cg::status::OK );

    std::vector<cg::changeset> non_empty;
    for (const cg::changeset & m : history) {
        if (! m.is_empty()) {
            non_empty.push_back(m);
        }
    }
    REQUIRE( loaded.second == non_empty );

    const std::pair<cg::status, cg::changeset> aggregate = reopened.second.aggregate();
    REQUIRE( aggregate.first == cg::status::OK );

    cg::wallet_state restored;
    REQUIRE( restored.apply_changeset(aggregate.second) == cg::status::OK );
    REQUIRE( restored.graph == state.graph );
    REQUIRE( restored.chain == state.chain );
}

TEST_CASE( "store refuses to overwrite and to open foreign files", "[changeset_store]" ) {
    const temp_path tmp("store-foreign");

    REQUIRE( cg::changeset_store::open(tmp.path).first == cg::status::IO_ERROR );
    REQUIRE( cg::changeset_store::create(tmp.path).first == cg::status::OK );
    REQUIRE( cg::changeset_store::create(tmp.path).first == cg::status::IO_ERROR );
    REQUIRE( cg::changeset_store::open_or_create(tmp.path).first == cg::status::OK );

    {
        std::ofstream ofs(tmp.path.string(), std::ios::out | std::ios::binary | std::ios::trunc);
        ofs << "not a changeset store";
    }

    REQUIRE( cg::changeset_store::open(tmp.path).first == cg::status::PARSE_ERROR );
}

TEST_CASE( "a truncated tail keeps the good records", "[changeset_store]" ) {
    const temp_path tmp("store-truncated");

    cg::wallet_state state(blockhash_of('0'));
    const std::vector<cg::changeset> history = run_history(state);

    const std::pair<cg::status, cg::changeset_store> store = cg::changeset_store::create(tmp.path);
    REQUIRE( store.first == cg::status::OK );
    REQUIRE( store.second.append(history[0]) == cg::status::OK );
    REQUIRE( store.second.append(history[1]) == cg::status::OK );

    const auto size = boost::filesystem::file_size(tmp.path);
    boost::filesystem::resize_file(tmp.path, size - 3);

    const std::pair<cg::status, std::vector<cg::changeset>> loaded = store.second.load();
    REQUIRE( loaded.first == cg::status::IO_ERROR );
    REQUIRE( loaded.second.size() == 1 );
    REQUIRE( loaded.second[0] == history[0] );
}
