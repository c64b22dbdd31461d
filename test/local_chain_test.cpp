#define CATCH_CONFIG_MAIN

#include <map>
#include <vector>
#include <utility>

#include <catch2/catch.hpp>

#include <cg++/local_chain.hpp>
#include <cg++/chain_oracle.hpp>
#include "helpers.hpp"

using cg_test::blockhash_of;

namespace {

bool strictly_increasing(const cg::local_chain& chain)
{
    const std::vector<cg::block_id> cps = chain.checkpoints();
    for (std::size_t i=1; i<cps.size(); ++i) {
        if (cps[i-1].height >= cps[i].height) {
            return false;
        }
    }

    return true;
}

}

TEST_CASE( "reorg replaces the conflicting checkpoint and everything above", "[local_chain]" ) {
    cg::local_chain chain(blockhash_of('0'));
    chain.insert_block(100, blockhash_of('a'));
    chain.insert_block(101, blockhash_of('b'));
    chain.insert_block(102, blockhash_of('d'));

    const cg::chain_changeset changeset = chain.insert_block(101, blockhash_of('c'));

    REQUIRE( chain.block_id_at(101) == cg::block_id(101, blockhash_of('c')) );
    REQUIRE( ! chain.block_id_at(102) );
    REQUIRE( chain.block_id_at(100) == cg::block_id(100, blockhash_of('a')) );
    REQUIRE( chain.tip() == cg::block_id(101, blockhash_of('c')) );
    REQUIRE( strictly_increasing(chain) );

    // the replaced block is no longer indexed
    REQUIRE( ! chain.height_of(blockhash_of('b')) );
    REQUIRE( ! chain.height_of(blockhash_of('d')) );
    REQUIRE( chain.height_of(blockhash_of('c')) == 101U );

    cg::chain_changeset expected;
    expected.blocks.emplace_back(102, absl::nullopt);
    expected.blocks.emplace_back(101, blockhash_of('c'));
    REQUIRE( changeset == expected );
}

TEST_CASE( "inserting below the tip drops everything above", "[local_chain]" ) {
    cg::local_chain chain(blockhash_of('0'));
    chain.insert_block(10, blockhash_of('a'));
    chain.insert_block(20, blockhash_of('b'));
    chain.insert_block(30, blockhash_of('c'));

    chain.insert_block(15, blockhash_of('d'));

    REQUIRE( chain.size() == 3 );
    REQUIRE( chain.tip() == cg::block_id(15, blockhash_of('d')) );
    REQUIRE( strictly_increasing(chain) );
}

TEST_CASE( "reinserting the tip is a no-op", "[local_chain]" ) {
    cg::local_chain chain(blockhash_of('0'));
    chain.insert_block(5, blockhash_of('a'));

    const cg::local_chain before = chain;
    REQUIRE( chain.insert_block(5, blockhash_of('a')).is_empty() );
    REQUIRE( chain == before );
}

TEST_CASE( "disconnect_from removes the height and above", "[local_chain]" ) {
    cg::local_chain chain = cg::local_chain::from_blocks({
        { 0,   blockhash_of('0') },
        { 100, blockhash_of('a') },
        { 200, blockhash_of('b') },
        { 300, blockhash_of('c') },
    });

    const cg::chain_changeset changeset = chain.disconnect_from(200);

    REQUIRE( chain.tip() == cg::block_id(100, blockhash_of('a')) );
    REQUIRE( changeset.blocks.size() == 2 );
    REQUIRE( chain.disconnect_from(200).is_empty() );
}

TEST_CASE( "malformed changesets leave the chain untouched", "[local_chain]" ) {
    cg::local_chain chain(blockhash_of('0'));
    chain.insert_block(1, blockhash_of('a'));
    const cg::local_chain before = chain;

    cg::chain_changeset changeset;
    changeset.blocks.emplace_back(2, blockhash_of('b'));
    changeset.blocks.emplace_back(5, blockhash_of('c'));
    changeset.blocks.emplace_back(5, blockhash_of('d'));

    REQUIRE( changeset.validate() == cg::status::MALFORMED_CHANGESET );
    REQUIRE( chain.apply_changeset(changeset) == cg::status::MALFORMED_CHANGESET );
    REQUIRE( chain == before );

    const std::pair<cg::status, cg::local_chain> from = cg::local_chain::from_changeset(changeset);
    REQUIRE( from.first == cg::status::MALFORMED_CHANGESET );
}

TEST_CASE( "a height repeated with the same value is not malformed", "[local_chain]" ) {
    cg::chain_changeset changeset;
    changeset.blocks.emplace_back(7, blockhash_of('a'));
    changeset.blocks.emplace_back(7, blockhash_of('a'));
    changeset.blocks.emplace_back(8, absl::nullopt);
    changeset.blocks.emplace_back(8, absl::nullopt);

    REQUIRE( changeset.validate() == cg::status::OK );
}

TEST_CASE( "changeset append lets later entries win", "[local_chain]" ) {
    cg::chain_changeset a;
    a.blocks.emplace_back(3, blockhash_of('a'));
    a.blocks.emplace_back(1, blockhash_of('b'));

    cg::chain_changeset b;
    b.blocks.emplace_back(3, absl::nullopt);
    b.blocks.emplace_back(2, blockhash_of('c'));

    a.append(b);

    cg::chain_changeset expected;
    expected.blocks.emplace_back(1, blockhash_of('b'));
    expected.blocks.emplace_back(2, blockhash_of('c'));
    expected.blocks.emplace_back(3, absl::nullopt);
    REQUIRE( a == expected );
    REQUIRE( a.validate() == cg::status::OK );
}

TEST_CASE( "replaying the changesets of a chain rebuilds it", "[local_chain]" ) {
    cg::local_chain chain(blockhash_of('0'));
    cg::chain_changeset log = chain.initial_changeset();

    log.append(chain.insert_block(10, blockhash_of('a')));
    log.append(chain.insert_block(11, blockhash_of('b')));
    log.append(chain.insert_block(11, blockhash_of('c')));
    log.append(chain.insert_block(12, blockhash_of('d')));
    log.append(chain.disconnect_from(12));

    const std::pair<cg::status, cg::local_chain> replayed = cg::local_chain::from_changeset(log);
    REQUIRE( replayed.first == cg::status::OK );
    REQUIRE( replayed.second == chain );

    std::vector<std::uint8_t> data;
    log.serialize(data);

    cg::chain_changeset decoded;
    std::vector<std::uint8_t>::const_iterator it = data.cbegin();
    const std::vector<std::uint8_t>::const_iterator end_it = data.cend();
    REQUIRE( decoded.hydrate(it, end_it) );
    REQUIRE( it == end_it );
    REQUIRE( decoded == log );
}

TEST_CASE( "local chain answers as a chain oracle", "[local_chain][chain_oracle]" ) {
    const cg::local_chain chain = cg::local_chain::from_blocks({
        { 0,   blockhash_of('0') },
        { 100, blockhash_of('a') },
        { 200, blockhash_of('b') },
    });

    const cg::chain_oracle & oracle = chain;

    SECTION( "known block" ) {
        const cg::block_in_chain_response r = oracle.is_block_in_best_chain(cg::block_id(100, blockhash_of('a')), 200);
        REQUIRE( r.first == cg::status::OK );
        REQUIRE( r.second == true );
    }

    SECTION( "stale block at a known height" ) {
        const cg::block_in_chain_response r = oracle.is_block_in_best_chain(cg::block_id(100, blockhash_of('x')), 200);
        REQUIRE( r.first == cg::status::OK );
        REQUIRE( r.second == false );
    }

    SECTION( "above the query height" ) {
        const cg::block_in_chain_response r = oracle.is_block_in_best_chain(cg::block_id(200, blockhash_of('b')), 150);
        REQUIRE( r.first == cg::status::OK );
        REQUIRE( r.second == false );
    }

    SECTION( "above the tip" ) {
        const cg::block_in_chain_response r = oracle.is_block_in_best_chain(cg::block_id(250, blockhash_of('c')), 300);
        REQUIRE( r.first == cg::status::OK );
        REQUIRE( r.second == false );
    }

    SECTION( "between checkpoints" ) {
        const cg::block_in_chain_response r = oracle.is_block_in_best_chain(cg::block_id(150, blockhash_of('c')), 200);
        REQUIRE( r.first == cg::status::OK );
        REQUIRE( ! r.second );
    }

    SECTION( "tip" ) {
        const cg::chain_tip_response r = oracle.best_chain_tip();
        REQUIRE( r.first == cg::status::OK );
        REQUIRE( r.second == cg::block_id(200, blockhash_of('b')) );
    }
}

TEST_CASE( "callback oracle reports failures as unavailable", "[chain_oracle]" ) {
    const cg::callback_chain_oracle failing(
        [](const cg::block_id&, std::uint32_t) -> cg::block_in_chain_response {
            return { cg::status::IO_ERROR, absl::nullopt };
        },
        []() -> cg::chain_tip_response {
            return { cg::status::IO_ERROR, absl::nullopt };
        }
    );

    REQUIRE( failing.is_block_in_best_chain(cg::block_id(1, blockhash_of('a')), 10).first == cg::status::ORACLE_UNAVAILABLE );
    REQUIRE( failing.best_chain_tip().first == cg::status::ORACLE_UNAVAILABLE );

    const cg::callback_chain_oracle missing(nullptr, nullptr);
    REQUIRE( missing.is_block_in_best_chain(cg::block_id(1, blockhash_of('a')), 10).first == cg::status::ORACLE_UNAVAILABLE );
    REQUIRE( missing.best_chain_tip().first == cg::status::ORACLE_UNAVAILABLE );
}

TEST_CASE( "callback oracle never confirms blocks above the query height", "[chain_oracle]" ) {
    unsigned calls = 0;
    const cg::callback_chain_oracle oracle(
        [&](const cg::block_id&, std::uint32_t) -> cg::block_in_chain_response {
            ++calls;
            return { cg::status::OK, true };
        },
        []() -> cg::chain_tip_response {
            return { cg::status::OK, cg::block_id(50, blockhash_of('z')) };
        }
    );

    REQUIRE( oracle.is_block_in_best_chain(cg::block_id(60, blockhash_of('a')), 50).second == false );
    REQUIRE( calls == 0 );
    REQUIRE( oracle.is_block_in_best_chain(cg::block_id(40, blockhash_of('a')), 50).second == true );
    REQUIRE( calls == 1 );
    REQUIRE( oracle.best_chain_tip().second == cg::block_id(50, blockhash_of('z')) );
}

TEST_CASE( "an empty chain rejects every block", "[local_chain][chain_oracle]" ) {
    cg::local_chain chain = cg::local_chain::from_blocks({
        { 100, blockhash_of('a') },
        { 101, blockhash_of('b') },
    });

    chain.disconnect_from(100);
    REQUIRE( chain.empty() );

    const cg::block_in_chain_response r = chain.is_block_in_best_chain(cg::block_id(101, blockhash_of('b')), 101);
    REQUIRE( r.first == cg::status::OK );
    REQUIRE( r.second == false );

    REQUIRE( cg::local_chain().is_block_in_best_chain(cg::block_id(0, blockhash_of('0')), 0).second == false );
}
