#ifndef CG_BLOCK_HPP
#define CG_BLOCK_HPP

#include <cstdint>
#include <vector>
#include <algorithm>
#include <iostream>

#include <cg++/transaction.hpp>
#include <cg++/bhash.hpp>
#include <cg++/util.hpp>

namespace cg {

struct block
{
    cg::blockhash block_hash;
    std::uint32_t version;
    cg::blockhash prev_block;
    cg::txid merkle_root;
    std::uint32_t timestamp;
    std::uint32_t bits;
    std::uint32_t nonce;
    std::vector<cg::transaction> txs;

    block()
    : version(0)
    , timestamp(0)
    , bits(0)
    , nonce(0)
    {}

    template <typename BeginIterator, typename EndIterator>
    bool hydrate(
        BeginIterator&& begin_it,
        EndIterator&& end_it
    ) {
        #define CHECK_END(n) {    \
            if (static_cast<std::uint64_t>(end_it - it) < static_cast<std::uint64_t>(n)) { \
                return false;     \
            }                     \
        }

        txs.clear();

        auto it = begin_it;

        CHECK_END(80);
        const std::vector<std::uint8_t> block_header(it, it+80);

        this->version = cg::util::extract_u32(it);

        std::copy(it, it+32, this->prev_block.begin());
        it+=32;

        std::copy(it, it+32, this->merkle_root.begin());
        it+=32;

        this->timestamp = cg::util::extract_u32(it);
        this->bits      = cg::util::extract_u32(it);
        this->nonce     = cg::util::extract_u32(it);

        this->block_hash = cg::blockhash(cg::util::sha256d(block_header));

        CHECK_END(1);
        CHECK_END(1+cg::util::var_int_additional_size(it));
        const std::uint64_t txn_count { cg::util::extract_var_int(it) };
        for (std::uint64_t i=0; i<txn_count; ++i) {
            cg::transaction tx;
            if (! tx.hydrate(it, end_it)) {
                return false;
            }

            it += tx.serialized.size();
            txs.push_back(std::move(tx));
        }

        return true;
#undef CHECK_END
    }

    std::vector<std::uint8_t> serialize() const;
};

}

std::ostream & operator<<(std::ostream &os, const cg::block & block);

#endif
