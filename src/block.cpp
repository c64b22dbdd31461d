#include <iostream>
#include <vector>
#include <cstdint>
#include <cg++/block.hpp>
#include <cg++/util.hpp>


namespace cg {

std::vector<std::uint8_t> block::serialize() const
{
    std::vector<std::uint8_t> ret;

    cg::util::append_u32(ret, version);
    cg::util::append_bytes(ret, prev_block.v);
    cg::util::append_bytes(ret, merkle_root.v);
    cg::util::append_u32(ret, timestamp);
    cg::util::append_u32(ret, bits);
    cg::util::append_u32(ret, nonce);

    cg::util::append_var_int(ret, txs.size());

    for (auto & tx : txs) {
        cg::util::append_bytes(ret, tx.serialized);
    }

    return ret;
}

}

std::ostream & operator<<(std::ostream &os, const cg::block & block)
{
    os
        << "block_hash:  " << block.block_hash.decompress(true) << "\n"
        << "version:     " << block.version << "\n"
        << "prev_block:  " << block.prev_block.decompress(true) << "\n"
        << "merkle_root: " << block.merkle_root.decompress(true) << "\n"
        << "timestamp:   " << block.timestamp << "\n"
        << "bits:        " << block.bits << "\n"
        << "nonce:       " << block.nonce << "\n";

    for (const auto & tx : block.txs) {
        os << "--------------------------------------------------------------------------------\n";
        os << tx;
    }

    return os;
}
