#ifndef CG_TEST_HELPERS_HPP
#define CG_TEST_HELPERS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <map>

#include <cg++/bhash.hpp>
#include <cg++/outpoint.hpp>
#include <cg++/transaction.hpp>
#include <cg++/local_chain.hpp>
#include <cg++/anchor.hpp>

namespace cg_test {

// every byte set to c
inline cg::blockhash blockhash_of(const char c)
{
    std::array<std::uint8_t, 32> v;
    v.fill(static_cast<std::uint8_t>(c));
    return cg::blockhash(v);
}

inline cg::txid txid_of(const char c)
{
    std::array<std::uint8_t, 32> v;
    v.fill(static_cast<std::uint8_t>(c));
    return cg::txid(v);
}

inline cg::scriptpubkey script(const std::uint8_t n)
{
    return cg::scriptpubkey(std::vector<std::uint8_t>({ 0x51, n }));
}

// output of a transaction the graph never sees
inline cg::outpoint external_outpoint(const char c, const std::uint32_t vout = 0)
{
    return cg::outpoint(txid_of(c), vout);
}

// lock_time only makes otherwise equal transactions distinct
inline cg::transaction spend(
    const std::vector<cg::outpoint>& inputs,
    const std::uint64_t value,
    const std::uint32_t lock_time = 0,
    const std::uint32_t output_count = 1
) {
    std::vector<cg::txout> outputs;
    for (std::uint32_t i=0; i<output_count; ++i) {
        outputs.emplace_back(value, script(static_cast<std::uint8_t>(i)));
    }

    return cg::transaction::build(inputs, outputs, lock_time);
}

inline cg::transaction coinbase(const std::uint64_t value, const std::uint32_t lock_time = 0)
{
    return cg::transaction::build(
        { cg::outpoint(cg::txid(), 0xFFFFFFFF) },
        { cg::txout(value, script(0)) },
        lock_time
    );
}

inline cg::anchor anchor_at(const std::uint32_t height, const char c)
{
    return cg::anchor(cg::confirmation_height_anchor(
        cg::block_id(height, blockhash_of(c)),
        height
    ));
}

}

#endif
