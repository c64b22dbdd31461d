#ifndef CG_OUTPOINT_HPP
#define CG_OUTPOINT_HPP

#include <cstdint>
#include <string>
#include <absl/hash/hash.h>
#include <cg++/bhash.hpp>
#include <cg++/scriptpubkey.hpp>


namespace cg {

struct outpoint
{
    cg::txid      txid;
    std::uint32_t vout;

    outpoint()
    : vout(0)
    {}

    outpoint(
        const cg::txid      txid,
        const std::uint32_t vout
    )
    : txid(txid)
    , vout(vout)
    {}

    // coinbase inputs spend the null outpoint
    bool is_null() const
    { return txid.is_null() && vout == 0xFFFFFFFF; }

    std::string to_string() const
    { return txid.decompress(true) + ":" + std::to_string(vout); }

    bool operator==(const outpoint &o) const
    { return txid == o.txid && vout == o.vout; }

    bool operator!=(const outpoint &o) const
    { return ! operator==(o); }

    bool operator<(const outpoint &o) const
    {
        if (txid != o.txid) {
            return txid < o.txid;
        }

        return vout < o.vout;
    }

    template <typename H>
    friend H AbslHashValue(H h, const outpoint& m)
    {
        return H::combine(std::move(h), m.txid, m.vout);
    }
};

struct txout
{
    std::uint64_t    value;
    cg::scriptpubkey scriptpubkey;

    txout()
    : value(0)
    {}

    txout (
        const std::uint64_t    value,
        const cg::scriptpubkey scriptpubkey
    )
    : value(value)
    , scriptpubkey(scriptpubkey)
    {}

    bool operator==(const txout &o) const
    { return value == o.value && scriptpubkey == o.scriptpubkey; }

    bool operator!=(const txout &o) const
    { return ! operator==(o); }

    template <typename H>
    friend H AbslHashValue(H h, const txout& m)
    {
        return H::combine(std::move(h), m.value, m.scriptpubkey);
    }
};

}

#endif
