#ifndef CG_BLOCK_ID_HPP
#define CG_BLOCK_ID_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <absl/hash/hash.h>
#include <cg++/bhash.hpp>

namespace cg {

struct block_id
{
    std::uint32_t height;
    cg::blockhash hash;

    block_id()
    : height(0)
    {}

    block_id(
        const std::uint32_t height,
        const cg::blockhash hash
    )
    : height(height)
    , hash(hash)
    {}

    std::string to_string() const
    { return std::to_string(height) + ":" + hash.decompress(true); }

    bool operator==(const block_id &o) const
    { return height == o.height && hash == o.hash; }

    bool operator!=(const block_id &o) const
    { return ! operator==(o); }

    bool operator<(const block_id &o) const
    {
        if (height != o.height) {
            return height < o.height;
        }

        return hash < o.hash;
    }

    template <typename H>
    friend H AbslHashValue(H h, const block_id& m)
    {
        return H::combine(std::move(h), m.height, m.hash);
    }
};

}

#endif
