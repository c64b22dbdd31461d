#ifndef CG_ANCHOR_HPP
#define CG_ANCHOR_HPP

#include <cstdint>
#include <vector>
#include <string>
#include <algorithm>
#include <absl/types/variant.h>
#include <absl/types/optional.h>
#include <absl/hash/hash.h>
#include <cg++/block_id.hpp>
#include <cg++/util.hpp>

namespace cg {

// the confirmation block may be an ancestor of the anchor block, which is
// what lets a sync source anchor to its tip instead of the exact block
struct confirmation_height_anchor
{
    cg::block_id  anchor_block;
    std::uint32_t confirmation_height;

    confirmation_height_anchor()
    : confirmation_height(0)
    {}

    confirmation_height_anchor(
        const cg::block_id  anchor_block,
        const std::uint32_t confirmation_height
    )
    : anchor_block(anchor_block)
    , confirmation_height(confirmation_height)
    {}
};

struct confirmation_time_anchor
{
    cg::block_id  anchor_block;
    std::uint32_t confirmation_height;
    std::uint64_t confirmation_time;

    confirmation_time_anchor()
    : confirmation_height(0)
    , confirmation_time(0)
    {}

    confirmation_time_anchor(
        const cg::block_id  anchor_block,
        const std::uint32_t confirmation_height,
        const std::uint64_t confirmation_time
    )
    : anchor_block(anchor_block)
    , confirmation_height(confirmation_height)
    , confirmation_time(confirmation_time)
    {}
};

enum class anchor_type : std::uint8_t
{
    block               = 0,
    confirmation_height = 1,
    confirmation_time   = 2,
};

// evidence that a transaction is included in the chain ending at anchor_block
struct anchor
{
    absl::variant<
        cg::block_id,
        cg::confirmation_height_anchor,
        cg::confirmation_time_anchor
    > v;

    anchor()
    : v(cg::block_id())
    {}

    anchor(const cg::block_id& m)
    : v(m)
    {}

    anchor(const cg::confirmation_height_anchor& m)
    : v(m)
    {}

    anchor(const cg::confirmation_time_anchor& m)
    : v(m)
    {}

    cg::anchor_type type() const
    { return static_cast<cg::anchor_type>(v.index()); }

    const cg::block_id& anchor_block() const;

    // the transaction is confirmed at or below this height
    std::uint32_t confirmation_height_upper_bound() const;

    absl::optional<std::uint64_t> confirmation_time() const;

    std::string to_string() const;

    void serialize(std::vector<std::uint8_t>& out) const;

    // returns false on malformed or truncated input
    template <typename Iterator>
    bool hydrate(
        Iterator& it,
        const Iterator& end_it
    ) {
        #define CHECK_END(n) {    \
            if (static_cast<std::uint64_t>(end_it - it) < static_cast<std::uint64_t>(n)) { \
                return false;     \
            }                     \
        }

        CHECK_END(1+4+32);
        const std::uint8_t type = cg::util::extract_u8(it);

        cg::block_id anchor_block;
        anchor_block.height = cg::util::extract_u32(it);
        std::copy(it, it+32, anchor_block.hash.begin());
        it+=32;

        switch (static_cast<cg::anchor_type>(type)) {
            case cg::anchor_type::block:
                v = anchor_block;
                return true;
            case cg::anchor_type::confirmation_height: {
                CHECK_END(4);
                const std::uint32_t confirmation_height = cg::util::extract_u32(it);
                v = cg::confirmation_height_anchor(anchor_block, confirmation_height);
                return true;
            }
            case cg::anchor_type::confirmation_time: {
                CHECK_END(4+8);
                const std::uint32_t confirmation_height = cg::util::extract_u32(it);
                const std::uint64_t confirmation_time   = cg::util::extract_u64(it);
                v = cg::confirmation_time_anchor(anchor_block, confirmation_height, confirmation_time);
                return true;
            }
        }

        return false;
#undef CHECK_END
    }

    bool operator==(const anchor &o) const;

    bool operator!=(const anchor &o) const
    { return ! operator==(o); }

    bool operator<(const anchor &o) const;

    template <typename H>
    friend H AbslHashValue(H h, const anchor& m)
    {
        return H::combine(
            std::move(h),
            m.v.index(),
            m.anchor_block(),
            m.confirmation_height_upper_bound(),
            m.confirmation_time().value_or(0)
        );
    }
};

}

#endif
