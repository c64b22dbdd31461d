#ifndef CG_LOCAL_CHAIN_HPP
#define CG_LOCAL_CHAIN_HPP

#include <cstdint>
#include <map>
#include <vector>
#include <utility>
#include <absl/types/optional.h>
#include <absl/container/flat_hash_map.h>
#include <cg++/bhash.hpp>
#include <cg++/block_id.hpp>
#include <cg++/block.hpp>
#include <cg++/status.hpp>
#include <cg++/chain_oracle.hpp>

namespace cg {

// delta to a local_chain, nullopt hash means the checkpoint was removed
struct chain_changeset
{
    std::vector<std::pair<std::uint32_t, absl::optional<cg::blockhash>>> blocks;

    chain_changeset()
    {}

    bool is_empty() const
    { return blocks.empty(); }

    // MALFORMED_CHANGESET if a height appears twice with different values
    cg::status validate() const;

    // merge other into this, entries of other win on the same height.
    // the result is sorted by height with one entry per height
    void append(const chain_changeset& other);

    void serialize(std::vector<std::uint8_t>& out) const;

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

        blocks.clear();

        CHECK_END(1);
        CHECK_END(1+cg::util::var_int_additional_size(it));
        const std::uint64_t count = cg::util::extract_var_int(it);

        for (std::uint64_t i=0; i<count; ++i) {
            CHECK_END(4+1);
            const std::uint32_t height = cg::util::extract_u32(it);
            const std::uint8_t  has_hash = cg::util::extract_u8(it);

            if (has_hash == 0) {
                blocks.emplace_back(height, absl::nullopt);
            } else if (has_hash == 1) {
                CHECK_END(32);
                cg::blockhash hash;
                std::copy(it, it+32, hash.begin());
                it+=32;
                blocks.emplace_back(height, hash);
            } else {
                return false;
            }
        }

        return true;
#undef CHECK_END
    }

    bool operator==(const chain_changeset& o) const
    { return blocks == o.blocks; }

    bool operator!=(const chain_changeset& o) const
    { return ! operator==(o); }
};

// sparse best chain made of the checkpoints the wallet has observed.
// not thread safe, see wallet_state
struct local_chain : public chain_oracle
{
    std::map<std::uint32_t, cg::blockhash>       blocks;
    absl::flat_hash_map<cg::blockhash, std::uint32_t> heights; // index of blocks

    local_chain()
    {}

    explicit local_chain(const cg::blockhash& genesis_hash);

    static std::pair<cg::status, local_chain> from_changeset(
        const chain_changeset& changeset
    );

    static local_chain from_blocks(
        const std::map<std::uint32_t, cg::blockhash>& blocks
    );

    // drops every checkpoint above height then writes (height, hash)
    chain_changeset insert_block(const cg::block_id& block);

    chain_changeset insert_block(
        const std::uint32_t height,
        const cg::blockhash& hash
    );

    // removes every checkpoint at or above height
    chain_changeset disconnect_from(const std::uint32_t height);

    // all or nothing, nothing is touched when the changeset does not validate
    cg::status apply_changeset(const chain_changeset& changeset);

    chain_changeset apply_block(
        const cg::block& block,
        const std::uint32_t height
    );

    absl::optional<cg::block_id> block_id_at(const std::uint32_t height) const;
    absl::optional<std::uint32_t> height_of(const cg::blockhash& hash) const;
    absl::optional<cg::block_id> tip() const;

    std::vector<cg::block_id> checkpoints() const;

    std::size_t size() const
    { return blocks.size(); }

    bool empty() const
    { return blocks.empty(); }

    chain_changeset initial_changeset() const;

    cg::block_in_chain_response is_block_in_best_chain(
        const cg::block_id& block,
        const std::uint32_t query_height
    ) const override;

    cg::chain_tip_response best_chain_tip() const override;

    bool operator==(const local_chain& o) const
    { return blocks == o.blocks; }

    bool operator!=(const local_chain& o) const
    { return ! operator==(o); }

private:
    void set_block(const std::uint32_t height, const cg::blockhash& hash);
    void remove_block(const std::uint32_t height);
};

}

#endif
