#include <cstdint>
#include <map>
#include <vector>

#include <spdlog/spdlog.h>
#include <absl/container/flat_hash_map.h>

#include <cg++/local_chain.hpp>
#include <cg++/util.hpp>

namespace cg {

cg::status chain_changeset::validate() const
{
    absl::flat_hash_map<std::uint32_t, absl::optional<cg::blockhash>> seen;
    seen.reserve(blocks.size());

    for (const auto & m : blocks) {
        const auto p = seen.insert({ m.first, m.second });
        if (! p.second && p.first->second != m.second) {
            spdlog::error("chain_changeset: conflicting entries at height {}", m.first);
            return cg::status::MALFORMED_CHANGESET;
        }
    }

    return cg::status::OK;
}

void chain_changeset::append(const chain_changeset& other)
{
    std::map<std::uint32_t, absl::optional<cg::blockhash>> merged;

    for (const auto & m : blocks) {
        merged[m.first] = m.second;
    }
    for (const auto & m : other.blocks) {
        merged[m.first] = m.second;
    }

    blocks.assign(merged.begin(), merged.end());
}

void chain_changeset::serialize(std::vector<std::uint8_t>& out) const
{
    cg::util::append_var_int(out, blocks.size());

    for (const auto & m : blocks) {
        cg::util::append_u32(out, m.first);
        if (m.second) {
            cg::util::append_u8(out, 1);
            cg::util::append_bytes(out, m.second->v);
        } else {
            cg::util::append_u8(out, 0);
        }
    }
}


local_chain::local_chain(const cg::blockhash& genesis_hash)
{
    set_block(0, genesis_hash);
}

std::pair<cg::status, local_chain> local_chain::from_changeset(
    const chain_changeset& changeset
) {
    local_chain ret;
    const cg::status s = ret.apply_changeset(changeset);
    return { s, ret };
}

local_chain local_chain::from_blocks(
    const std::map<std::uint32_t, cg::blockhash>& blocks
) {
    local_chain ret;
    for (const auto & m : blocks) {
        ret.set_block(m.first, m.second);
    }

    return ret;
}

chain_changeset local_chain::insert_block(const cg::block_id& block)
{
    return insert_block(block.height, block.hash);
}

chain_changeset local_chain::insert_block(
    const std::uint32_t height,
    const cg::blockhash& hash
) {
    chain_changeset changeset;

    const auto existing = blocks.find(height);
    const bool same_block = existing != blocks.end() && existing->second == hash;

    if (existing != blocks.end() && ! same_block) {
        spdlog::info("local_chain: reorg at height {} {} -> {}",
            height, existing->second.decompress(true), hash.decompress(true));
    }

    for (auto it = blocks.upper_bound(height); it != blocks.end(); ++it) {
        changeset.blocks.emplace_back(it->first, absl::nullopt);
    }

    if (! same_block) {
        changeset.blocks.emplace_back(height, hash);
    }

    // insert_block always produces a well formed changeset
    for (const auto & m : changeset.blocks) {
        if (m.second) {
            set_block(m.first, *m.second);
        } else {
            remove_block(m.first);
        }
    }

    return changeset;
}

chain_changeset local_chain::disconnect_from(const std::uint32_t height)
{
    chain_changeset changeset;

    for (auto it = blocks.lower_bound(height); it != blocks.end(); ++it) {
        changeset.blocks.emplace_back(it->first, absl::nullopt);
    }

    for (const auto & m : changeset.blocks) {
        remove_block(m.first);
    }

    if (! changeset.is_empty()) {
        spdlog::info("local_chain: disconnected {} checkpoints from height {}",
            changeset.blocks.size(), height);
    }

    return changeset;
}

cg::status local_chain::apply_changeset(const chain_changeset& changeset)
{
    const cg::status s = changeset.validate();
    if (s != cg::status::OK) {
        return s;
    }

    for (const auto & m : changeset.blocks) {
        if (m.second) {
            set_block(m.first, *m.second);
        } else {
            remove_block(m.first);
        }
    }

    return cg::status::OK;
}

chain_changeset local_chain::apply_block(
    const cg::block& block,
    const std::uint32_t height
) {
    return insert_block(height, block.block_hash);
}

absl::optional<cg::block_id> local_chain::block_id_at(const std::uint32_t height) const
{
    const auto it = blocks.find(height);
    if (it == blocks.end()) {
        return absl::nullopt;
    }

    return cg::block_id(it->first, it->second);
}

absl::optional<std::uint32_t> local_chain::height_of(const cg::blockhash& hash) const
{
    const auto it = heights.find(hash);
    if (it == heights.end()) {
        return absl::nullopt;
    }

    return it->second;
}

absl::optional<cg::block_id> local_chain::tip() const
{
    if (blocks.empty()) {
        return absl::nullopt;
    }

    const auto it = blocks.rbegin();
    return cg::block_id(it->first, it->second);
}

std::vector<cg::block_id> local_chain::checkpoints() const
{
    std::vector<cg::block_id> ret;
    ret.reserve(blocks.size());

    for (const auto & m : blocks) {
        ret.emplace_back(m.first, m.second);
    }

    return ret;
}

chain_changeset local_chain::initial_changeset() const
{
    chain_changeset ret;
    ret.blocks.reserve(blocks.size());

    for (const auto & m : blocks) {
        ret.blocks.emplace_back(m.first, m.second);
    }

    return ret;
}

cg::block_in_chain_response local_chain::is_block_in_best_chain(
    const cg::block_id& block,
    const std::uint32_t query_height
) const {
    if (block.height > query_height) {
        return { cg::status::OK, false };
    }

    // an empty chain reaches no height at all
    const absl::optional<cg::block_id> chain_tip = tip();
    if (! chain_tip || block.height > chain_tip->height) {
        return { cg::status::OK, false };
    }

    const auto it = blocks.find(block.height);
    if (it == blocks.end()) {
        return { cg::status::OK, absl::nullopt };
    }

    return { cg::status::OK, it->second == block.hash };
}

cg::chain_tip_response local_chain::best_chain_tip() const
{
    return { cg::status::OK, tip() };
}

void local_chain::set_block(const std::uint32_t height, const cg::blockhash& hash)
{
    const auto existing = blocks.find(height);
    if (existing != blocks.end()) {
        remove_block(height);
    }

    blocks.emplace(height, hash);
    heights[hash] = height;
}

void local_chain::remove_block(const std::uint32_t height)
{
    const auto it = blocks.find(height);
    if (it == blocks.end()) {
        return;
    }

    const auto h = heights.find(it->second);
    if (h != heights.end() && h->second == height) {
        heights.erase(h);
    }

    blocks.erase(it);
}

}
