#include <utility>
#include <spdlog/spdlog.h>
#include <cg++/chain_oracle.hpp>

namespace cg {

callback_chain_oracle::callback_chain_oracle(
    block_in_chain_fn block_in_chain,
    chain_tip_fn      chain_tip
)
: block_in_chain(std::move(block_in_chain))
, chain_tip(std::move(chain_tip))
{}

cg::block_in_chain_response callback_chain_oracle::is_block_in_best_chain(
    const cg::block_id& block,
    const std::uint32_t query_height
) const {
    if (! block_in_chain) {
        return { cg::status::ORACLE_UNAVAILABLE, absl::nullopt };
    }

    if (block.height > query_height) {
        return { cg::status::OK, false };
    }

    const cg::block_in_chain_response ret = block_in_chain(block, query_height);
    if (ret.first != cg::status::OK) {
        spdlog::error("chain oracle: is_block_in_best_chain {} failed: {}",
            block.to_string(), cg::to_string(ret.first));
        return { cg::status::ORACLE_UNAVAILABLE, absl::nullopt };
    }

    return ret;
}

cg::chain_tip_response callback_chain_oracle::best_chain_tip() const
{
    if (! chain_tip) {
        return { cg::status::ORACLE_UNAVAILABLE, absl::nullopt };
    }

    const cg::chain_tip_response ret = chain_tip();
    if (ret.first != cg::status::OK) {
        spdlog::error("chain oracle: best_chain_tip failed: {}", cg::to_string(ret.first));
        return { cg::status::ORACLE_UNAVAILABLE, absl::nullopt };
    }

    return ret;
}

}
