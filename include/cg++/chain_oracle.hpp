#ifndef CG_CHAIN_ORACLE_HPP
#define CG_CHAIN_ORACLE_HPP

#include <cstdint>
#include <utility>
#include <functional>
#include <absl/types/optional.h>
#include <cg++/block_id.hpp>
#include <cg++/status.hpp>

namespace cg {

// nullopt: the oracle has no opinion about the block
using block_in_chain_response = std::pair<cg::status, absl::optional<bool>>;
using chain_tip_response      = std::pair<cg::status, absl::optional<cg::block_id>>;

// source of truth about the best chain used by canonicalization
class chain_oracle
{
public:
    virtual ~chain_oracle() = default;

    // whether block is part of the best chain as seen at query_height,
    // blocks above query_height are never part of that chain
    virtual cg::block_in_chain_response is_block_in_best_chain(
        const cg::block_id& block,
        const std::uint32_t query_height
    ) const = 0;

    virtual cg::chain_tip_response best_chain_tip() const = 0;
};

// adapts an external source (full node, indexer) supplied as callbacks.
// callbacks signal failure by returning a status other than OK
class callback_chain_oracle : public chain_oracle
{
public:
    using block_in_chain_fn = std::function<cg::block_in_chain_response(const cg::block_id&, std::uint32_t)>;
    using chain_tip_fn      = std::function<cg::chain_tip_response()>;

    callback_chain_oracle(
        block_in_chain_fn block_in_chain,
        chain_tip_fn      chain_tip
    );

    cg::block_in_chain_response is_block_in_best_chain(
        const cg::block_id& block,
        const std::uint32_t query_height
    ) const override;

    cg::chain_tip_response best_chain_tip() const override;

private:
    block_in_chain_fn block_in_chain;
    chain_tip_fn      chain_tip;
};

}

#endif
