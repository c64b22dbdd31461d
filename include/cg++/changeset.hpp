#ifndef CG_CHANGESET_HPP
#define CG_CHANGESET_HPP

#include <cstdint>
#include <vector>
#include <cg++/local_chain.hpp>
#include <cg++/tx_graph.hpp>
#include <cg++/status.hpp>

namespace cg {

// unit of persistence, everything a sync round wants to apply atomically
struct changeset
{
    cg::chain_changeset    chain;
    cg::tx_graph_changeset graph;

    changeset()
    {}

    changeset(
        const cg::chain_changeset& chain,
        const cg::tx_graph_changeset& graph
    )
    : chain(chain)
    , graph(graph)
    {}

    bool is_empty() const
    { return chain.is_empty() && graph.is_empty(); }

    void append(const changeset& other);

    std::vector<std::uint8_t> serialize() const;

    cg::status hydrate(const std::vector<std::uint8_t>& data);

    bool operator==(const changeset& o) const
    { return chain == o.chain && graph == o.graph; }

    bool operator!=(const changeset& o) const
    { return ! operator==(o); }
};

}

#endif
