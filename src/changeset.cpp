#include <cstdint>
#include <vector>

#include <spdlog/spdlog.h>

#include <cg++/changeset.hpp>

namespace cg {

void changeset::append(const changeset& other)
{
    chain.append(other.chain);
    graph.append(other.graph);
}

std::vector<std::uint8_t> changeset::serialize() const
{
    std::vector<std::uint8_t> ret;
    chain.serialize(ret);
    graph.serialize(ret);
    return ret;
}

cg::status changeset::hydrate(const std::vector<std::uint8_t>& data)
{
    std::vector<std::uint8_t>::const_iterator it = data.cbegin();
    const std::vector<std::uint8_t>::const_iterator end_it = data.cend();

    if (! chain.hydrate(it, end_it)) {
        spdlog::warn("changeset: could not decode chain part");
        return cg::status::PARSE_ERROR;
    }

    if (! graph.hydrate(it, end_it)) {
        spdlog::warn("changeset: could not decode graph part");
        return cg::status::PARSE_ERROR;
    }

    if (it != end_it) {
        spdlog::warn("changeset: {} trailing bytes", end_it - it);
        return cg::status::PARSE_ERROR;
    }

    return cg::status::OK;
}

}
