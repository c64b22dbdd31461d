#include <string>
#include <vector>
#include <cstdint>
#include <tuple>

#include <absl/types/variant.h>
#include <absl/types/optional.h>

#include <cg++/anchor.hpp>
#include <cg++/util.hpp>

namespace cg {

const cg::block_id& anchor::anchor_block() const
{
    if (const auto * a = absl::get_if<cg::confirmation_height_anchor>(&v)) {
        return a->anchor_block;
    }
    if (const auto * a = absl::get_if<cg::confirmation_time_anchor>(&v)) {
        return a->anchor_block;
    }

    return absl::get<cg::block_id>(v);
}

std::uint32_t anchor::confirmation_height_upper_bound() const
{
    if (const auto * a = absl::get_if<cg::confirmation_height_anchor>(&v)) {
        return a->confirmation_height;
    }
    if (const auto * a = absl::get_if<cg::confirmation_time_anchor>(&v)) {
        return a->confirmation_height;
    }

    return absl::get<cg::block_id>(v).height;
}

absl::optional<std::uint64_t> anchor::confirmation_time() const
{
    if (const auto * a = absl::get_if<cg::confirmation_time_anchor>(&v)) {
        return a->confirmation_time;
    }

    return absl::nullopt;
}

std::string anchor::to_string() const
{
    std::string ret = anchor_block().to_string();

    switch (type()) {
        case cg::anchor_type::block:
            break;
        case cg::anchor_type::confirmation_height:
            ret += " (confirmed at " + std::to_string(confirmation_height_upper_bound()) + ")";
            break;
        case cg::anchor_type::confirmation_time:
            ret += " (confirmed at " + std::to_string(confirmation_height_upper_bound())
                +  " time "          + std::to_string(confirmation_time().value_or(0)) + ")";
            break;
    }

    return ret;
}

void anchor::serialize(std::vector<std::uint8_t>& out) const
{
    cg::util::append_u8(out, static_cast<std::uint8_t>(type()));
    cg::util::append_u32(out, anchor_block().height);
    cg::util::append_bytes(out, anchor_block().hash.v);

    switch (type()) {
        case cg::anchor_type::block:
            break;
        case cg::anchor_type::confirmation_height:
            cg::util::append_u32(out, confirmation_height_upper_bound());
            break;
        case cg::anchor_type::confirmation_time:
            cg::util::append_u32(out, confirmation_height_upper_bound());
            cg::util::append_u64(out, confirmation_time().value_or(0));
            break;
    }
}

bool anchor::operator==(const anchor &o) const
{
    return v.index() == o.v.index()
        && anchor_block() == o.anchor_block()
        && confirmation_height_upper_bound() == o.confirmation_height_upper_bound()
        && confirmation_time() == o.confirmation_time();
}

bool anchor::operator<(const anchor &o) const
{
    const auto lhs = std::make_tuple(
        anchor_block(),
        v.index(),
        confirmation_height_upper_bound(),
        confirmation_time().value_or(0)
    );
    const auto rhs = std::make_tuple(
        o.anchor_block(),
        o.v.index(),
        o.confirmation_height_upper_bound(),
        o.confirmation_time().value_or(0)
    );

    return lhs < rhs;
}

}
