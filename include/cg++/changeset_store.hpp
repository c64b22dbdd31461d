#ifndef CG_CHANGESET_STORE_HPP
#define CG_CHANGESET_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <boost/filesystem.hpp>
#include <cg++/changeset.hpp>
#include <cg++/status.hpp>

namespace cg {

// append only file of serialized changesets.
//
// layout: magic (8 bytes) | version (u32) | { var_int length | changeset }*
//
// replaying every record in order, or applying their aggregate, onto an
// empty graph and chain reproduces the state that produced them
struct changeset_store
{
    constexpr static std::uint32_t version { 1 };
    static const std::string magic;

    boost::filesystem::path path;

    changeset_store()
    {}

    // fails if the file already exists
    static std::pair<cg::status, changeset_store> create(const boost::filesystem::path& path);

    // fails if the file is missing or has a foreign header
    static std::pair<cg::status, changeset_store> open(const boost::filesystem::path& path);

    static std::pair<cg::status, changeset_store> open_or_create(const boost::filesystem::path& path);

    // empty changesets are not written
    cg::status append(const cg::changeset& changeset) const;

    // every complete record in order. a truncated tail is reported as
    // IO_ERROR together with the records before it
    std::pair<cg::status, std::vector<cg::changeset>> load() const;

    std::pair<cg::status, cg::changeset> aggregate() const;
};

}

#endif
