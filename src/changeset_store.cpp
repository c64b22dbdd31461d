#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <iterator>
#include <algorithm>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <spdlog/spdlog.h>

#include <cg++/changeset_store.hpp>
#include <cg++/util.hpp>

namespace cg {

const std::string changeset_store::magic = "cg++stor";

std::pair<cg::status, changeset_store> changeset_store::create(const boost::filesystem::path& path)
{
    if (boost::filesystem::exists(path)) {
        spdlog::error("changeset_store: {} already exists", path.string());
        return { cg::status::IO_ERROR, {} };
    }

    boost::filesystem::ofstream ofs(path, boost::filesystem::ofstream::binary);
    if (! ofs) {
        spdlog::error("changeset_store: could not create {}", path.string());
        return { cg::status::IO_ERROR, {} };
    }

    std::vector<std::uint8_t> header(magic.begin(), magic.end());
    cg::util::append_u32(header, version);
    ofs.write(reinterpret_cast<const char *>(header.data()), header.size());

    if (! ofs) {
        spdlog::error("changeset_store: could not write header to {}", path.string());
        return { cg::status::IO_ERROR, {} };
    }

    spdlog::info("changeset_store: created {}", path.string());

    changeset_store ret;
    ret.path = path;
    return { cg::status::OK, ret };
}

std::pair<cg::status, changeset_store> changeset_store::open(const boost::filesystem::path& path)
{
    std::ifstream ifs(path.string(), std::ios::in | std::ios::binary);
    if (! ifs) {
        spdlog::error("changeset_store: could not open {}", path.string());
        return { cg::status::IO_ERROR, {} };
    }

    std::vector<std::uint8_t> header(magic.size() + 4);
    ifs.read(reinterpret_cast<char *>(header.data()), header.size());
    if (static_cast<std::size_t>(ifs.gcount()) != header.size()
     || ! std::equal(magic.begin(), magic.end(), header.begin())
    ) {
        spdlog::error("changeset_store: {} is not a changeset store", path.string());
        return { cg::status::PARSE_ERROR, {} };
    }

    auto it = header.cbegin() + magic.size();
    const std::uint32_t file_version = cg::util::extract_u32(it);
    if (file_version != version) {
        spdlog::error("changeset_store: {} has unsupported version {}", path.string(), file_version);
        return { cg::status::PARSE_ERROR, {} };
    }

    changeset_store ret;
    ret.path = path;
    return { cg::status::OK, ret };
}

std::pair<cg::status, changeset_store> changeset_store::open_or_create(const boost::filesystem::path& path)
{
    if (boost::filesystem::exists(path)) {
        return open(path);
    }

    return create(path);
}

cg::status changeset_store::append(const cg::changeset& changeset) const
{
    if (changeset.is_empty()) {
        return cg::status::OK;
    }

    const std::vector<std::uint8_t> body = changeset.serialize();

    std::vector<std::uint8_t> record;
    record.reserve(body.size() + 9);
    cg::util::append_var_bytes(record, body);

    boost::filesystem::ofstream ofs(path, boost::filesystem::ofstream::binary | boost::filesystem::ofstream::app);
    if (! ofs) {
        spdlog::error("changeset_store: could not open {} for append", path.string());
        return cg::status::IO_ERROR;
    }

    ofs.write(reinterpret_cast<const char *>(record.data()), record.size());
    ofs.flush();

    if (! ofs) {
        spdlog::error("changeset_store: write to {} failed", path.string());
        return cg::status::IO_ERROR;
    }

    return cg::status::OK;
}

std::pair<cg::status, std::vector<cg::changeset>> changeset_store::load() const
{
    std::ifstream ifs(path.string(), std::ios::in | std::ios::binary);
    if (! ifs) {
        spdlog::error("changeset_store: could not open {}", path.string());
        return { cg::status::IO_ERROR, {} };
    }

    const std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(ifs)),
                                          std::istreambuf_iterator<char>());

    const std::size_t header_size = magic.size() + 4;
    if (data.size() < header_size) {
        spdlog::error("changeset_store: {} is missing its header", path.string());
        return { cg::status::PARSE_ERROR, {} };
    }

    std::vector<cg::changeset> ret;

    auto it = data.cbegin() + header_size;
    const auto end_it = data.cend();

    while (it != end_it) {
        if (static_cast<std::size_t>(end_it - it) < 1 + cg::util::var_int_additional_size(it)) {
            break;
        }

        const std::uint64_t len = cg::util::extract_var_int(it);
        if (static_cast<std::uint64_t>(end_it - it) < len) {
            break;
        }

        const std::vector<std::uint8_t> body(it, it + len);
        it += len;

        cg::changeset changeset;
        const cg::status s = changeset.hydrate(body);
        if (s != cg::status::OK) {
            spdlog::error("changeset_store: record {} of {} is corrupt", ret.size(), path.string());
            return { s, ret };
        }

        ret.push_back(std::move(changeset));
    }

    if (it != end_it) {
        spdlog::warn("changeset_store: {} has a truncated record after {} good ones",
            path.string(), ret.size());
        return { cg::status::IO_ERROR, ret };
    }

    spdlog::info("changeset_store: loaded {} changesets from {}", ret.size(), path.string());

    return { cg::status::OK, ret };
}

std::pair<cg::status, cg::changeset> changeset_store::aggregate() const
{
    const std::pair<cg::status, std::vector<cg::changeset>> records = load();

    cg::changeset ret;
    for (const cg::changeset & m : records.second) {
        ret.append(m);
    }

    return { records.first, ret };
}

}
