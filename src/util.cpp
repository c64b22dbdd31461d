#include <vector>
#include <array>
#include <string>
#include <cstdint>

#include <sha2.h>

#include <cg++/util.hpp>

namespace cg {

namespace util {

std::vector<std::uint8_t> num_to_var_int(const std::uint64_t n)
{
    std::vector<std::uint8_t> ret;

    if (n < 0xFD) {
        ret.push_back(static_cast<std::uint8_t>(n));
    } else if (n <= 0xFFFF) {
        ret.push_back(0xFD);
        ret.push_back(static_cast<std::uint8_t>(n >> 0));
        ret.push_back(static_cast<std::uint8_t>(n >> 8));
    } else if (n <= 0xFFFFFFFF) {
        ret.push_back(0xFE);
        for (unsigned i=0; i<4; ++i) {
            ret.push_back(static_cast<std::uint8_t>(n >> (i*8)));
        }
    } else {
        ret.push_back(0xFF);
        for (unsigned i=0; i<8; ++i) {
            ret.push_back(static_cast<std::uint8_t>(n >> (i*8)));
        }
    }

    return ret;
}

void append_u8(std::vector<std::uint8_t>& out, const std::uint8_t n)
{
    out.push_back(n);
}

void append_u32(std::vector<std::uint8_t>& out, const std::uint32_t n)
{
    for (unsigned i=0; i<4; ++i) {
        out.push_back(static_cast<std::uint8_t>(n >> (i*8)));
    }
}

void append_u64(std::vector<std::uint8_t>& out, const std::uint64_t n)
{
    for (unsigned i=0; i<8; ++i) {
        out.push_back(static_cast<std::uint8_t>(n >> (i*8)));
    }
}

void append_i32(std::vector<std::uint8_t>& out, const std::int32_t n)
{
    append_u32(out, static_cast<std::uint32_t>(n));
}

void append_i64(std::vector<std::uint8_t>& out, const std::int64_t n)
{
    append_u64(out, static_cast<std::uint64_t>(n));
}

void append_var_int(std::vector<std::uint8_t>& out, const std::uint64_t n)
{
    const std::vector<std::uint8_t> v = num_to_var_int(n);
    out.insert(out.end(), v.begin(), v.end());
}

std::pair<bool, std::vector<std::uint8_t>> unhex(const std::string& str)
{
    if (str.size() % 2 != 0) {
        return { false, {} };
    }

    for (const char c : str) {
        if (! is_hex_char(c)) {
            return { false, {} };
        }
    }

    return { true, compress_hex(str) };
}

std::array<std::uint8_t, 32> sha256d(const std::vector<std::uint8_t>& data)
{
    std::array<std::uint8_t, 32> ret;
    sha256(data.data(), data.size(), ret.data());
    sha256(ret.data(), ret.size(), ret.data());
    return ret;
}

}

}
