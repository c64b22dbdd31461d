#ifndef CG_UTIL_HPP
#define CG_UTIL_HPP

#include <cstdint>
#include <algorithm>
#include <vector>
#include <array>
#include <string>
#include <utility>

namespace cg {

namespace util {

template <typename Iterator>
std::uint8_t extract_u8(Iterator & it)
{
    const std::uint8_t ret = *it;
    ++it;
    return ret;
}

template <typename Iterator>
std::uint16_t extract_u16(Iterator & it)
{
    std::uint16_t ret;
    std::copy(it, it+2, reinterpret_cast<std::uint8_t*>(&ret));
    it+=2;
    return ret;
}

template <typename Iterator>
std::uint32_t extract_u32(Iterator & it)
{
    std::uint32_t ret;
    std::copy(it, it+4, reinterpret_cast<std::uint8_t*>(&ret));
    it+=4;
    return ret;
}

template <typename Iterator>
std::uint64_t extract_u64(Iterator & it)
{
    std::uint64_t ret;
    std::copy(it, it+8, reinterpret_cast<std::uint8_t*>(&ret));
    it+=8;
    return ret;
}

template <typename Iterator>
std::int32_t extract_i32(Iterator & it)
{
    std::int32_t ret;
    std::copy(it, it+4, reinterpret_cast<std::uint8_t*>(&ret));
    it+=4;
    return ret;
}

template <typename Iterator>
std::int64_t extract_i64(Iterator & it)
{
    std::int64_t ret;
    std::copy(it, it+8, reinterpret_cast<std::uint8_t*>(&ret));
    it+=8;
    return ret;
}

template <typename Iterator>
std::size_t var_int_additional_size(const Iterator & it)
{
        const std::uint8_t v = *it;

         if (v  < 0xFD) return 0;
    else if (v == 0xFD) return 2;
    else if (v == 0xFE) return 4;
    else                return 8;
}

template <typename Iterator>
std::uint64_t extract_var_int (Iterator & it)
{
    const std::uint64_t ret = extract_u8(it);

         if (ret  < 0xFD) return ret;
    else if (ret == 0xFD) return extract_u16(it);
    else if (ret == 0xFE) return extract_u32(it);
    else                  return extract_u64(it);
}

std::vector<std::uint8_t> num_to_var_int(const std::uint64_t n);

// little endian writers used by the serializers, counterpart of extract_*
void append_u8 (std::vector<std::uint8_t>& out, const std::uint8_t  n);
void append_u32(std::vector<std::uint8_t>& out, const std::uint32_t n);
void append_u64(std::vector<std::uint8_t>& out, const std::uint64_t n);
void append_i32(std::vector<std::uint8_t>& out, const std::int32_t  n);
void append_i64(std::vector<std::uint8_t>& out, const std::int64_t  n);
void append_var_int(std::vector<std::uint8_t>& out, const std::uint64_t n);

template <typename Container>
void append_bytes(std::vector<std::uint8_t>& out, const Container& v)
{
    out.insert(out.end(), v.begin(), v.end());
}

template <typename Container>
void append_var_bytes(std::vector<std::uint8_t>& out, const Container& v)
{
    append_var_int(out, v.size());
    append_bytes(out, v);
}

constexpr bool is_hex_char(const char c)
{
    return (c >= '0' && c <= '9')
        || (c >= 'a' && c <= 'f')
        || (c >= 'A' && c <= 'F');
}

constexpr std::uint8_t hex_value(const char c)
{
    return c <= '9' ? c - '0'
         : c <= 'F' ? c - 'A' + 10
         :            c - 'a' + 10;
}

template <typename Container>
std::string decompress_hex(const Container& v)
{
    constexpr std::array<std::uint8_t, 16> chars = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    std::string ret(v.size()*2, '\0');
    for (unsigned i=0; i<v.size(); ++i) {
        ret[(i<<1)+0] = chars[v[i] >> 4];
        ret[(i<<1)+1] = chars[v[i] & 0x0F];
    }

    return ret;
}

template <typename Container>
std::vector<std::uint8_t> compress_hex(const Container& v_)
{
    std::vector<std::uint8_t> ret(v_.size() / 2);

    for (unsigned i=0; i<ret.size(); ++i) {
        const char p1 = v_[(i<<1)+0];
        const char p2 = v_[(i<<1)+1];

        ret[i] = (hex_value(p1) << 4) + hex_value(p2);
    }

    return ret;
}

// like compress_hex but rejects odd length or non hex input
std::pair<bool, std::vector<std::uint8_t>> unhex(const std::string& str);

// bitcoin double sha256
std::array<std::uint8_t, 32> sha256d(const std::vector<std::uint8_t>& data);

}

}


#endif
