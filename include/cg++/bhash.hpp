#ifndef CG_BHASH_HPP
#define CG_BHASH_HPP

#include <string>
#include <array>
#include <algorithm>
#include <cassert>
#include <absl/hash/hash.h>
#include <cg++/util.hpp>


namespace cg {

// do not use this directly, instead use one of the typedefs below
//
// bytes are kept in internal (hashing) order, the hex constructor and
// decompress(true) use the reversed display order bitcoind prints
template <typename Tag, unsigned Size = 32>
struct bhash
{
    std::array<std::uint8_t, Size> v;

    bhash()
    : v({ 0 })
    {}

    template <typename Container>
    bhash(const Container& v_)
    {
        assert(v_.size() == Size || v_.size() == Size*2);

        if (v_.size() == Size) {
            std::copy(v_.begin(), v_.end(), v.data());
        } else {
            for (unsigned i=0; i<Size; ++i) {
                const char p1 = v_[(i<<1)+0];
                const char p2 = v_[(i<<1)+1];

                v[Size-1-i] = (cg::util::hex_value(p1) << 4) + cg::util::hex_value(p2);
            }
        }
    }

    bhash(const char* v_)
    : bhash(std::string(v_))
    {}

    // returns false if str is not Size*2 hex characters
    static std::pair<bool, bhash<Tag, Size>> from_hex(const std::string& str)
    {
        if (str.size() != Size*2) {
            return { false, {} };
        }

        for (const char c : str) {
            if (! cg::util::is_hex_char(c)) {
                return { false, {} };
            }
        }

        return { true, bhash<Tag, Size>(str) };
    }

    constexpr auto size() const -> decltype(v.size())
    { return v.size(); }

    auto data() -> decltype(v.data())
    { return v.data(); }

    auto data() const -> decltype(v.data())
    { return v.data(); }

    auto begin() -> decltype(v.begin())
    { return v.begin(); }

    auto end() -> decltype(v.end())
    { return v.end(); }

    auto begin() const -> decltype(v.cbegin())
    { return v.cbegin(); }

    auto end() const -> decltype(v.cend())
    { return v.cend(); }

    bool is_null() const
    {
        return std::all_of(v.begin(), v.end(), [](const std::uint8_t b) { return b == 0; });
    }

    bool operator==(const bhash<Tag, Size> &o) const
    { return v == o.v; }

    bool operator!=(const bhash<Tag, Size> &o) const
    { return ! operator==(o); }

    // compares in display order so sorted output matches what users read
    bool operator<(const bhash<Tag, Size> &o) const
    {
        return std::lexicographical_compare(
            v.rbegin(), v.rend(),
            o.v.rbegin(), o.v.rend()
        );
    }

    bool operator>(const bhash<Tag, Size> &o) const
    { return o < *this; }

    template <typename H>
    friend H AbslHashValue(H h, const bhash<Tag, Size>& m)
    {
        return H::combine(std::move(h), m.v);
    }

    std::string decompress(const bool reverse = false) const
    {
        if (reverse) {
            auto w = v;
            std::reverse(w.begin(), w.end());
            return cg::util::decompress_hex(w);
        }

        return cg::util::decompress_hex(v);
    }
};

using txid      = bhash<struct btxid>;
using blockhash = bhash<struct bblockhash>;

}

#endif
