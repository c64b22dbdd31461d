#ifndef CG_SCRIPTPUBKEY_HPP
#define CG_SCRIPTPUBKEY_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <absl/hash/hash.h>

namespace cg {

// opaque locking script, interpreting it belongs to the wallet layer
struct scriptpubkey
{
    std::vector<std::uint8_t> v;
    using value_type = decltype(v)::value_type;

    scriptpubkey()
    {}

    scriptpubkey(const std::vector<std::uint8_t> v_)
    : v(v_.begin(), v_.end())
    {}

    scriptpubkey(const std::size_t size)
    {
        v.reserve(size);
    }

    auto size() const -> decltype(v.size())
    { return v.size(); }

    auto data() const -> decltype(v.data())
    { return v.data(); }

    auto begin() const -> decltype(v.cbegin())
    { return v.cbegin(); }

    auto end() const -> decltype(v.cend())
    { return v.cend(); }

    bool empty() const
    { return v.empty(); }

    bool is_op_return() const
    { return v.size() > 0 && v[0] == 0x6a; }

    bool operator==(const scriptpubkey& o) const
    { return v == o.v; }

    bool operator!=(const scriptpubkey& o) const
    { return ! operator==(o); }

    bool operator<(const scriptpubkey& o) const
    { return v < o.v; }

    template <typename H>
    friend H AbslHashValue(H h, const scriptpubkey& m)
    {
        return H::combine(std::move(h), m.v);
    }
};

}

#endif
