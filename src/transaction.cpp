#include <vector>
#include <cstdint>
#include <iostream>
#include <stdexcept>

#include <cg++/transaction.hpp>
#include <cg++/util.hpp>

namespace cg {

transaction transaction::build(
    const std::vector<cg::outpoint>& inputs,
    const std::vector<cg::txout>&    outputs,
    const std::uint32_t lock_time,
    const std::int32_t  version
) {
    std::vector<std::uint8_t> data;

    cg::util::append_i32(data, version);

    cg::util::append_var_int(data, inputs.size());
    for (const cg::outpoint & m : inputs) {
        cg::util::append_bytes(data, m.txid.v);
        cg::util::append_u32(data, m.vout);
        cg::util::append_var_int(data, 0); // empty scriptsig
        cg::util::append_u32(data, 0xFFFFFFFD);
    }

    cg::util::append_var_int(data, outputs.size());
    for (const cg::txout & m : outputs) {
        cg::util::append_u64(data, m.value);
        cg::util::append_var_bytes(data, m.scriptpubkey.v);
    }

    cg::util::append_u32(data, lock_time);

    // zero inputs would read as a segwit marker
    transaction tx;
    if (! tx.hydrate(data.begin(), data.end())) {
        throw std::invalid_argument("transaction::build: could not hydrate built transaction");
    }

    return tx;
}

bool transaction::is_coinbase() const
{
    return inputs.size() == 1 && inputs[0].is_null();
}

std::uint64_t transaction::total_output_value() const
{
    std::uint64_t ret = 0;
    for (const cg::txout & m : outputs) {
        ret += m.value;
    }

    return ret;
}

}

std::ostream & operator<<(std::ostream &os, const cg::transaction & tx)
{
    os
        << "txid:             " << tx.txid.decompress(true) << "\n"
        << "version:          " << tx.version << "\n"
        << "lock_time:        " << tx.lock_time << "\n"
        << "witness:          " << (tx.has_witness ? "yes" : "no") << "\n"
        << "size:             " << tx.serialized.size() << "\n"
        << "\n";

    os << "inputs:\n";
    std::size_t in = 0;
    for (auto m : tx.inputs) {
        os
            << "#" << in << "\n"
            << "    txid: " << m.txid.decompress(true) << "\n"
            << "    vout: " << m.vout << "\n\n";
        ++in;
    }

    os << "outputs:\n";
    std::size_t on = 0;
    for (auto m : tx.outputs) {
        os
            << "#" << on << "\n"
            << "    value:        " << m.value                                    << "\n"
            << "    scriptpubkey: " << cg::util::decompress_hex(m.scriptpubkey.v) << "\n"
            << "\n";

        ++on;
    }

    return os;
}
