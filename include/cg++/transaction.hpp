#ifndef CG_TRANSACTION_HPP
#define CG_TRANSACTION_HPP

// #define ENABLE_TX_PARSE_PRINTING

#include <vector>
#include <cstdint>
#include <algorithm>
#include <iostream>
#include <iterator>

#include <boost/format.hpp>

#include <cg++/bhash.hpp>
#include <cg++/util.hpp>
#include <cg++/outpoint.hpp>

namespace cg {

struct transaction
{
    cg::txid txid;
    std::int32_t  version;
    std::uint32_t lock_time;
    std::vector<cg::outpoint> inputs;
    std::vector<cg::txout>    outputs;
    bool has_witness;
    std::vector<std::uint8_t> serialized; // wire form, witness data included

    transaction()
    : version(0)
    , lock_time(0)
    , has_witness(false)
    {}

    // serializes a transaction with empty unlocking scripts, mostly useful
    // for tests and tools which do not care about signatures.
    // throws std::invalid_argument when inputs is empty
    static transaction build(
        const std::vector<cg::outpoint>& inputs,
        const std::vector<cg::txout>&    outputs,
        const std::uint32_t lock_time = 0,
        const std::int32_t  version   = 2
    );

    bool is_coinbase() const;

    std::uint64_t total_output_value() const;

    bool operator==(const transaction& o) const
    { return txid == o.txid && serialized == o.serialized; }

    bool operator!=(const transaction& o) const
    { return ! operator==(o); }

    // returns false on malformed input, on success serialized holds the
    // consumed bytes so callers can advance by serialized.size()
    template <typename BeginIterator, typename EndIterator>
    bool hydrate(
        BeginIterator&& begin_it,
        EndIterator&& end_it
    ) {
        constexpr std::uint64_t MAX_TX_SIZE = 4000000;
        constexpr std::uint64_t MAX_INPUTS  = MAX_TX_SIZE; // its ok if these are bigger than need be
        constexpr std::uint64_t MAX_OUTPUTS = MAX_TX_SIZE; // they are for limiting sizes for memory purposes
        constexpr std::uint64_t MAX_SCRIPT_SIZE = MAX_TX_SIZE;

#ifdef ENABLE_TX_PARSE_PRINTING
        #define CHECK_END(n) {    \
            if (static_cast<std::uint64_t>(end_it - it) < static_cast<std::uint64_t>(n)) { \
                std::cerr << "CHECK_END\tline: " << __LINE__ << "\n";\
                return false;     \
            }                     \
        }

        #define DEBUG_PRINT(msg) {\
            std::cerr << msg << "\tline: " << __LINE__ << "\n";\
            std::cerr << "offset: " << (boost::format("%1$#x") % (it - begin_it)) << "\n";\
        }
#else
        #define CHECK_END(n) {    \
            if (static_cast<std::uint64_t>(end_it - it) < static_cast<std::uint64_t>(n)) { \
                return false;     \
            }                     \
        }

        #define DEBUG_PRINT(msg) {\
        }
#endif

        this->inputs.clear();
        this->outputs.clear();
        this->has_witness = false;

        auto it = begin_it;

        CHECK_END(4);
        this->version = cg::util::extract_i32(it);
        DEBUG_PRINT(this->version);

        // bip144 marker and flag
        CHECK_END(2);
        if (*it == 0x00 && *(it+1) == 0x01) {
            this->has_witness = true;
            it+=2;
            DEBUG_PRINT("segwit");
        }

        const auto body_begin_it = it;

        CHECK_END(1);
        CHECK_END(1+cg::util::var_int_additional_size(it));
        const std::uint64_t in_count { cg::util::extract_var_int(it) };
        DEBUG_PRINT(in_count);
        if (in_count >= MAX_INPUTS) {
            DEBUG_PRINT("in_count >= MAX_INPUTS");
            return false;
        }

        this->inputs.reserve(in_count);
        for (std::uint64_t in_i=0; in_i<in_count; ++in_i) {
            CHECK_END(32);
            cg::txid prev_tx_id;
            std::copy(it, it+32, prev_tx_id.begin());
            it+=32;
            DEBUG_PRINT(prev_tx_id.decompress(true));

            CHECK_END(4);
            const std::uint32_t prev_out_idx { cg::util::extract_u32(it) };
            DEBUG_PRINT(prev_out_idx);

            CHECK_END(1);
            CHECK_END(1+cg::util::var_int_additional_size(it));
            const std::uint64_t script_len { cg::util::extract_var_int(it) };
            DEBUG_PRINT(script_len);
            if (script_len >= MAX_SCRIPT_SIZE) {
                DEBUG_PRINT("len  >= MAX_SCRIPT_SIZE");
                return false;
            }

            CHECK_END(script_len);
            it+=script_len;

            CHECK_END(4);
            const std::uint32_t sequence { cg::util::extract_u32(it) };
            DEBUG_PRINT(sequence);

            this->inputs.emplace_back(prev_tx_id, prev_out_idx);
        }

        CHECK_END(1);
        CHECK_END(1+cg::util::var_int_additional_size(it));
        const std::uint64_t out_count { cg::util::extract_var_int(it) };
        DEBUG_PRINT(out_count);
        if (out_count >= MAX_OUTPUTS) {
            DEBUG_PRINT("out_count >= MAX_OUTPUTS");
            return false;
        }

        this->outputs.reserve(out_count);
        for (std::uint64_t out_i=0; out_i<out_count; ++out_i) {
            CHECK_END(8);
            const std::uint64_t value { cg::util::extract_u64(it) };
            DEBUG_PRINT(value);

            CHECK_END(1);
            CHECK_END(1+cg::util::var_int_additional_size(it));
            const std::uint64_t script_len { cg::util::extract_var_int(it) };
            DEBUG_PRINT(script_len);
            if (script_len >= MAX_SCRIPT_SIZE) {
                return false;
            }

            CHECK_END(script_len);
            cg::scriptpubkey scriptpubkey(script_len);
            scriptpubkey.v.resize(script_len);
            std::copy(it, it+script_len, scriptpubkey.v.begin());
            it+=script_len;

            this->outputs.emplace_back(value, scriptpubkey);
        }

        const auto body_end_it = it;

        if (this->has_witness) {
            for (std::uint64_t in_i=0; in_i<in_count; ++in_i) {
                CHECK_END(1);
                CHECK_END(1+cg::util::var_int_additional_size(it));
                const std::uint64_t item_count { cg::util::extract_var_int(it) };
                DEBUG_PRINT(item_count);

                for (std::uint64_t item_i=0; item_i<item_count; ++item_i) {
                    CHECK_END(1);
                    CHECK_END(1+cg::util::var_int_additional_size(it));
                    const std::uint64_t item_len { cg::util::extract_var_int(it) };
                    if (item_len >= MAX_SCRIPT_SIZE) {
                        return false;
                    }

                    CHECK_END(item_len);
                    it+=item_len;
                }
            }
        }

        CHECK_END(4);
        this->lock_time = cg::util::extract_u32(it);
        DEBUG_PRINT(this->lock_time);

        const auto tx_end_it = it;

        serialized.resize(tx_end_it - begin_it);
        std::copy(begin_it, tx_end_it, serialized.begin());

        // txid commits to the serialization without marker, flag and witnesses
        std::vector<std::uint8_t> stripped;
        stripped.reserve(4 + (body_end_it - body_begin_it) + 4);
        std::copy(begin_it, begin_it+4, std::back_inserter(stripped));
        std::copy(body_begin_it, body_end_it, std::back_inserter(stripped));
        std::copy(tx_end_it-4, tx_end_it, std::back_inserter(stripped));

        this->txid = cg::txid(cg::util::sha256d(stripped));

        return true;
#undef CHECK_END
#undef DEBUG_PRINT
    }
};

}

std::ostream & operator<<(std::ostream &os, const cg::transaction & tx);

#endif
