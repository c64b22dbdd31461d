#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cg++/config.hpp>
#include <cg++/changeset_store.hpp>
#include <cg++/wallet_state.hpp>
#include <cg++/canonical_view.hpp>

namespace {

nlohmann::json position_json(const cg::chain_position& position)
{
    nlohmann::json ret;

    if (position.is_confirmed()) {
        const auto & p = absl::get<cg::confirmed_position>(position.v);
        ret["confirmed"] = true;
        ret["height"]    = p.height;
        ret["anchor"]    = p.anchor.to_string();
    } else {
        ret["confirmed"] = false;
        ret["last_seen"] = *position.last_seen();
    }

    return ret;
}

nlohmann::json view_json(
    const cg::canonical_view& view,
    const absl::optional<cg::block_id>& tip
) {
    nlohmann::json ret;
    ret["query_height"] = view.query_height;

    if (tip) {
        ret["tip"] = { { "height", tip->height }, { "hash", tip->hash.decompress(true) } };
    } else {
        ret["tip"] = nullptr;
    }

    ret["txs"] = nlohmann::json::array();
    for (const cg::canonical_tx & m : view.canonical_txs()) {
        nlohmann::json tx;
        tx["txid"]     = m.txid.decompress(true);
        tx["position"] = position_json(m.position);
        tx["value"]    = m.tx.total_output_value();
        ret["txs"].push_back(tx);
    }

    std::uint64_t balance = 0;
    ret["unspent"] = nlohmann::json::array();
    for (const cg::canonical_txout & m : view.unspent()) {
        nlohmann::json txout;
        txout["outpoint"]    = m.outpoint.to_string();
        txout["value"]       = m.txout.value;
        txout["is_coinbase"] = m.is_coinbase;
        txout["position"]    = position_json(m.position);
        ret["unspent"].push_back(txout);

        balance += m.txout.value;
    }
    ret["balance"] = balance;

    ret["hazards"] = nlohmann::json::array();
    for (const cg::consistency_hazard & m : view.hazards()) {
        nlohmann::json hazard;
        hazard["txid"]    = m.txid.decompress(true);
        hazard["anchors"] = nlohmann::json::array();
        for (const cg::anchor & a : m.valid_anchors) {
            hazard["anchors"].push_back(a.to_string());
        }
        ret["hazards"].push_back(hazard);
    }

    return ret;
}

}

int main(int argc, char * argv[])
{
    if (argc < 2) {
        std::cerr << "usage: cginspect config.toml\n";
        return EXIT_FAILURE;
    }

    cg::config config;
    try {
        config = cg::load_config(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "could not load config: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    spdlog::set_level(config.log_level);

    const std::pair<cg::status, cg::changeset_store> store = cg::changeset_store::open(config.store_path);
    if (store.first != cg::status::OK) {
        spdlog::error("could not open store: {}", cg::to_string(store.first));
        return EXIT_FAILURE;
    }

    const std::pair<cg::status, cg::changeset> aggregate = store.second.aggregate();
    if (aggregate.first == cg::status::IO_ERROR) {
        spdlog::warn("store has a damaged tail, continuing with the good records");
    } else if (aggregate.first != cg::status::OK) {
        spdlog::error("could not load store: {}", cg::to_string(aggregate.first));
        return EXIT_FAILURE;
    }

    cg::wallet_state state;
    const cg::status apply_status = state.apply_changeset(aggregate.second);
    if (apply_status != cg::status::OK) {
        spdlog::error("could not apply store: {}", cg::to_string(apply_status));
        return EXIT_FAILURE;
    }

    const cg::canonical_view_response view = config.query_height == 0
        ? state.canonical_view()
        : state.canonical_view(config.query_height);

    if (view.first != cg::status::OK) {
        spdlog::error("canonicalization failed: {}", cg::to_string(view.first));
        return EXIT_FAILURE;
    }

    std::cout << view_json(view.second, state.tip()).dump(4) << std::endl;

    return EXIT_SUCCESS;
}
