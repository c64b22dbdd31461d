#include <iostream>
#include <string>
#include <vector>
#include <utility>

#define ENABLE_TX_PARSE_PRINTING
#include <cg++/transaction.hpp>
#include <cg++/util.hpp>

int main(int argc, char * argv[])
{
    if (argc < 2) {
        std::cerr << "you must pass txdata" << std::endl;
        return 1;
    }

    const std::pair<bool, std::vector<std::uint8_t>> txhex = cg::util::unhex(std::string(argv[1]));
    if (! txhex.first) {
        std::cerr << "txdata is not hex" << std::endl;
        return 1;
    }

    cg::transaction tx;
    if (! tx.hydrate(txhex.second.begin(), txhex.second.end()) ) {
        std::cerr << "tx hydration failed" << std::endl;
        return 1;
    }

    if (tx.serialized.size() != txhex.second.size()) {
        std::cerr << "trailing bytes after transaction" << std::endl;
        return 1;
    }

    std::cout << tx;

    return 0;
}
