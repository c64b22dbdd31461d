#include <iostream>
#include <string>
#include <vector>
#include <utility>

#include <cg++/block.hpp>
#include <cg++/util.hpp>

int main(int argc, char * argv[])
{
    if (argc < 2) {
        std::cerr << "you must pass blockdata" << std::endl;
        return 1;
    }

    const std::pair<bool, std::vector<std::uint8_t>> blockhex = cg::util::unhex(std::string(argv[1]));
    if (! blockhex.first) {
        std::cerr << "blockdata is not hex" << std::endl;
        return 1;
    }

    cg::block block;
    if (! block.hydrate(blockhex.second.begin(), blockhex.second.end()) ) {
        std::cerr << "block hydration failed" << std::endl;
        return 1;
    }

    std::cout << block << std::endl;

    return 0;
}
