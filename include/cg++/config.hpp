#ifndef CG_CONFIG_HPP
#define CG_CONFIG_HPP

#include <cstdint>
#include <string>
#include <spdlog/spdlog.h>

namespace cg {

struct config
{
    spdlog::level::level_enum log_level;
    std::string               store_path;
    std::uint32_t             query_height; // 0 means the local chain tip

    config()
    : log_level(spdlog::level::info)
    , query_height(0)
    {}
};

// throws when the file cannot be parsed, [store] path is missing or
// [log] level is not a spdlog level name
cg::config load_config(const std::string& path);

}

#endif
