#include <string>
#include <stdexcept>

#include <toml.hpp>
#include <spdlog/spdlog.h>

#include <cg++/config.hpp>

namespace cg {

cg::config load_config(const std::string& path)
{
    const auto data = toml::parse(path);

    cg::config ret;
    ret.store_path = toml::find<std::string>(data, "store", "path");

    const auto & tables = data.as_table();

    if (tables.count("log") && toml::find(data, "log").as_table().count("level")) {
        const std::string level = toml::find<std::string>(data, "log", "level");
        ret.log_level = spdlog::level::from_str(level);
        if (ret.log_level == spdlog::level::off && level != "off") {
            throw std::runtime_error("unknown log level: " + level);
        }
    }

    if (tables.count("chain") && toml::find(data, "chain").as_table().count("query_height")) {
        ret.query_height = toml::find<std::uint32_t>(data, "chain", "query_height");
    }

    return ret;
}

}
