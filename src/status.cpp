#include <string>
#include <cg++/status.hpp>

namespace cg {

std::string to_string(const cg::status s)
{
    switch (s) {
        case cg::status::OK:                  return "OK";
        case cg::status::DATA_INCONSISTENCY:  return "DATA_INCONSISTENCY";
        case cg::status::ORACLE_UNAVAILABLE:  return "ORACLE_UNAVAILABLE";
        case cg::status::MALFORMED_CHANGESET: return "MALFORMED_CHANGESET";
        case cg::status::PARSE_ERROR:         return "PARSE_ERROR";
        case cg::status::IO_ERROR:            return "IO_ERROR";
    }

    return "UNKNOWN";
}

}
