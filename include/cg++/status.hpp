#ifndef CG_STATUS_HPP
#define CG_STATUS_HPP

#include <string>

namespace cg {

enum class status
{
    OK,                  // normal response
    DATA_INCONSISTENCY,  // error: graph contents contradict each other (double confirmed spend, cycle)
    ORACLE_UNAVAILABLE,  // error: chain oracle could not answer a best chain query
    MALFORMED_CHANGESET, // error: change set rejected before any mutation
    PARSE_ERROR,         // error: serialized data could not be decoded
    IO_ERROR,            // error: store could not be read or written
};

std::string to_string(const cg::status s);

}

#endif
