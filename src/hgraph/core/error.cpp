#include "hgraph/core/error.h"

namespace hgraph {
namespace core {

const char* code_name(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "InvalidArgument";
        case Error::Code::IO_ERROR: return "IOError";
        case Error::Code::PARSE_ERROR: return "ParseError";
        case Error::Code::INVALID_CONSTRAINT: return "InvalidConstraint";
        case Error::Code::UNSUPPORTED: return "Unsupported";
        case Error::Code::SEARCH_ABORTED: return "SearchAborted";
        case Error::Code::INTERNAL: return "Internal";
        case Error::Code::UNKNOWN: break;
    }
    return "Unknown";
}

int exit_code_for(Error::Code code) {
    switch (code) {
        case Error::Code::IO_ERROR: return 3;
        case Error::Code::PARSE_ERROR: return 4;
        case Error::Code::INVALID_CONSTRAINT: return 5;
        case Error::Code::UNSUPPORTED: return 6;
        case Error::Code::SEARCH_ABORTED: return 7;
        case Error::Code::INVALID_ARGUMENT: return 8;
        case Error::Code::INTERNAL:
        case Error::Code::UNKNOWN: break;
    }
    return 9;
}

} // namespace core
} // namespace hgraph
