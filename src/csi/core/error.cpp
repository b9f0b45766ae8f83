#include "csi/core/error.h"

namespace csi {
namespace core {

const char* Error::code_name(Code code) {
    switch (code) {
        case Code::UNKNOWN:
            return "UNKNOWN";
        case Code::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case Code::NOT_FOUND:
            return "NOT_FOUND";
        case Code::MALFORMED_IDENTIFIER:
            return "MALFORMED_IDENTIFIER";
        case Code::EMPTY_INDEX_INPUT:
            return "EMPTY_INDEX_INPUT";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace csi
