/**
 * Runtime Error Names
 */

#include "runtime/errors.hpp"

namespace luna {
namespace runtime {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::OperationUnsupported: return "OperationUnsupported";
        case ErrorKind::CannotApplyLength: return "CannotApplyLength";
        case ErrorKind::CannotCompare: return "CannotCompare";
        case ErrorKind::CannotIndex: return "CannotIndex";
        case ErrorKind::NotCallable: return "NotCallable";
        case ErrorKind::InvalidForLoop: return "InvalidForLoop";
        case ErrorKind::UnknownVariable: return "UnknownVariable";
        case ErrorKind::InvalidTableKey: return "InvalidTableKey";
        case ErrorKind::MetatableDepthExceeded: return "MetatableDepthExceeded";
    }
    return "Unknown";
}

} // namespace runtime
} // namespace luna
