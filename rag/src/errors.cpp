#include "../include/errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::validation: return "validation_error";
        case ErrorKind::not_found: return "not_found";
        case ErrorKind::upstream: return "upstream_error";
        case ErrorKind::internal: return "internal_error";
    }
    return "internal_error";
}
