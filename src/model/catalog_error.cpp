#include "model/catalog_error.hpp"

namespace mangashelf {

const char* error_kind_label(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:            return "ok";
        case ErrorKind::kValidation:      return "validation error";
        case ErrorKind::kMetadata:        return "metadata error";
        case ErrorKind::kSeriesNotFound:  return "manga not found";
        case ErrorKind::kChapterNotFound: return "chapter not found";
        case ErrorKind::kPageNotFound:    return "page not found";
        case ErrorKind::kAlreadyExists:   return "already exists";
    }
    return "unknown error";
}

std::string CatalogError::what() const {
    return std::string(error_kind_label(kind)) + ": " + message;
}

} // namespace mangashelf
