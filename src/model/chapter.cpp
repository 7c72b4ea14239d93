#include "model/chapter.hpp"

namespace mangashelf {

bool Chapter::validate(CatalogError& err) const {
    if (series_id.empty()) {
        return err.set(ErrorKind::kValidation, "manga ID is required");
    }
    if (!number.positive()) {
        return err.set(ErrorKind::kValidation, "chapter number must be positive");
    }
    return true;
}

} // namespace mangashelf
