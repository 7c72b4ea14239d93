#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "model/catalog_error.hpp"
#include "model/chapter.hpp"
#include "model/series.hpp"
#include "store/record_store.hpp"
#include "util/logger.hpp"

namespace mangashelf {

// Where a resolved record came from.
enum class RecordSource {
    kSidecar,   // loaded from <dir>/metadata.json
    kInferred,  // synthesized from the directory name and contents
};

template <typename T>
struct Resolved {
    RecordSource source = RecordSource::kInferred;
    T record;
};

// Walks a catalog root: one directory per series, one subdirectory per
// chapter. Holds no state between calls; every call re-reads the
// filesystem.
class CatalogScanner {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    CatalogScanner(const std::string& root_dir, const Logger& logger);

    const std::string& root_dir() const { return root_dir_; }

    // Resolve one series directory: sidecar if present, else inference.
    // Fails only when a present sidecar cannot be loaded.
    bool resolve_series(const std::string& dir, Resolved<Series>& out,
                        CatalogError& err) const;

    // Resolve one chapter directory of `series_id`, same policy.
    bool resolve_chapter(const std::string& series_id, const std::string& dir,
                         Resolved<Chapter>& out, CatalogError& err) const;

    // All series under the root, in directory name order. Entries whose
    // sidecar fails to load are logged and omitted. Fails (kMetadata) only
    // when the root cannot be listed.
    bool scan_series(std::vector<Series>& out, CatalogError& err) const;

    // Fast path root/<id>/metadata.json, else full scan and linear search.
    // kSeriesNotFound if no series has this id.
    bool get_series_by_id(const std::string& id, Series& out,
                          CatalogError& err) const;

    // Chapters of a series: immediate non-hidden subdirectories of
    // series.path in name order, skip-on-error. kMetadata when the series
    // directory cannot be listed.
    bool scan_chapters(const Series& series, std::vector<Chapter>& out,
                       CatalogError& err) const;

    // Index of the first chapter (scan order) whose number equals `number`,
    // or npos.
    static size_t find_chapter(const std::vector<Chapter>& chapters,
                               const ChapterNumber& number);

private:
    std::string root_dir_;
    const Logger& logger_;
    RecordStore store_;

    int count_chapters(const Series& series) const;
};

} // namespace mangashelf
