// util.hpp
//
// Small filesystem helpers used by disk-backed corpora and the driver.
//

#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace seedbank
{
    /**
     * Join a directory and a file name with exactly one separator.
     */
    std::string DirPlusFile(const std::string &dir, const std::string &file);

    bool PathExists(const std::string &path);

    /**
     * Create `path` and any missing parents (like `mkdir -p`).
     * Returns true if the directory exists afterwards.
     */
    bool MakeDirectories(const std::string &path);

    /**
     * Read the whole file into `out`. Returns false on any I/O error.
     */
    bool ReadFile(const std::string &path, std::vector<uint8_t> &out);

    /**
     * Write `len` bytes to `path`, going through a hidden temporary
     * sibling that is renamed into place.
     */
    bool WriteFileAtomic(const std::string &path, const uint8_t *data, size_t len);

    /**
     * List the names (not paths) of the regular, non-hidden files in
     * `dir`, sorted by name.
     */
    bool ListRegularFiles(const std::string &dir, std::vector<std::string> &out);
}
