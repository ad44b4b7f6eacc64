/*
 * Uniquely named temporary file removed on scope exit
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SCOPED_TEMP_FILE_HPP
#define SCOPED_TEMP_FILE_HPP

#include <filesystem>
#include <string>

/**
 * mkstemp-backed temporary file
 *
 * The file is unlinked by the destructor on every exit path. Construction
 * never throws; check ok() and error().
 */
class ScopedTempFile {
public:
    ScopedTempFile(const std::filesystem::path& directory, const std::string& prefix);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& error() const { return error_; }
    const std::string& path() const { return path_; }

    /**
     * Replace the file contents
     * @return false on a write error (see error())
     */
    bool write(const std::string& contents);

    /**
     * Read the whole file
     * @return false on a read error (see error())
     */
    bool read(std::string& contents);

private:
    std::string path_;
    std::string error_;
};

#endif // SCOPED_TEMP_FILE_HPP
