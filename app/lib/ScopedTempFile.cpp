/*
 * Scoped temporary file implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ScopedTempFile.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

ScopedTempFile::ScopedTempFile(const std::filesystem::path& directory, const std::string& prefix)
{
    std::filesystem::path dir = directory;
    if (dir.empty()) {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            dir = "/tmp";
        }
    }

    const std::string pattern = (dir / (prefix + "XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = mkstemp(name.data());
    if (fd < 0) {
        error_ = "Failed to create temporary file in " + dir.string() + ": " + std::strerror(errno);
        return;
    }
    close(fd);
    path_ = name.data();
}

ScopedTempFile::~ScopedTempFile()
{
    if (!path_.empty()) {
        unlink(path_.c_str());
    }
}

bool ScopedTempFile::write(const std::string& contents)
{
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
        error_ = "Failed to write temporary file " + path_;
        return false;
    }
    return true;
}

bool ScopedTempFile::read(std::string& contents)
{
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        error_ = "Failed to read temporary file " + path_;
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    contents = buffer.str();
    return true;
}
