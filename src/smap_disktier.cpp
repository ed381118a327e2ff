// Copyright (c) 2010, Björn Rehm (bjoern@shugaa.de)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <cstdio>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <boost/filesystem.hpp>
#include "smap_disktier.hpp"

namespace fs = boost::filesystem;

smap_disktier::smap_disktier(const std::string &basepath, const std::string &ext) :
    m_basepath(basepath),
    m_ext(ext)
{
    ;
}

smap_disktier::~smap_disktier()
{
    ;
}

int smap_disktier::path(const smap_tileaddress &tile, std::string &p) const
{
    if (!tile.valid())
        return 1;

    std::ostringstream ss;
    ss << m_basepath << "/" << tile.z() << "/" << tile.x() << "/" << tile.y() << "." << m_ext;
    p = ss.str();

    return 0;
}

int smap_disktier::put(const smap_tileaddress &tile, const unsigned char *buf, size_t nbytes)
{
    if (buf == NULL)
        return 1;
    if (nbytes < 1)
        return 1;

    std::string target;
    if (path(tile, target) != 0)
        return 1;

    // Directories are created on first write
    fs::path dir = fs::path(target).parent_path();
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        fprintf(stderr, "Couldn't create '%s': %s\n", dir.string().c_str(), ec.message().c_str());
        return 1;
    }

    // Write next to the target and rename, readers see all or nothing
    fs::path tmp = dir / fs::unique_path("%%%%-%%%%-%%%%.tmp");

    int fd = open(tmp.string().c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        fprintf(stderr, "Couldn't open '%s' for writing: %s\n", tmp.string().c_str(), strerror(errno));
        return 1;
    }

    size_t written = 0;
    while (written < nbytes) {
        ssize_t rc = write(fd, buf + written, nbytes - written);
        if (rc < 0) {
            if (errno == EINTR)
                continue;

            fprintf(stderr, "Couldn't write '%s': %s\n", tmp.string().c_str(), strerror(errno));
            close(fd);
            fs::remove(tmp, ec);
            return 1;
        }
        written += (size_t)rc;
    }

    if (close(fd) != 0) {
        fprintf(stderr, "Couldn't close '%s': %s\n", tmp.string().c_str(), strerror(errno));
        fs::remove(tmp, ec);
        return 1;
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fprintf(stderr, "Couldn't publish '%s': %s\n", target.c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        return 1;
    }

    return 0;
}

int smap_disktier::get(const smap_tileaddress &tile, std::vector<unsigned char> &buf)
{
    std::string p;
    if (path(tile, p) != 0)
        return 1;

    struct stat filestat;
    if (stat(p.c_str(), &filestat) != 0)
        return 1;
    if (filestat.st_size < 1)
        return 1;

    int fd = open(p.c_str(), O_RDONLY);
    if (fd < 0)
        return 1;

    std::vector<unsigned char> data((size_t)filestat.st_size);
    size_t nread = 0;
    while (nread < data.size()) {
        ssize_t rc = read(fd, &data[nread], data.size() - nread);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            close(fd);
            return 1;
        }

        // File shrank underneath us
        if (rc == 0)
            break;

        nread += (size_t)rc;
    }
    close(fd);

    if (nread != data.size())
        return 1;

    buf.swap(data);
    return 0;
}

bool smap_disktier::exists(const smap_tileaddress &tile)
{
    std::string p;
    if (path(tile, p) != 0)
        return false;

    struct stat filestat;
    return stat(p.c_str(), &filestat) == 0;
}

int smap_disktier::remove(const smap_tileaddress &tile)
{
    std::string p;
    if (path(tile, p) != 0)
        return 1;

    boost::system::error_code ec;
    return fs::remove(p, ec) ? 0 : 1;
}
