#include "FileStorage.hpp"
#include "CacheKey.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <boost/interprocess/sync/sharable_lock.hpp>

using namespace std;

static const char * const BODY_SUFFIX = ".body";
static const char * const LOCK_SUFFIX = ".lock";

static system_error errnoError(const string & what) {
    return system_error(errno, generic_category(), what);
}

FileLayout::FileLayout(const string & directory, const FileStorageOptions & options)
    : directory(directory), options(options) {
    if (directory.empty()) {
        throw invalid_argument("file storage needs a directory");
    }
}

string FileLayout::pathFor(const string & key) const {
    // NOTE: existing caches depend on this layout, do not change it
    string hashed = CacheKey::sha224Hex(key);
    string path = directory;
    for (size_t i = 0; i < 5; i++) {
        path += "/";
        path += hashed[i];
    }
    return path + "/" + hashed;
}

optional<string> FileLayout::read(const string & path) const {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        // a missing entry is not an error
        if (errno == ENOENT || errno == ENOTDIR) {
            return nullopt;
        }
        throw errnoError("Failed to open cache file " + path);
    }
    string data;
    char buffer[8192];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            system_error error = errnoError("Failed to read cache file " + path);
            ::close(fd);
            throw error;
        }
        if (n == 0) {
            break;
        }
        data.append(buffer, static_cast<size_t>(n));
    }
    ::close(fd);
    return data;
}

void FileLayout::makeDirectories(const string & path) const {
    error_code ec;
    filesystem::create_directories(directory, ec);
    if (ec) {
        throw system_error(ec, "Failed to create cache directory " + directory);
    }
    // the fan-out levels below the root get dirmode
    size_t slash = directory.size();
    while ((slash = path.find('/', slash + 1)) != string::npos) {
        string dir = path.substr(0, slash);
        if (mkdir(dir.c_str(), options.dirmode) != 0 && errno != EEXIST) {
            throw errnoError("Failed to create cache directory " + dir);
        }
    }
}

string FileLayout::lockFor(const string & path) const {
    makeDirectories(path);

    string lockPath = path + LOCK_SUFFIX;
    int lockFd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_NOFOLLOW | O_CLOEXEC, options.filemode);
    if (lockFd < 0) {
        throw errnoError("Failed to create lock file " + lockPath);
    }
    ::close(lockFd);
    return lockPath;
}

void FileLayout::write(const string & path, const string & data) const {
    string lockPath = lockFor(path);
    boost::interprocess::file_lock fileLock(lockPath.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(fileLock);
    replace(path, data);
}

void FileLayout::replace(const string & path, const string & data) const {
    static atomic<unsigned> counter(0);

    string tmpPath = path + ".tmp." + to_string(getpid()) + "." + to_string(counter++);
    // O_EXCL: only open a new file; O_NOFOLLOW: never write through a
    // symlink someone planted at this name
    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                    options.filemode);
    if (fd < 0) {
        throw errnoError("Failed to create cache file " + tmpPath);
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            system_error error = errnoError("Failed to write cache file " + tmpPath);
            ::close(fd);
            ::unlink(tmpPath.c_str());
            throw error;
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        system_error error = errnoError("Failed to close cache file " + tmpPath);
        ::unlink(tmpPath.c_str());
        throw error;
    }

    if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
        system_error error = errnoError("Failed to rename cache file to " + path);
        ::unlink(tmpPath.c_str());
        throw error;
    }
    logger.debug("wrote " + to_string(data.size()) + " bytes to " + path);
}

void FileLayout::unlink(const string & path) const {
    if (options.forever) {
        return;
    }
    if (::unlink(path.c_str()) != 0 && errno != ENOENT && errno != ENOTDIR) {
        throw errnoError("Failed to delete cache file " + path);
    }
}

FileStorage::FileStorage(const string & directory, const FileStorageOptions & options)
    : layout(directory, options) {}

optional<string> FileStorage::get(const string & key) {
    return layout.read(layout.pathFor(key));
}

void FileStorage::set(const string & key, const string & value) {
    layout.write(layout.pathFor(key), value);
}

void FileStorage::remove(const string & key) {
    layout.unlink(layout.pathFor(key));
}

string FileStorage::pathForUrl(const string & url) const {
    return layout.pathFor(CacheKey::cacheUrl(url));
}

SeparateBodyFileStorage::SeparateBodyFileStorage(const string & directory,
                                                 const FileStorageOptions & options)
    : layout(directory, options) {}

optional<string> SeparateBodyFileStorage::get(const string & key) {
    return layout.read(layout.pathFor(key));
}

void SeparateBodyFileStorage::set(const string & key, const string & value) {
    lock_guard<std::mutex> local(mutex);
    layout.write(layout.pathFor(key), value);
}

void SeparateBodyFileStorage::remove(const string & key) {
    lock_guard<std::mutex> local(mutex);
    string path = layout.pathFor(key);
    layout.unlink(path);
    layout.unlink(path + BODY_SUFFIX);
}

unique_ptr<BodyStream> SeparateBodyFileStorage::openBody(const string & path) const {
    if (::access(path.c_str(), F_OK) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return nullptr;
        }
        throw errnoError("Failed to access body file " + path);
    }
    return make_unique<FileBodyStream>(path);
}

unique_ptr<BodyStream> SeparateBodyFileStorage::getBody(const string & key) {
    return openBody(layout.pathFor(key) + BODY_SUFFIX);
}

void SeparateBodyFileStorage::setBody(const string & key, const string & body) {
    lock_guard<std::mutex> local(mutex);
    string path = layout.pathFor(key);
    boost::interprocess::file_lock fileLock(layout.lockFor(path).c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(fileLock);
    layout.replace(path + BODY_SUFFIX, body);
}

optional<SeparateBodyStorage::StoredEntry> SeparateBodyFileStorage::getEntry(const string & key) {
    lock_guard<std::mutex> local(mutex);
    string path = layout.pathFor(key);
    string lockPath = path + LOCK_SUFFIX;
    if (::access(lockPath.c_str(), F_OK) != 0) {
        // never written through this layout
        return nullopt;
    }

    boost::interprocess::file_lock fileLock(lockPath.c_str());
    boost::interprocess::sharable_lock<boost::interprocess::file_lock> guard(fileLock);
    optional<string> metadata = layout.read(path);
    if (!metadata) {
        return nullopt;
    }
    // the open stream keeps reading this body even if a writer renames
    // a new one over it after the lock is released
    unique_ptr<BodyStream> body = openBody(path + BODY_SUFFIX);
    if (!body) {
        return nullopt;
    }
    return StoredEntry{std::move(*metadata), std::move(body)};
}

void SeparateBodyFileStorage::setEntry(const string & key, const string & metadata, const string & body) {
    lock_guard<std::mutex> local(mutex);
    string path = layout.pathFor(key);
    boost::interprocess::file_lock fileLock(layout.lockFor(path).c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(fileLock);
    layout.replace(path + BODY_SUFFIX, body);
    layout.replace(path, metadata);
}

string SeparateBodyFileStorage::pathForUrl(const string & url) const {
    return layout.pathFor(CacheKey::cacheUrl(url));
}
