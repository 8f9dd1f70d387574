#ifndef FILESTORAGE_HPP
#define FILESTORAGE_HPP

#include <string>
#include <mutex>
#include <optional>
#include <sys/types.h>

#include "Logger.hpp"
#include "Storage.hpp"

struct FileStorageOptions {
    // deletes become no-ops
    bool forever = false;
    mode_t filemode = 0600;
    mode_t dirmode = 0700;
};

// On-disk layout shared by both file storages: one file per key at
// <dir>/a/b/c/d/e/<sha224 of key>, where a..e are the first five hex
// digits of the hash.
class FileLayout {
public:
    FileLayout(const std::string & directory, const FileStorageOptions & options);

    std::string pathFor(const std::string & key) const;

    std::optional<std::string> read(const std::string & path) const;

    // Write under an exclusive lock on <path>.lock: the data goes to a
    // fresh O_EXCL|O_NOFOLLOW temp file which is then renamed over
    // path, so readers see either the old or the new file.
    void write(const std::string & path, const std::string & data) const;

    // write() without taking the lock; the caller holds lockFor(path)
    void replace(const std::string & path, const std::string & data) const;

    // Creates <path>.lock, and the directories above it, if missing.
    // Returns its path.
    std::string lockFor(const std::string & path) const;

    void unlink(const std::string & path) const;

    const std::string & getDirectory() const { return directory; }
    const FileStorageOptions & getOptions() const { return options; }

private:
    std::string directory;
    FileStorageOptions options;
    static inline Logger & logger = Logger::getInstance();

    void makeDirectories(const std::string & path) const;
};

// Body and metadata in one file. Not suited for large bodies, which
// are held in memory.
class FileStorage : public Storage {
public:
    explicit FileStorage(const std::string & directory,
                         const FileStorageOptions & options = FileStorageOptions());

    std::optional<std::string> get(const std::string & key) override;
    void set(const std::string & key, const std::string & value) override;
    void remove(const std::string & key) override;

    std::string pathFor(const std::string & key) const { return layout.pathFor(key); }
    // where a GET for url lands; the file may not exist
    std::string pathForUrl(const std::string & url) const;

private:
    FileLayout layout;
};

// Body in a sibling <path>.body file, streamed on read.
class SeparateBodyFileStorage : public SeparateBodyStorage {
public:
    explicit SeparateBodyFileStorage(const std::string & directory,
                                     const FileStorageOptions & options = FileStorageOptions());

    std::optional<std::string> get(const std::string & key) override;
    void set(const std::string & key, const std::string & value) override;
    void remove(const std::string & key) override;

    std::unique_ptr<BodyStream> getBody(const std::string & key) override;
    void setBody(const std::string & key, const std::string & body) override;

    // Both run under <path>.lock, shared for readers and exclusive for
    // writers, so a reader never pairs metadata with another write's body.
    std::optional<StoredEntry> getEntry(const std::string & key) override;
    void setEntry(const std::string & key, const std::string & metadata,
                  const std::string & body) override;

    std::string pathFor(const std::string & key) const { return layout.pathFor(key); }
    std::string pathForUrl(const std::string & url) const;

private:
    FileLayout layout;
    // file locks do not exclude threads of one process
    std::mutex mutex;

    std::unique_ptr<BodyStream> openBody(const std::string & path) const;
};

#endif
