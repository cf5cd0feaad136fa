// Local transfer engine: lstat-driven recursion, atomic file replace through a
// temporary sibling, symlinks recreated verbatim.
#include "nmf/LocalTransfer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// POSIX
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace nmf {

namespace {

constexpr unsigned int kPermMask = 0777;
constexpr mode_t kNewDirMode = 0755;

TransferResult failWith(TransferError &err, const std::string &path,
                        const std::string &reason) {
    err.path = path;
    err.message = path + ": " + reason;
    return TransferResult::Failed;
}

TransferResult failErrno(TransferError &err, const std::string &path,
                         int errnum) {
    // Some libc paths fail without setting errno; never report "Success".
    return failWith(err, path, std::strerror(errnum != 0 ? errnum : EIO));
}

bool canceled(const CancelFn &shouldCancel) {
    return shouldCancel && shouldCancel();
}

void emitTrace(const TraceFn &trace, const std::string &msg) {
    if (trace)
        trace(msg);
}

std::string parentDir(const std::string &path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return path.substr(0, pos);
}

// mkdir -p. Returns 0 or an errno value.
int makeDirs(const std::string &path, mode_t mode) {
    if (path.empty())
        return 0;
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0)
        return S_ISDIR(st.st_mode) ? 0 : ENOTDIR;
    std::size_t pos = 0;
    while (true) {
        pos = path.find('/', pos + 1);
        const std::string part = path.substr(0, pos);
        if (!part.empty() && ::mkdir(part.c_str(), mode) != 0 &&
            errno != EEXIST)
            return errno;
        if (pos == std::string::npos)
            break;
    }
    if (::stat(path.c_str(), &st) != 0)
        return errno;
    return S_ISDIR(st.st_mode) ? 0 : ENOTDIR;
}

// Immediate children of `dir` without "." and "..", sorted by name.
bool listChildren(const std::string &dir, std::vector<std::string> &out,
                  int &errnum) {
    DIR *d = ::opendir(dir.c_str());
    if (!d) {
        errnum = errno;
        return false;
    }
    while (true) {
        errno = 0;
        const dirent *ent = ::readdir(d);
        if (!ent) {
            if (errno != 0) {
                errnum = errno;
                ::closedir(d);
                return false;
            }
            break;
        }
        const std::string name = ent->d_name;
        if (name == "." || name == "..")
            continue;
        out.push_back(name);
    }
    ::closedir(d);
    std::sort(out.begin(), out.end());
    return true;
}

bool readLinkTarget(const std::string &path, std::size_t sizeHint,
                    std::string &target, int &errnum) {
    std::vector<char> buf(sizeHint > 0 ? sizeHint + 1 : 256);
    while (true) {
        const ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
        if (n < 0) {
            errnum = errno;
            return false;
        }
        if (static_cast<std::size_t>(n) < buf.size()) {
            target.assign(buf.data(), static_cast<std::size_t>(n));
            return true;
        }
        // Target grew between lstat and readlink.
        buf.resize(buf.size() * 2);
    }
}

bool sameFile(const struct stat &a, const struct stat &b) {
    return a.st_dev == b.st_dev && a.st_ino == b.st_ino;
}

std::string trimTrailingSlashes(const std::string &path) {
    std::size_t end = path.size();
    while (end > 1 && path[end - 1] == '/')
        --end;
    return path.substr(0, end);
}

// True when `destDir` already is the directory holding `src`, however either
// path is spelled ("dir/.", "dir//", a symlink to dir).
bool sameParent(const std::string &src, const std::string &destDir) {
    struct stat parentSt{};
    struct stat destSt{};
    if (::stat(parentDir(trimTrailingSlashes(src)).c_str(), &parentSt) != 0)
        return false;
    if (::stat(destDir.c_str(), &destSt) != 0)
        return false;
    return sameFile(parentSt, destSt);
}

// True when `destDir` is the directory `dirSt` or lies below it. Missing
// trailing components are skipped; the existing part is resolved with
// realpath() and its ancestors compared by device and inode.
bool destWithin(const struct stat &dirSt, const std::string &destDir) {
    std::string existing = destDir;
    struct stat st{};
    while (::stat(existing.c_str(), &st) != 0) {
        if (existing == "/" || existing == ".")
            return false;
        existing = parentDir(trimTrailingSlashes(existing));
    }
    char *resolved = ::realpath(existing.c_str(), nullptr);
    if (!resolved)
        return false;
    std::string p(resolved);
    std::free(resolved);
    while (true) {
        if (::stat(p.c_str(), &st) == 0 && sameFile(st, dirSt))
            return true;
        if (p == "/" || p.empty())
            return false;
        p = parentDir(p);
    }
}

} // namespace

std::string baseName(const std::string &path) {
    std::size_t end = path.size();
    while (end > 1 && path[end - 1] == '/')
        --end;
    const std::string trimmed = path.substr(0, end);
    const auto pos = trimmed.find_last_of('/');
    if (pos == std::string::npos || trimmed == "/")
        return trimmed;
    return trimmed.substr(pos + 1);
}

std::string joinPath(const std::string &dir, const std::string &name) {
    if (dir.empty())
        return name;
    if (name.empty())
        return dir;
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

TransferResult copyFileAtomic(const std::string &src, const std::string &dst,
                              unsigned int mode, const TransferOptions &options,
                              TransferError &err, const CancelFn &shouldCancel,
                              const TraceFn &trace) {
    if (const int e = makeDirs(parentDir(dst), kNewDirMode))
        return failErrno(err, dst, e);

    FILE *in = std::fopen(src.c_str(), "rb");
    if (!in)
        return failErrno(err, src, errno);

    // The temporary is always a fresh regular file: a stale entry (or a
    // symlink planted there) is unlinked, never written through.
    const std::string tmp = dst + options.tempSuffix;
    if (::unlink(tmp.c_str()) != 0 && errno != ENOENT) {
        const int e = errno;
        std::fclose(in);
        return failErrno(err, tmp, e);
    }
    const int fd = ::open(tmp.c_str(),
                          O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                          0600);
    if (fd < 0) {
        const int e = errno;
        std::fclose(in);
        return failErrno(err, tmp, e);
    }
    FILE *out = ::fdopen(fd, "wb");
    if (!out) {
        const int e = errno;
        ::close(fd);
        std::remove(tmp.c_str());
        std::fclose(in);
        return failErrno(err, tmp, e);
    }
    emitTrace(trace, "copy " + src + " -> " + tmp);

    auto discard = [&]() {
        std::fclose(in);
        std::fclose(out);
        std::remove(tmp.c_str());
    };

    std::vector<char> buf(std::max<std::size_t>(options.chunkSize, 1));
    while (true) {
        if (canceled(shouldCancel)) {
            discard();
            emitTrace(trace, "canceled, removed " + tmp);
            return TransferResult::Canceled;
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), in);
        if (n > 0 && std::fwrite(buf.data(), 1, n, out) != n) {
            const int e = errno;
            discard();
            return failErrno(err, tmp, e);
        }
        if (n < buf.size()) {
            if (std::ferror(in)) {
                const int e = errno;
                discard();
                return failErrno(err, src, e);
            }
            break; // EOF
        }
    }
    std::fclose(in);

    if (std::fflush(out) != 0 || ::fchmod(::fileno(out), mode & kPermMask) != 0) {
        const int e = errno;
        std::fclose(out);
        std::remove(tmp.c_str());
        return failErrno(err, tmp, e);
    }
    if (std::fclose(out) != 0) {
        const int e = errno;
        std::remove(tmp.c_str());
        return failErrno(err, tmp, e);
    }

    emitTrace(trace, "rename " + tmp + " -> " + dst);
    if (std::rename(tmp.c_str(), dst.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp.c_str());
        return failErrno(err, dst, e);
    }
    return TransferResult::Ok;
}

TransferResult transferPath(const std::string &src, const std::string &destDir,
                            const TransferOptions &options, TransferError &err,
                            const CancelFn &shouldCancel, const TraceFn &trace) {
    struct stat st{};
    if (::lstat(src.c_str(), &st) != 0)
        return failErrno(err, src, errno);

    const std::string dst = joinPath(destDir, baseName(src));
    const bool move = options.mode == TransferMode::Move;

    if (dst == src || sameParent(src, destDir)) {
        emitTrace(trace, "skip " + src + " (already at destination)");
        return TransferResult::Ok;
    }

    if (S_ISDIR(st.st_mode)) {
        if (destWithin(st, destDir))
            return failWith(err, dst,
                            "cannot transfer a directory into itself");
        emitTrace(trace, "mkdir " + dst);
        if (const int e = makeDirs(dst, kNewDirMode))
            return failErrno(err, dst, e);

        std::vector<std::string> children;
        int e = 0;
        if (!listChildren(src, children, e))
            return failErrno(err, src, e);
        for (const auto &name : children) {
            if (canceled(shouldCancel))
                return TransferResult::Canceled;
            const TransferResult r = transferPath(
                joinPath(src, name), dst, options, err, shouldCancel, trace);
            if (r != TransferResult::Ok)
                return r;
        }
        // Best effort, and only once the children are in: a read-only source
        // directory must not block its own copy.
        (void)::chmod(dst.c_str(), st.st_mode & kPermMask);
        if (move) {
            emitTrace(trace, "rmdir " + src);
            if (::rmdir(src.c_str()) != 0)
                return failErrno(err, src, errno);
        }
        return TransferResult::Ok;
    }

    if (S_ISLNK(st.st_mode)) {
        std::string target;
        int e = 0;
        if (!readLinkTarget(src, static_cast<std::size_t>(st.st_size), target,
                            e))
            return failErrno(err, src, e);
        struct stat existing{};
        if (::lstat(dst.c_str(), &existing) == 0 && !S_ISDIR(existing.st_mode))
            (void)::unlink(dst.c_str()); // symlink() reports what remains
        emitTrace(trace, "symlink " + dst + " -> " + target);
        if (::symlink(target.c_str(), dst.c_str()) != 0)
            return failErrno(err, dst, errno);
        if (move) {
            emitTrace(trace, "unlink " + src);
            if (::unlink(src.c_str()) != 0)
                return failErrno(err, src, errno);
        }
        return TransferResult::Ok;
    }

    if (S_ISREG(st.st_mode)) {
        const TransferResult r =
            copyFileAtomic(src, dst, st.st_mode & kPermMask, options, err,
                           shouldCancel, trace);
        if (r != TransferResult::Ok)
            return r;
        if (move) {
            emitTrace(trace, "remove " + src);
            if (::unlink(src.c_str()) != 0)
                return failErrno(err, src, errno);
        }
        return TransferResult::Ok;
    }

    return failWith(err, src, "unsupported file type");
}

} // namespace nmf
