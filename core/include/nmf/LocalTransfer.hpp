// Local filesystem transfer engine used by the job worker.
// Copies or moves one path (file, symlink or directory tree) into a
// destination directory, polling a cancel callback at safe checkpoints.
#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace nmf {

enum class TransferMode { Copy, Move };

// Result of a transfer. Canceled is not an error and carries no TransferError.
enum class TransferResult { Ok, Failed, Canceled };

struct TransferError {
    std::string path;    // path that failed (may be a child of the source)
    std::string message; // "<path>: <reason>"
};

struct TransferOptions {
    TransferMode mode = TransferMode::Copy;
    std::size_t chunkSize = 1024 * 1024; // bytes per read/write
    std::string tempSuffix = ".part";    // sibling temporary file suffix
};

using CancelFn = std::function<bool()>;
using TraceFn = std::function<void(const std::string &)>;

// Last path component, ignoring trailing separators ("/a/b/" -> "b").
std::string baseName(const std::string &path);

// Joins a directory and an entry name with a single '/'.
std::string joinPath(const std::string &dir, const std::string &name);

// Transfers `src` to `destDir/baseName(src)`.
//  - directories are recreated and walked recursively (children sorted by name)
//  - symlinks are recreated with the same target string, never followed
//  - regular files are copied through `dst + tempSuffix` and renamed into place
// With TransferMode::Move the source is removed once its copy is in place.
// Existing destination files are replaced.
TransferResult transferPath(const std::string &src, const std::string &destDir,
                            const TransferOptions &options, TransferError &err,
                            const CancelFn &shouldCancel = {},
                            const TraceFn &trace = {});

// Atomic single file copy used by transferPath. `mode` holds the permission
// bits applied to the new file before it is renamed onto `dst`.
TransferResult copyFileAtomic(const std::string &src, const std::string &dst,
                              unsigned int mode, const TransferOptions &options,
                              TransferError &err,
                              const CancelFn &shouldCancel = {},
                              const TraceFn &trace = {});

} // namespace nmf
