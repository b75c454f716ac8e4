#include "store/posix_chunk_store.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include <glog/logging.h>
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "common/scoped_fd.h"
#include "common/status_util.h"
#include "store/snapshot_layout.h"

namespace Snapstream {

namespace {

std::string ParentOf(const std::string& path) {
	size_t pos = path.find_last_of('/');
	if (pos == std::string::npos) return ".";
	if (pos == 0) return "/";
	return path.substr(0, pos);
}

absl::Status MakeOneDir(const std::string& dir) {
	if (::mkdir(dir.c_str(), 0755) == 0) return absl::OkStatus();
	int err = errno;
	if (err == EEXIST) {
		struct stat st;
		if (::stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
			return absl::OkStatus();
		}
		return absl::FailedPreconditionError(absl::StrCat(dir, " exists and is not a directory"));
	}
	return ErrnoToStatus(err, absl::StrCat("mkdir ", dir));
}

} // namespace

absl::Status PosixChunkStore::CreateDir(const std::string& dir) {
	if (dir.empty()) return absl::InvalidArgumentError("empty directory path");
	// Walk the path creating every missing component.
	for (size_t pos = dir.find('/', 1); pos != std::string::npos; pos = dir.find('/', pos + 1)) {
		SNAPSTREAM_RETURN_IF_ERROR(MakeOneDir(dir.substr(0, pos)));
	}
	return MakeOneDir(dir);
}

std::string PosixChunkStore::TempPathFor(const std::string& path) {
	return absl::StrCat(path, ".", ::getpid(), "_", tmp_counter_.fetch_add(1), layout::kTempSuffix);
}

absl::Status PosixChunkStore::WriteAtomic(const std::string& path, absl::string_view data) {
	const std::string tmp = TempPathFor(path);
	{
		ScopedFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
		if (!fd.valid()) {
			return ErrnoToStatus(errno, absl::StrCat("open ", tmp));
		}
		size_t written = 0;
		while (written < data.size()) {
			ssize_t n = ::write(fd.get(), data.data() + written, data.size() - written);
			if (n < 0) {
				if (errno == EINTR) continue;
				int err = errno;
				::unlink(tmp.c_str());
				return ErrnoToStatus(err, absl::StrCat("write ", tmp));
			}
			written += static_cast<size_t>(n);
		}
		if (::fsync(fd.get()) != 0) {
			int err = errno;
			::unlink(tmp.c_str());
			return ErrnoToStatus(err, absl::StrCat("fsync ", tmp));
		}
		if (fd.Close() != 0) {
			int err = errno;
			::unlink(tmp.c_str());
			return ErrnoToStatus(err, absl::StrCat("close ", tmp));
		}
	}
	if (::rename(tmp.c_str(), path.c_str()) != 0) {
		int err = errno;
		::unlink(tmp.c_str());
		return ErrnoToStatus(err, absl::StrCat("rename ", tmp, " -> ", path));
	}
	return SyncParentDir(path);
}

absl::Status PosixChunkStore::Rename(const std::string& from, const std::string& to) {
	if (::rename(from.c_str(), to.c_str()) != 0) {
		return ErrnoToStatus(errno, absl::StrCat("rename ", from, " -> ", to));
	}
	SNAPSTREAM_RETURN_IF_ERROR(SyncParentDir(to));
	if (ParentOf(from) != ParentOf(to)) {
		return SyncParentDir(from);
	}
	return absl::OkStatus();
}

absl::StatusOr<bool> PosixChunkStore::Exists(const std::string& path) {
	struct stat st;
	if (::stat(path.c_str(), &st) == 0) return true;
	if (errno == ENOENT || errno == ENOTDIR) return false;
	return ErrnoToStatus(errno, absl::StrCat("stat ", path));
}

absl::StatusOr<std::string> PosixChunkStore::ReadFile(const std::string& path) {
	ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if (!fd.valid()) {
		return ErrnoToStatus(errno, absl::StrCat("open ", path));
	}
	struct stat st;
	if (::fstat(fd.get(), &st) != 0) {
		return ErrnoToStatus(errno, absl::StrCat("fstat ", path));
	}
	std::string contents;
	contents.resize(static_cast<size_t>(st.st_size));
	size_t off = 0;
	while (off < contents.size()) {
		ssize_t n = ::read(fd.get(), &contents[off], contents.size() - off);
		if (n < 0) {
			if (errno == EINTR) continue;
			return ErrnoToStatus(errno, absl::StrCat("read ", path));
		}
		if (n == 0) break;
		off += static_cast<size_t>(n);
	}
	contents.resize(off);
	return contents;
}

absl::StatusOr<std::vector<std::string>> PosixChunkStore::List(const std::string& dir,
		const std::string& prefix) {
	std::vector<std::string> names;
	DIR* d = ::opendir(dir.c_str());
	if (d == nullptr) {
		if (errno == ENOENT) return names;
		return ErrnoToStatus(errno, absl::StrCat("opendir ", dir));
	}
	errno = 0;
	while (struct dirent* entry = ::readdir(d)) {
		std::string name(entry->d_name);
		if (name == "." || name == "..") continue;
		if (!absl::StartsWith(name, prefix)) continue;
		if (absl::EndsWith(name, layout::kTempSuffix)) continue;
		names.push_back(std::move(name));
	}
	int err = errno;
	::closedir(d);
	if (err != 0) {
		return ErrnoToStatus(err, absl::StrCat("readdir ", dir));
	}
	std::sort(names.begin(), names.end());
	return names;
}

absl::Status PosixChunkStore::Delete(const std::string& path) {
	if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
		return ErrnoToStatus(errno, absl::StrCat("unlink ", path));
	}
	return absl::OkStatus();
}

absl::Status PosixChunkStore::SyncParentDir(const std::string& path) {
	const std::string parent = ParentOf(path);
	ScopedFd fd(::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
	if (!fd.valid()) {
		return ErrnoToStatus(errno, absl::StrCat("open dir ", parent));
	}
	if (::fsync(fd.get()) != 0) {
		// Some filesystems refuse fsync on directories.
		if (errno == EINVAL) {
			VLOG(2) << "[PosixChunkStore] fsync unsupported on " << parent;
			return absl::OkStatus();
		}
		return ErrnoToStatus(errno, absl::StrCat("fsync dir ", parent));
	}
	return absl::OkStatus();
}

} // namespace Snapstream
