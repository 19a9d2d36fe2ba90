#include "core/storage/journal.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace extropy {
namespace {

std::string errno_text() {
  return std::strerror(errno);
}

bool write_all(int fd, std::string_view data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

Result FileJournal::open(std::string_view path) {
  path_ = std::string{path};

  std::error_code ec;
  const auto parent = std::filesystem::path{path_}.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Result::failure(ErrorKind::StorageFault, "Failed to create journal directory: " + ec.message());
    }
  }

  const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Result::failure(ErrorKind::StorageFault, "Failed to open journal " + path_ + ": " + errno_text());
  }
  ::close(fd);
  return Result::success("Journal opened.");
}

Outcome<JournalContents> FileJournal::load() {
  std::ifstream in(path_, std::ios::in | std::ios::binary);
  if (!in) {
    return Outcome<JournalContents>::failure(
        Result::failure(ErrorKind::StorageFault, "Failed to read journal " + path_ + "."));
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  const std::string raw = ss.str();

  JournalContents contents;
  std::size_t start = 0;
  while (start < raw.size()) {
    const auto end = raw.find('\n', start);
    if (end == std::string::npos) {
      contents.torn_tail = true;
      break;
    }
    if (end > start) {
      contents.lines.push_back(raw.substr(start, end - start));
    }
    start = end + 1U;
  }

  if (contents.torn_tail) {
    const Result repaired = rewrite(contents.lines);
    if (!repaired.ok) {
      return Outcome<JournalContents>::failure(repaired);
    }
  }
  return Outcome<JournalContents>::success(std::move(contents));
}

Result FileJournal::append(std::string_view line) {
  const int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
  if (fd < 0) {
    return Result::failure(ErrorKind::StorageFault, "Failed to open journal for append: " + errno_text());
  }

  struct stat before {};
  if (::fstat(fd, &before) != 0) {
    const std::string reason = errno_text();
    ::close(fd);
    return Result::failure(ErrorKind::StorageFault, "Failed to stat journal: " + reason);
  }

  std::string record{line};
  record.push_back('\n');
  bool ok = write_all(fd, record);
  if (ok && sync_writes_) {
    ok = ::fdatasync(fd) == 0;
  }

  if (!ok) {
    const std::string reason = errno_text();
    // Drop any partial record so the tail stays parseable.
    if (::ftruncate(fd, before.st_size) != 0) {
      ::close(fd);
      return Result::failure(ErrorKind::StorageFault,
                             "Journal append failed (" + reason + ") and truncate failed: " + errno_text());
    }
    ::close(fd);
    return Result::failure(ErrorKind::StorageFault, "Journal append failed: " + reason);
  }

  if (::close(fd) != 0) {
    return Result::failure(ErrorKind::StorageFault, "Failed to close journal: " + errno_text());
  }
  return Result::success();
}

Result FileJournal::rewrite(const std::vector<std::string>& lines) {
  const std::string tmp_path = path_ + ".tmp";
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Result::failure(ErrorKind::StorageFault, "Failed to open journal rewrite file: " + errno_text());
  }

  std::string content;
  for (const auto& line : lines) {
    content += line;
    content.push_back('\n');
  }
  bool ok = write_all(fd, content);
  if (ok && sync_writes_) {
    ok = ::fdatasync(fd) == 0;
  }
  if (!ok) {
    const std::string reason = errno_text();
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return Result::failure(ErrorKind::StorageFault, "Failed writing rewritten journal: " + reason);
  }
  if (::close(fd) != 0) {
    const std::string reason = errno_text();
    ::unlink(tmp_path.c_str());
    return Result::failure(ErrorKind::StorageFault, "Failed to close rewritten journal: " + reason);
  }

  if (::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    const std::string reason = errno_text();
    ::unlink(tmp_path.c_str());
    return Result::failure(ErrorKind::StorageFault, "Failed to replace journal: " + reason);
  }

  // The rename is only durable once the directory entry is synced.
  if (sync_writes_) {
    const auto parent = std::filesystem::path{path_}.parent_path();
    const std::string dir = parent.empty() ? std::string{"."} : parent.string();
    const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
      return Result::failure(ErrorKind::StorageFault, "Failed to open journal directory: " + errno_text());
    }
    const bool synced = ::fsync(dir_fd) == 0;
    const std::string reason = synced ? std::string{} : errno_text();
    ::close(dir_fd);
    if (!synced) {
      return Result::failure(ErrorKind::StorageFault, "Failed to sync journal directory: " + reason);
    }
  }
  return Result::success();
}

std::unique_ptr<IJournal> make_file_journal(bool sync_writes) {
  return std::make_unique<FileJournal>(sync_writes);
}

}  // namespace extropy
