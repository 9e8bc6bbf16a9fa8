#pragma once

// stencil/source.hpp - Byte source capability consumed by stenciled views.
//
// A Source is anything that can be positioned and read: a file descriptor, an
// in-memory buffer, a decompressing stream provided by an archive backend.
// Views never own the lifetime of a Source; they hold a shared_ptr only so a
// source closed by its owner is observed through closed() rather than
// becoming a dangling reference.
//
// Thread-safety: implementations are NOT required to be safe for concurrent
// calls. Callers sharing one source across threads serialize seek+read pairs
// through the guard accepted by RawStenciledView.

#include <cstddef>
#include <cstdint>
#include <string>

#include "stencil/types.hpp"

namespace stencil {

class Source {
 public:
  virtual ~Source() = default;

  // Reposition; returns the new absolute offset. Throws StencilError.
  virtual int64_t seek(int64_t offset, Whence whence = Whence::set) = 0;

  // Read up to n bytes into buf. Returns the count, 0 at end of source.
  virtual std::size_t read(char* buf, std::size_t n) = 0;

  virtual int64_t tell() const = 0;

  virtual bool readable() const = 0;
  virtual bool seekable() const = 0;
  virtual bool closed() const = 0;

  // Human-readable identifier for diagnostics.
  virtual std::string describe() const = 0;
};

// ---------------------------------------------------------------------------
// FileSource - read-only POSIX file descriptor
// ---------------------------------------------------------------------------
// Pipes and character devices open fine but report seekable() == false.
class FileSource : public Source {
 public:
  explicit FileSource(std::string path);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  int64_t seek(int64_t offset, Whence whence = Whence::set) override;
  std::size_t read(char* buf, std::size_t n) override;
  int64_t tell() const override;

  bool readable() const override { return !closed(); }
  bool seekable() const override { return seekable_; }
  bool closed() const override { return fd_ < 0; }
  std::string describe() const override { return "file:" + path_; }

  void close();

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  int fd_{-1};
  bool seekable_{false};
};

// ---------------------------------------------------------------------------
// MemorySource - bytes held in memory
// ---------------------------------------------------------------------------
// Positions past the end are allowed, as with regular files; reads there
// return 0. The capability flags can be lowered to model restricted sources.
class MemorySource : public Source {
 public:
  explicit MemorySource(std::string data, bool seekable = true,
                        bool readable = true);

  int64_t seek(int64_t offset, Whence whence = Whence::set) override;
  std::size_t read(char* buf, std::size_t n) override;
  int64_t tell() const override { return pos_; }

  bool readable() const override { return readable_; }
  bool seekable() const override { return seekable_; }
  bool closed() const override { return closed_; }
  std::string describe() const override;

  void close() { closed_ = true; }

  const std::string& data() const { return data_; }

 private:
  std::string data_;
  int64_t pos_{0};
  bool seekable_;
  bool readable_;
  bool closed_{false};
};

}  // namespace stencil
