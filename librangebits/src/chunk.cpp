// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/chunk.hpp"

#include "rangebits/error.hpp"
#include "rangebits/logger.hpp"

#include <fmt/format.h>
#include <sys/mman.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <system_error>
#include <unistd.h>

namespace rangebits {

chunk::~chunk() noexcept {
  if (deleter_)
    std::invoke(deleter_);
}

chunk_ptr
chunk::make(const void* data, size_t size, deleter_type&& deleter) noexcept {
  const auto view = view_type{static_cast<const std::byte*>(data), size};
  return chunk_ptr{new chunk{view, std::move(deleter)}, false};
}

caf::expected<chunk_ptr>
chunk::mmap(const std::filesystem::path& filename, size_t size) {
  const auto fd = ::open(filename.c_str(), O_RDONLY);
  if (fd == -1)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open file {}: {}",
                                       filename.string(), std::strerror(errno)));
  if (size == 0) {
    struct stat filestat {};
    if (::fstat(fd, &filestat) != 0) {
      const auto fstat_errno = errno;
      ::close(fd);
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to get the size of {}: {}",
                                         filename.string(),
                                         std::strerror(fstat_errno)));
    }
    size = static_cast<size_t>(filestat.st_size);
  }
  // mmap rejects a length of 0.
  if (size == 0) {
    ::close(fd);
    return make(nullptr, 0, deleter_type{});
  }
  auto* map = ::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
  const auto mmap_errno = errno;
  ::close(fd);
  if (map == MAP_FAILED)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to mmap file {}: {}",
                                       filename.string(),
                                       std::strerror(mmap_errno)));
  RANGEBITS_DEBUG("mapped {} bytes of {}", size, filename.string());
  return make(map, size, [map, size]() noexcept {
    ::munmap(map, size);
  });
}

const std::byte* chunk::data() const noexcept {
  return view_.data();
}

size_t chunk::size() const noexcept {
  return view_.size();
}

chunk::view_type chunk::view() const noexcept {
  return view_;
}

chunk::view_type as_bytes(const chunk_ptr& x) noexcept {
  if (!x)
    return {};
  return x->view_;
}

caf::error write(const std::filesystem::path& filename, const chunk_ptr& x) {
  auto tmp = filename;
  tmp += ".tmp";
  const auto bytes = as_bytes(x);
  {
    auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
    if (!out)
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to open {} for writing",
                                         tmp.string()));
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::error_code err{};
      if (!std::filesystem::remove(tmp, err) || err)
        RANGEBITS_WARN("failed to remove file {}: {}", tmp.string(),
                       err.message());
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to write {} bytes to {}",
                                         bytes.size(), tmp.string()));
    }
  }
  std::error_code err{};
  std::filesystem::rename(tmp, filename, err);
  if (err) {
    auto result
      = caf::make_error(ec::filesystem_error,
                        fmt::format("failed to rename {}: {}",
                                    filename.string(), err.message()));
    std::filesystem::remove(tmp, err);
    return result;
  }
  return caf::none;
}

chunk::chunk(view_type view, deleter_type&& deleter) noexcept
  : view_{view}, deleter_{std::move(deleter)} {
  // nop
}

} // namespace rangebits
