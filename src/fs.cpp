#include "strata/fs.hpp"

#include "strata/error.hpp"

#include <cstdio>
#include <fstream>
#include <random>
#include <system_error>

namespace strata::fs {

namespace {

[[noreturn]] void io_fail(const std::string& what, const std::filesystem::path& p,
                          const std::error_code& ec = {}) {
  std::string msg = what + ": " + p.string();
  if (ec) {
    msg += ": " + ec.message();
  }
  throw Error(ErrorKind::Io, msg);
}

// ".tmp-<name>.<random>" beside `p`, not naming anything that exists. The
// leading dot keeps a leftover temp from ever parsing as a stored artifact;
// the suffix keeps it off real files such as a tracked ".tmp-<name>".
std::filesystem::path unique_temp_path(const std::filesystem::path& p) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  for (int attempt = 0; attempt < 16; ++attempt) {
    char suffix[17];
    std::snprintf(suffix, sizeof suffix, "%016llx", static_cast<unsigned long long>(rng()));
    auto tmp = p.parent_path() / (".tmp-" + p.filename().string() + "." + suffix);
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(tmp, ec))) {
      return tmp;
    }
  }
  io_fail("no free temp name", p);
}

} // namespace

bool exists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_directory(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

void ensure_dir(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) {
    io_fail("mkdir -p failed", p, ec);
  }
}

void ensure_parent_dir(const std::filesystem::path& p) {
  if (p.has_parent_path()) {
    ensure_dir(p.parent_path());
  }
}

Bytes read_file(const std::filesystem::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    io_fail("open for read failed", p);
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  Bytes buf(n);
  if (n) {
    ifs.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
  }
  if (!ifs) {
    io_fail("read failed", p);
  }
  return buf;
}

std::optional<Bytes> try_read_file(const std::filesystem::path& p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    return std::nullopt;
  }
  return Bytes{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  const auto tmp = unique_temp_path(p);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      io_fail("open temp for write failed", tmp);
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs) {
      io_fail("flush temp failed", tmp);
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      io_fail("atomic replace failed", p, ec);
    }
  }
}

void append_file(const std::filesystem::path& p, std::string_view text) {
  std::ofstream ofs(p, std::ios::binary | std::ios::app);
  if (!ofs) {
    io_fail("open for append failed", p);
  }
  ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  ofs.flush();
  if (!ofs) {
    io_fail("append failed", p);
  }
}

void copy_file(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    io_fail("copy failed", from, ec);
  }
  sync_mtime(from, to);
}

void rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    io_fail("rename failed", from, ec);
  }
}

void remove_file(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec) {
    io_fail("remove failed", p, ec);
  }
}

void sync_mtime(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  const auto when = std::filesystem::last_write_time(from, ec);
  if (!ec) {
    std::filesystem::last_write_time(to, when, ec);
  }
}

} // namespace strata::fs
