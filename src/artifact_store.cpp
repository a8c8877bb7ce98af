#include "energybench/artifact_store.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(ENERGYBENCH_WITH_ZSTD)
#include <zstd.h>
#endif

#include "energybench/hash.hpp"
#include "energybench/jsonlite.hpp"
#include "energybench/version.hpp"

namespace fs = std::filesystem;

namespace energybench {

namespace {

constexpr char kManifestFile[] = "manifest.json";

#if defined(ENERGYBENCH_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

std::string random_suffix() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return std::to_string(dist(rng));
}

bool write_file(const fs::path& target, const std::string& data) {
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(ofs);
}

std::optional<std::string> read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string manifest_json(const ArtifactManifest& m) {
  jsonlite::Object o;
  o["content_hash"] = m.content_hash;
  o["spec_name"] = m.spec_name;
  o["language"] = m.language;
  o["executable"] = m.executable;
  o["log_encoding"] = m.log_encoding;
  o["log_size"] = static_cast<std::uint64_t>(m.log_size);
  o["log_blob_hash"] = m.log_blob_hash;
  o["created_at"] = m.created_at_unix_ts;
  o["format_version"] = static_cast<std::uint64_t>(m.format_version);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// Path of p relative to base, or "" when p is not inside base.
std::string relative_inside(const std::string& p, const std::string& base) {
  if (p.empty()) return {};
  const fs::path rel = fs::path(p).lexically_relative(base);
  if (rel.empty() || *rel.begin() == "..") return {};
  return rel.string();
}

}  // namespace

ArtifactStore::ArtifactStore(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "artifacts", ec);
  fs::create_directories(fs::path(root_) / "staging", ec);
}

std::string ArtifactStore::artifact_dir(const std::string& content_hash) const {
  return (fs::path(root_) / "artifacts" / content_hash).string();
}

std::string ArtifactStore::make_staging_dir() {
  std::error_code ec;
  const fs::path base = fs::absolute(fs::path(root_) / "staging", ec);
  for (int attempt = 0; attempt < 16; ++attempt) {
    const fs::path dir = base / (".tmp_" + random_suffix());
    if (fs::create_directories(dir, ec)) return dir.string();
  }
  return {};
}

void ArtifactStore::discard_staging(const std::string& staging_dir) {
  if (staging_dir.empty()) return;
  std::error_code ec;
  fs::remove_all(staging_dir, ec);
}

bool ArtifactStore::commit(BuildArtifact& artifact, const std::string& staging_dir,
                           Error* error) {
  auto fail = [&](const std::string& detail) {
    if (error) {
      error->code = ErrorCode::io_error;
      error->spec_name = artifact.spec_name;
      error->language = artifact.language;
      error->detail = detail;
    }
    return false;
  };

  if (!valid_digest(artifact.content_hash)) return fail("invalid content hash");
  if (artifact.status != BuildStatus::built) return fail("only built artifacts are committed");

  ArtifactManifest m;
  m.content_hash = artifact.content_hash;
  m.spec_name = artifact.spec_name;
  m.language = artifact.language;
  m.executable = relative_inside(artifact.executable, staging_dir);
  m.log_size = artifact.build_log.size();
  m.created_at_unix_ts = static_cast<std::uint64_t>(std::time(nullptr));
  m.format_version = version::ARTIFACT_FORMAT_VERSION;

  std::string stored = artifact.build_log;
#if defined(ENERGYBENCH_WITH_ZSTD)
  if (compression_ == "zstd" && !stored.empty()) {
    auto c = compress_zstd(stored);
    if (!c.empty()) {
      stored = std::move(c);
      m.log_encoding = "zstd";
    }
  }
#endif
  m.log_blob_hash = hash_domain("log:", stored);

  const fs::path staging(staging_dir);
  const char* log_name = m.log_encoding == "zstd" ? "build.log.zst" : "build.log";
  if (!write_file(staging / log_name, stored)) return fail("cannot write build log");
  if (!write_file(staging / kManifestFile, manifest_json(m))) {
    return fail("cannot write artifact manifest");
  }

  const fs::path target = artifact_dir(artifact.content_hash);
  std::error_code ec;
  fs::rename(staging, target, ec);
  if (ec) {
    // Lost the race (target exists and is non-empty) or a real I/O failure.
    discard_staging(staging_dir);
    auto existing = lookup(artifact.content_hash);
    if (!existing) return fail("cannot commit artifact: " + ec.message());
    const std::uint32_t invocations = artifact.compile_invocations;
    const std::uint64_t duration = artifact.build_duration_ns;
    artifact = std::move(*existing);
    artifact.compile_invocations = invocations;
    artifact.build_duration_ns = duration;
    return true;
  }

  const fs::path committed = fs::absolute(target, ec);
  artifact.workdir = committed.string();
  artifact.executable = m.executable.empty() ? std::string() : (committed / m.executable).string();
  return true;
}

std::optional<ArtifactManifest> ArtifactStore::manifest(const std::string& content_hash) const {
  if (!valid_digest(content_hash)) return std::nullopt;
  const auto text = read_file(fs::path(artifact_dir(content_hash)) / kManifestFile);
  if (!text) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;

  ArtifactManifest m;
  m.content_hash = jsonlite::get_string(o, "content_hash");
  m.spec_name = jsonlite::get_string(o, "spec_name");
  m.language = jsonlite::get_string(o, "language");
  m.executable = jsonlite::get_string(o, "executable");
  m.log_encoding = jsonlite::get_string(o, "log_encoding", "identity");
  m.log_size = static_cast<std::size_t>(jsonlite::get_u64(o, "log_size"));
  m.log_blob_hash = jsonlite::get_string(o, "log_blob_hash");
  m.created_at_unix_ts = jsonlite::get_u64(o, "created_at");
  m.format_version = static_cast<std::uint32_t>(jsonlite::get_u64(o, "format_version"));
  if (m.content_hash != content_hash) return std::nullopt;
  return m;
}

std::optional<BuildArtifact> ArtifactStore::lookup(const std::string& content_hash) const {
  const auto m = manifest(content_hash);
  if (!m) return std::nullopt;
  if (!version::check_artifact_format(m->format_version).ok) return std::nullopt;

  std::error_code ec;
  const fs::path dir = fs::absolute(artifact_dir(content_hash), ec);
  BuildArtifact a;
  a.spec_name = m->spec_name;
  a.language = m->language;
  a.content_hash = m->content_hash;
  a.workdir = dir.string();
  a.executable = m->executable.empty() ? std::string() : (dir / m->executable).string();
  if (!a.executable.empty() && !fs::exists(a.executable, ec)) return std::nullopt;
  a.build_log = get_log(content_hash).value_or("");
  a.status = BuildStatus::built;
  return a;
}

std::optional<std::string> ArtifactStore::get_log(const std::string& content_hash) const {
  const auto m = manifest(content_hash);
  if (!m) return std::nullopt;
  const fs::path dir(artifact_dir(content_hash));
  const bool zstd = m->log_encoding == "zstd";
  auto data = read_file(dir / (zstd ? "build.log.zst" : "build.log"));
  if (!data) return std::nullopt;
  if (hash_domain("log:", *data) != m->log_blob_hash) return std::nullopt;
  if (zstd) {
#if defined(ENERGYBENCH_WITH_ZSTD)
    data = decompress_zstd(*data, m->log_size);
    if (data->size() != m->log_size) return std::nullopt;
#else
    return std::nullopt;
#endif
  }
  return data;
}

bool ArtifactStore::contains(const std::string& content_hash) const {
  return manifest(content_hash).has_value();
}

bool ArtifactStore::remove(const std::string& content_hash) {
  if (!valid_digest(content_hash)) return false;
  std::error_code ec;
  const auto removed = fs::remove_all(artifact_dir(content_hash), ec);
  return !ec && removed > 0;
}

std::vector<std::string> ArtifactStore::list() const {
  std::vector<std::string> out;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(fs::path(root_) / "artifacts", ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_directory(ec) && valid_digest(name)) out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace energybench
