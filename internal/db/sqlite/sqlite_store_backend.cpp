#include "sqlite_store_backend.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "sqlite_document_store.hpp"

namespace shopstore::db::sqlite {

namespace {

constexpr std::string_view kAddressPrefix = "shopstore/";

bool IsSafeSegment(std::string_view s) {
  if (s.empty() || s == "." || s == "..") return false;
  for (char c : s) {
    if (c == '/' || c == '\\' || c == '\0') return false;
  }
  return true;
}

std::string SanitizeName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    out.push_back(keep ? c : '_');
  }
  if (out.empty() || out == "." || out == "..") out = "store";
  return out;
}

} // namespace

SqliteStoreBackend::SqliteStoreBackend(std::filesystem::path root, SqliteOptions options)
    : root_(std::move(root)), options_(options) {
}

bool SqliteStoreBackend::PathFor(const std::string& address, std::filesystem::path* out) const {
  std::string_view rest(address);
  if (!rest.starts_with(kAddressPrefix)) return false;
  rest.remove_prefix(kAddressPrefix.size());

  const auto slash = rest.find('/');
  if (slash == std::string_view::npos) return false;

  const auto uuid = rest.substr(0, slash);
  const auto name = rest.substr(slash + 1);
  if (!IsSafeSegment(uuid) || !IsSafeSegment(name)) return false;

  *out = root_ / std::string(uuid) / (std::string(name) + ".sqlite");
  return true;
}

Result SqliteStoreBackend::OpenFile(const std::string& address, const std::filesystem::path& file, bool create, bool verify, DocumentStorePtr* out) {
  try {
    auto db = std::make_shared<SqliteDB>(file.string(), options_, create);
    if (verify) SqliteDocumentStore::QuickCheck(*db);
    SqliteDocumentStore::Migrate(*db, address);
    *out = std::make_shared<SqliteDocumentStore>(address, std::move(db));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::Corruption, e.what());
  }
}

Result SqliteStoreBackend::Open(const std::string& address, const OpenOptions& options, DocumentStorePtr* out) {
  std::filesystem::path file;
  if (!PathFor(address, &file)) {
    return Result::Err(ErrorCode::Unavailable, "address not served by sqlite backend: " + address);
  }

  std::error_code ec;
  const bool      exists = std::filesystem::exists(file, ec);
  if (ec) return Result::Err(ErrorCode::IOError, file.string() + ": " + ec.message());

  if (!exists && !options.recreate) {
    return Result::Err(ErrorCode::Unavailable, "no store file for " + address);
  }

  if (exists) {
    auto r = OpenFile(address, file, false, options.recreate, out);
    if (r || !options.recreate) return r;

    // move the unreadable file aside and start over at the same address
    auto quarantine = file;
    quarantine += ".corrupt-" + std::to_string(util::ToUnixMillis(util::Now()));
    std::filesystem::rename(file, quarantine, ec);
    if (ec) return Result::Err(ErrorCode::IOError, "quarantine " + file.string() + ": " + ec.message());
    for (const char* suffix : {"-wal", "-shm"}) {
      auto sidecar = file;
      sidecar += suffix;
      std::filesystem::remove(sidecar, ec);
    }

    SHOPSTORE_LOG_WARN("sqlite store quarantined", {observability::StringField("address", address), observability::StringField("moved_to", quarantine.string()), observability::StringField("error", r.message)});
  }

  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) return Result::Err(ErrorCode::IOError, file.parent_path().string() + ": " + ec.message());

  return OpenFile(address, file, true, false, out);
}

Result SqliteStoreBackend::Create(const std::string& name, DocumentStorePtr* out) {
  const std::string uuid    = util::ToString(util::GenerateUUID());
  const std::string safe    = SanitizeName(name);
  const std::string address = std::string(kAddressPrefix) + uuid + "/" + safe;
  const auto        file    = root_ / uuid / (safe + ".sqlite");

  std::error_code ec;
  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) return Result::Err(ErrorCode::IOError, file.parent_path().string() + ": " + ec.message());

  return OpenFile(address, file, true, false, out);
}

} // namespace shopstore::db::sqlite
