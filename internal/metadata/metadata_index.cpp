#include "internal/metadata/metadata_index.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

#include "internal/model/shop_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"

namespace shopstore::metadata {

namespace {

std::vector<std::string> ScanFileNames(const std::filesystem::path& directory) {
  std::vector<std::string> names;

  std::error_code ec;
  if (!std::filesystem::exists(directory, ec)) return names;

  std::filesystem::directory_iterator it(directory, ec);
  if (ec) throw util::StorageError("scan " + directory.string() + ": " + ec.message());

  const std::string suffix = util::kMetadataSuffix;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) throw util::StorageError("scan " + directory.string() + ": " + ec.message());
    if (!it->is_regular_file(ec)) continue;

    auto name = it->path().filename().string();
    if (name.size() > suffix.size() && name.ends_with(suffix)) names.push_back(std::move(name));
  }

  std::sort(names.begin(), names.end());
  return names;
}

} // namespace

MetadataIndex::MetadataIndex(std::filesystem::path directory) : directory_(std::move(directory)) {
}

void MetadataIndex::EnsureDirectory() {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) throw util::StorageError("create " + directory_.string() + ": " + ec.message());
}

void MetadataIndex::Save(const model::ShopMetadata& meta) {
  const auto final_path = util::MetadataPath(directory_, meta.id());
  const auto json       = model::MetadataToJson(meta);

  std::unique_lock lock(mutex_);
  EnsureDirectory();

  /*
    write tmp → flush → rename
  */
  auto tmp_path = final_path.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw util::StorageError("open " + tmp_path + " for write");
    out << json;
    out.flush();
    if (!out) throw util::StorageError("write " + tmp_path);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw util::StorageError("rename " + tmp_path + " -> " + final_path.string());
  }
}

std::optional<model::ShopMetadata> MetadataIndex::Get(const std::string& id) const {
  const auto path = util::MetadataPath(directory_, id);

  std::string json;
  {
    std::shared_lock lock(mutex_);
    std::error_code  ec;
    if (!std::filesystem::exists(path, ec)) {
      if (ec) throw util::StorageError("stat " + path.string() + ": " + ec.message());
      return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) throw util::StorageError("open " + path.string());
    json.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) throw util::StorageError("read " + path.string());
  }

  auto meta = model::MetadataFromJson(json);
  if (meta.id().empty()) meta.set_id(id);
  return meta;
}

void MetadataIndex::Delete(const std::string& id) {
  const auto path = util::MetadataPath(directory_, id);

  std::unique_lock lock(mutex_);
  std::error_code  ec;
  std::filesystem::remove(path, ec);
  if (ec) throw util::StorageError("remove " + path.string() + ": " + ec.message());
}

std::vector<std::string> MetadataIndex::ListIds() const {
  std::vector<std::string> names;
  {
    std::shared_lock lock(mutex_);
    names = ScanFileNames(directory_);
  }

  const auto               suffix_len = std::char_traits<char>::length(util::kMetadataSuffix);
  std::vector<std::string> ids;
  ids.reserve(names.size());
  for (auto& name : names) {
    ids.push_back(name.substr(0, name.size() - suffix_len));
  }
  return ids;
}

std::size_t MetadataIndex::Count() const {
  std::shared_lock lock(mutex_);
  return ScanFileNames(directory_).size();
}

} // namespace shopstore::metadata
