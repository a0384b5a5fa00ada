#pragma once
#include <asio.hpp>
#include <asio/thread_pool.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "adapter_descriptor.hpp"

class Logger;

// Maps artifact names to files under the artifact store and keeps the
// table of descriptors currently advertised by this process.
//
// Store layout:
//   <root>/weights/<name>/adapter_model.safetensors (or .bin, .pt)
//   <root>/registry/<name>.json
class ContentRegistry : public std::enable_shared_from_this<ContentRegistry> {
public:
  using PathHandler = std::function<void(std::optional<std::filesystem::path> path)>;
  using LoadHandler = std::function<void(bool loaded)>;

  ContentRegistry(asio::io_context& io,
                  asio::thread_pool& pool,
                  std::filesystem::path storage_root,
                  std::shared_ptr<Logger> logger = nullptr);

  // Kicks off the background scan of the store. Call once after construction.
  void start();
  // Runs handler after the scan finishes; a failed scan is retried.
  void ensure_loaded(LoadHandler handler);
  bool loaded() const { return loaded_; }

  // Never fails for a missing artifact; the handler receives nullopt.
  void find_path(const std::string& name, PathHandler handler);
  std::optional<AdapterMetadata> get_metadata(const std::string& name) const;

  void register_adapter(const AdapterDescriptor& descriptor);
  bool unregister_adapter(const std::string& topic);
  std::optional<AdapterDescriptor> get_adapter(const std::string& topic) const;
  std::vector<AdapterDescriptor> all_adapters() const;

  void refresh_cache(LoadHandler handler = nullptr);
  void clear();
  // Records a freshly written artifact without waiting for a rescan.
  void remember(const std::string& name, const std::filesystem::path& path);

  std::size_t cached_paths() const { return paths_.size(); }
  const std::filesystem::path& storage_root() const { return storage_root_; }
  std::filesystem::path weights_dir() const { return storage_root_ / "weights"; }
  std::filesystem::path registry_dir() const { return storage_root_ / "registry"; }

  // Spelling variants tried for a name, most specific first.
  static std::vector<std::string> name_variants(const std::string& name);
  // Lowercase, '-' as '_', without a trailing "_adapter".
  static std::string canonical_key(const std::string& name);
  // Payload file inside an artifact directory, if any. Blocking.
  static std::optional<std::filesystem::path> payload_in(const std::filesystem::path& dir);
  // Name safe to use as a single path component, or nullopt.
  static std::optional<std::string> sanitize_name(const std::string& name);

private:
  struct ScanResult {
    bool ok = false;
    std::string error;
    std::map<std::string, std::filesystem::path> paths;
    std::map<std::string, std::filesystem::path> canonical;
  };

  void begin_scan();
  static ScanResult scan_store(const std::filesystem::path& root);
  void finish_scan(ScanResult result);

  asio::io_context& io_;
  asio::thread_pool& pool_;
  std::filesystem::path storage_root_;
  std::shared_ptr<Logger> logger_;

  std::map<std::string, std::filesystem::path> paths_;
  std::map<std::string, std::filesystem::path> canonical_paths_;
  std::map<std::string, AdapterDescriptor> adapters_;  // by topic
  std::vector<LoadHandler> waiting_;
  bool loaded_ = false;
  bool scanning_ = false;
  bool rescan_pending_ = false;
  uint64_t generation_ = 0;
};
