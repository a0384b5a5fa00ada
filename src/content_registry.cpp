#include "content_registry.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kAdapterSuffix = "_adapter";

const std::array<const char*, 4> kPayloadFiles = {
  "adapter_model.safetensors",
  "adapter_model.bin",
  "pytorch_adapter.bin",
  "adapter_model.pt"
};

std::string hyphenate(std::string value) {
  std::replace(value.begin(), value.end(), '_', '-');
  return value;
}

std::string underscore(std::string value) {
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string strip_suffix(const std::string& value) {
  const std::string suffix(kAdapterSuffix);
  if(value.size() > suffix.size() &&
     value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return value.substr(0, value.size() - suffix.size());
  }
  return value;
}

bool is_regular_file(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::optional<json> read_json_file(const fs::path& path) {
  std::ifstream in(path);
  if(!in) return std::nullopt;
  try {
    json j;
    in >> j;
    return j;
  } catch(const json::exception&) {
    return std::nullopt;
  }
}

// adapter_path recorded in a registry record, when it still exists.
std::optional<fs::path> recorded_payload(const fs::path& record) {
  if(!is_regular_file(record)) return std::nullopt;
  auto j = read_json_file(record);
  if(!j || !j->is_object()) return std::nullopt;
  auto path = j->value("adapter_path", std::string());
  if(path.empty() || !is_regular_file(path)) return std::nullopt;
  return fs::path(path);
}

struct Candidate {
  std::string key;
  bool canonical = false;
  fs::path path;
};

struct Resolution {
  std::optional<fs::path> found;
  bool from_cache = false;
  std::vector<Candidate> stale;
};

} // namespace

ContentRegistry::ContentRegistry(asio::io_context& io,
                                 asio::thread_pool& pool,
                                 fs::path storage_root,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    pool_(pool),
    storage_root_(std::move(storage_root)),
    logger_(std::move(logger)) {
}

void ContentRegistry::start() {
  if(!loaded_ && !scanning_) begin_scan();
}

std::vector<std::string> ContentRegistry::name_variants(const std::string& name) {
  const auto clean = strip_suffix(name);
  std::vector<std::string> base = {
    name,
    hyphenate(name),
    hyphenate(clean) + kAdapterSuffix,
    clean,
    hyphenate(clean),
    clean + kAdapterSuffix,
    underscore(clean) + kAdapterSuffix,
    underscore(clean)
  };
  std::vector<std::string> out;
  auto add = [&out](const std::string& v) {
    if(!v.empty() && std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
  };
  for(const auto& v : base) add(v);
  for(const auto& v : base) add(lower(v));
  return out;
}

std::string ContentRegistry::canonical_key(const std::string& name) {
  auto key = lower(name);
  std::replace(key.begin(), key.end(), '-', '_');
  return strip_suffix(key);
}

std::optional<fs::path> ContentRegistry::payload_in(const fs::path& dir) {
  std::error_code ec;
  if(!fs::is_directory(dir, ec)) return std::nullopt;
  for(const auto* file : kPayloadFiles) {
    auto candidate = dir / file;
    if(is_regular_file(candidate)) return candidate;
  }
  return std::nullopt;
}

std::optional<std::string> ContentRegistry::sanitize_name(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for(unsigned char ch : name) {
    if(ch == '/' || ch == '\\' || ch == ':' || std::iscntrl(ch)) {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(ch));
    }
  }
  out = trim_copy(out);
  if(out.empty() || out == "." || out == ".." || out.find("..") != std::string::npos) {
    return std::nullopt;
  }
  return out;
}

ContentRegistry::ScanResult ContentRegistry::scan_store(const fs::path& root) {
  ScanResult result;
  std::error_code ec;

  const auto weights = root / "weights";
  if(fs::is_directory(weights, ec)) {
    for(fs::directory_iterator it(weights, ec), end; !ec && it != end; it.increment(ec)) {
      if(!it->is_directory(ec)) continue;
      auto payload = payload_in(it->path());
      if(!payload) continue;
      auto name = it->path().filename().string();
      result.paths[name] = *payload;
      result.canonical[canonical_key(name)] = *payload;
    }
    if(ec) {
      result.error = "cannot list " + weights.string() + ": " + ec.message();
      return result;
    }
  }

  ec.clear();
  const auto registry = root / "registry";
  if(fs::is_directory(registry, ec)) {
    for(fs::directory_iterator it(registry, ec), end; !ec && it != end; it.increment(ec)) {
      if(it->path().extension() != ".json") continue;
      auto name = it->path().stem().string();
      if(result.paths.count(name)) continue;
      if(auto payload = recorded_payload(it->path())) {
        result.paths[name] = *payload;
        result.canonical.emplace(canonical_key(name), *payload);
      }
    }
    if(ec) {
      result.error = "cannot list " + registry.string() + ": " + ec.message();
      return result;
    }
  }

  result.ok = true;
  return result;
}

void ContentRegistry::begin_scan() {
  scanning_ = true;
  const auto generation = generation_;
  std::weak_ptr<ContentRegistry> weak = weak_from_this();
  auto root = storage_root_;
  auto* io = &io_;
  asio::post(pool_, [weak, root, io, generation]() {
    ScanResult result;
    try {
      result = scan_store(root);
    } catch(const std::exception& ex) {
      result.ok = false;
      result.error = ex.what();
    }
    asio::post(*io, [weak, generation, result = std::move(result)]() mutable {
      auto self = weak.lock();
      if(!self) return;
      if(generation != self->generation_) {
        self->scanning_ = false;
        if(!self->waiting_.empty()) self->begin_scan();
        return;
      }
      self->finish_scan(std::move(result));
    });
  });
}

void ContentRegistry::finish_scan(ScanResult result) {
  scanning_ = false;
  if(result.ok) {
    for(auto& kv : result.paths) paths_.insert_or_assign(kv.first, kv.second);
    for(auto& kv : result.canonical) canonical_paths_.insert_or_assign(kv.first, kv.second);
    loaded_ = true;
    log_info(logger_.get(), "Artifact store {} scanned: {} artifact(s)", storage_root_.string(), result.paths.size());
  } else {
    loaded_ = false;
    log_error(logger_.get(), "Artifact store scan failed: {}", result.error);
  }

  if(rescan_pending_) {
    rescan_pending_ = false;
    begin_scan();
    return;
  }

  auto waiting = std::move(waiting_);
  waiting_.clear();
  for(auto& handler : waiting) {
    if(handler) handler(loaded_);
  }
}

void ContentRegistry::ensure_loaded(LoadHandler handler) {
  if(loaded_ && !scanning_) {
    if(handler) asio::post(io_, [handler = std::move(handler)]() { handler(true); });
    return;
  }
  waiting_.push_back(std::move(handler));
  if(!scanning_) begin_scan();
}

void ContentRegistry::refresh_cache(LoadHandler handler) {
  loaded_ = false;
  waiting_.push_back(std::move(handler));
  if(scanning_) {
    rescan_pending_ = true;
  } else {
    begin_scan();
  }
}

void ContentRegistry::find_path(const std::string& name, PathHandler handler) {
  std::weak_ptr<ContentRegistry> weak = weak_from_this();
  ensure_loaded([weak, name, handler = std::move(handler)](bool) mutable {
    auto self = weak.lock();
    if(!self) return;

    const auto variants = name_variants(name);
    std::vector<Candidate> cached;
    for(const auto& v : variants) {
      auto it = self->paths_.find(v);
      if(it != self->paths_.end()) cached.push_back(Candidate{v, false, it->second});
    }
    const auto key = canonical_key(name);
    auto cit = self->canonical_paths_.find(key);
    if(cit != self->canonical_paths_.end()) cached.push_back(Candidate{key, true, cit->second});

    auto weights = self->weights_dir();
    auto registry = self->registry_dir();
    auto* io = &self->io_;
    asio::post(self->pool_, [weak, io, name, variants, cached, weights, registry,
                             handler = std::move(handler)]() mutable {
      Resolution res;
      for(const auto& c : cached) {
        if(is_regular_file(c.path)) {
          res.found = c.path;
          res.from_cache = true;
          break;
        }
        res.stale.push_back(c);
      }
      if(!res.found) {
        for(const auto& v : variants) {
          if(auto payload = payload_in(weights / v)) {
            res.found = payload;
            break;
          }
        }
      }
      if(!res.found) {
        for(const auto& v : variants) {
          if(auto payload = recorded_payload(registry / (v + ".json"))) {
            res.found = payload;
            break;
          }
        }
      }

      asio::post(*io, [weak, name, res = std::move(res), handler = std::move(handler)]() {
        auto self = weak.lock();
        if(!self) return;
        for(const auto& c : res.stale) {
          auto& table = c.canonical ? self->canonical_paths_ : self->paths_;
          auto it = table.find(c.key);
          if(it != table.end() && it->second == c.path) {
            log_debug(self->logger_.get(), "Evicting stale cache entry {} -> {}", c.key, c.path.string());
            table.erase(it);
          }
        }
        if(res.found) {
          if(!res.from_cache) self->remember(name, *res.found);
          log_debug(self->logger_.get(), "Resolved {} -> {}", name, res.found->string());
        } else {
          log_info(self->logger_.get(), "Artifact {} not found in {}", name, self->storage_root_.string());
        }
        if(handler) handler(res.found);
      });
    });
  });
}

std::optional<AdapterMetadata> ContentRegistry::get_metadata(const std::string& name) const {
  for(const auto& v : name_variants(name)) {
    auto record = registry_dir() / (v + ".json");
    if(!is_regular_file(record)) continue;
    auto j = read_json_file(record);
    if(!j || !j->is_object()) {
      log_warn(logger_.get(), "Unreadable metadata record {}", record.string());
      continue;
    }
    return j->get<AdapterMetadata>();
  }
  return std::nullopt;
}

void ContentRegistry::register_adapter(const AdapterDescriptor& descriptor) {
  adapters_[descriptor.topic] = descriptor;
}

bool ContentRegistry::unregister_adapter(const std::string& topic) {
  return adapters_.erase(topic) > 0;
}

std::optional<AdapterDescriptor> ContentRegistry::get_adapter(const std::string& topic) const {
  auto it = adapters_.find(topic);
  if(it == adapters_.end()) return std::nullopt;
  return it->second;
}

std::vector<AdapterDescriptor> ContentRegistry::all_adapters() const {
  std::vector<AdapterDescriptor> out;
  out.reserve(adapters_.size());
  for(const auto& kv : adapters_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), [](const AdapterDescriptor& a, const AdapterDescriptor& b){
    return a.timestamp < b.timestamp;
  });
  return out;
}

void ContentRegistry::clear() {
  ++generation_;
  paths_.clear();
  canonical_paths_.clear();
  adapters_.clear();
  loaded_ = false;
  rescan_pending_ = false;
}

void ContentRegistry::remember(const std::string& name, const fs::path& path) {
  paths_[name] = path;
  canonical_paths_[canonical_key(name)] = path;
}
