#include "models/model_catalog.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <regex>
#include <unordered_set>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mhub {

namespace {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

// nullopt for anything that is not scheme://host[:port][path] with a port in 1-65535.
std::optional<HttpUrl> parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    if (!std::regex_match(url, match, re)) {
        return std::nullopt;
    }
    HttpUrl parsed;
    parsed.scheme = match[1].str();
    parsed.host = match[2].str();
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    if (!match[3].matched) {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
        return parsed;
    }
    const std::string digits = match[3].str();
    int port = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (ec != std::errc() || end != digits.data() + digits.size() || port < 1 || port > 65535) {
        return std::nullopt;
    }
    parsed.port = port;
    return parsed;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (client && client->is_valid()) {
        const int sec = static_cast<int>(timeout.count() / 1000);
        const int usec = static_cast<int>((timeout.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        client->set_follow_location(true);
        return client;
    }
    return nullptr;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> stringList(const nlohmann::json& entry, const char* key) {
    std::vector<std::string> out;
    if (!entry.contains(key) || !entry[key].is_array()) return out;
    for (const auto& item : entry[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string stringField(const nlohmann::json& entry, const char* key) {
    if (entry.contains(key) && entry[key].is_string()) return entry[key].get<std::string>();
    return {};
}

// id may be a string or an integer in the catalog payload.
std::string idField(const nlohmann::json& entry) {
    if (!entry.contains("id")) return {};
    const auto& id = entry["id"];
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return std::to_string(id.get<long long>());
    return {};
}

bool computeInputsCompatible(const ModelDescriptor& m) {
    if (m.inputs.size() != 1) return false;
    for (const auto& in : m.inputs) {
        if (toLower(in.format) != "dicom") return false;
    }
    return std::find(m.categories.begin(), m.categories.end(), "Segmentation") != m.categories.end() ||
           std::find(m.categories.begin(), m.categories.end(), "Prediction") != m.categories.end();
}

bool containsCi(const std::string& haystack, const std::string& needle_lower) {
    return toLower(haystack).find(needle_lower) != std::string::npos;
}

}  // namespace

CatalogFetcher makeHttpCatalogFetcher(const std::string& url, std::chrono::milliseconds timeout) {
    return [url, timeout]() -> Result<std::string> {
        using R = Result<std::string>;
        auto parsed = parseUrl(url);
        if (!parsed) {
            return R::failure(ErrorKind::kCatalogUnreachable, "invalid catalog URL: " + url);
        }
        auto client = makeClient(*parsed, timeout);
        if (!client) {
            return R::failure(ErrorKind::kCatalogUnreachable, "cannot create HTTP client for " + url);
        }
        auto res = client->Get(parsed->path.c_str());
        if (!res) {
            return R::failure(ErrorKind::kCatalogUnreachable,
                              "catalog request failed: " + httplib::to_string(res.error()));
        }
        if (res->status < 200 || res->status >= 300) {
            return R::failure(ErrorKind::kCatalogUnreachable,
                              "catalog returned HTTP " + std::to_string(res->status));
        }
        return R::success(res->body);
    };
}

Result<CatalogSnapshot> parseCatalog(const std::string& body, const CatalogConfig& config) {
    using R = Result<CatalogSnapshot>;
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return R::failure(ErrorKind::kCatalogUnreachable, std::string("catalog is not valid JSON: ") + e.what());
    }

    const nlohmann::json* entries = nullptr;
    if (root.is_array()) {
        entries = &root;
    } else if (root.is_object() && root.contains("data") && root["data"].is_array()) {
        entries = &root["data"];
    }
    if (!entries) {
        return R::failure(ErrorKind::kCatalogUnreachable, "catalog payload has no model list");
    }

    CatalogSnapshot snap;
    snap.fetched_at = std::chrono::system_clock::now();
    std::unordered_set<std::string> seen;

    size_t index = 0;
    for (const auto& entry : *entries) {
        const size_t pos = index++;
        if (!entry.is_object()) {
            snap.warnings.push_back("entry " + std::to_string(pos) + ": not an object");
            continue;
        }
        ModelDescriptor m;
        m.id = idField(entry);
        m.name = stringField(entry, "name");
        if (m.id.empty() || m.name.empty()) {
            snap.warnings.push_back("entry " + std::to_string(pos) + ": missing id or name");
            continue;
        }
        if (!seen.insert(m.id).second) {
            snap.warnings.push_back("entry " + std::to_string(pos) + ": duplicate id " + m.id);
            continue;
        }

        m.label = stringField(entry, "label");
        if (m.label.empty()) m.label = m.name;
        m.description = stringField(entry, "description");
        m.modalities = stringList(entry, "modalities");
        m.categories = stringList(entry, "categories");
        m.regions = stringList(entry, "segmentations");
        m.cite = stringField(entry, "cite");
        if (entry.contains("inputs") && entry["inputs"].is_array()) {
            for (const auto& in : entry["inputs"]) {
                if (!in.is_object()) continue;
                m.inputs.push_back(ModelInput{stringField(in, "format"), stringField(in, "description")});
            }
        }
        m.inputs_compatible = computeInputsCompatible(m);

        m.image_ref = stringField(entry, "image");
        if (m.image_ref.empty()) {
            m.image_ref = config.image_namespace + "/" + m.name + ":" + config.image_tag;
        }
        m.image_digest = stringField(entry, "digest");
        m.documentation_url = stringField(entry, "documentation_url");
        if (m.documentation_url.empty()) {
            m.documentation_url = config.docs_base_url + m.name;
        }
        snap.models.push_back(std::move(m));
    }

    for (const auto& w : snap.warnings) {
        spdlog::warn("Catalog: dropped {}", w);
    }
    return R::success(std::move(snap));
}

bool matchesQuery(const ModelDescriptor& model, const std::string& query) {
    if (query.empty()) return true;
    const auto q = toLower(query);
    if (containsCi(model.name, q) || containsCi(model.label, q) || containsCi(model.description, q)) {
        return true;
    }
    auto any = [&](const std::vector<std::string>& values) {
        return std::any_of(values.begin(), values.end(), [&](const std::string& v) { return containsCi(v, q); });
    };
    return any(model.modalities) || any(model.categories) || any(model.regions);
}

ModelCatalog::ModelCatalog(CatalogConfig config, CatalogFetcher fetcher)
    : config_(std::move(config)), fetcher_(std::move(fetcher)) {
    if (!fetcher_) {
        fetcher_ = makeHttpCatalogFetcher(config_.url, config_.timeout);
    }
}

Result<std::shared_ptr<const CatalogSnapshot>> ModelCatalog::refresh() {
    using R = Result<std::shared_ptr<const CatalogSnapshot>>;
    std::lock_guard<std::mutex> guard(refresh_mutex_);

    auto body = fetcher_();
    if (!body.ok()) {
        spdlog::warn("Catalog refresh failed: {}", body.error_message);
        return R::failure(body.error == ErrorKind::kOk ? ErrorKind::kCatalogUnreachable : body.error,
                          body.error_message);
    }
    auto parsed = parseCatalog(*body.data, config_);
    if (!parsed.ok()) {
        spdlog::warn("Catalog refresh failed: {}", parsed.error_message);
        return R::from(parsed);
    }

    auto snap = std::make_shared<const CatalogSnapshot>(std::move(*parsed.data));
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = snap;
    }
    spdlog::info("Catalog refreshed: {} models ({} dropped)", snap->models.size(), snap->warnings.size());
    return R::success(snap);
}

std::shared_ptr<const CatalogSnapshot> ModelCatalog::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

Result<std::shared_ptr<const CatalogSnapshot>> ModelCatalog::ensureLoaded() {
    if (auto snap = snapshot()) {
        return Result<std::shared_ptr<const CatalogSnapshot>>::success(snap);
    }
    return refresh();
}

Result<ModelDescriptor> ModelCatalog::get(const std::string& id) {
    auto loaded = ensureLoaded();
    if (!loaded.ok()) return Result<ModelDescriptor>::from(loaded);
    const auto& models = (*loaded.data)->models;
    for (const auto& m : models) {
        if (m.id == id) return Result<ModelDescriptor>::success(m);
    }
    for (const auto& m : models) {
        if (m.name == id) return Result<ModelDescriptor>::success(m);
    }
    return Result<ModelDescriptor>::failure(ErrorKind::kNotFound, "unknown model: " + id);
}

Result<std::vector<ModelDescriptor>> ModelCatalog::search(const std::string& query) {
    auto loaded = ensureLoaded();
    if (!loaded.ok()) return Result<std::vector<ModelDescriptor>>::from(loaded);
    std::vector<ModelDescriptor> out;
    for (const auto& m : (*loaded.data)->models) {
        if (matchesQuery(m, query)) out.push_back(m);
    }
    return Result<std::vector<ModelDescriptor>>::success(std::move(out));
}

}  // namespace mhub
