#include "catalog/http_catalog_client.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <utility>

namespace ipswdl {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

// curl_global_init is not thread-safe; the client is created before any
// transfer and the process stays single-threaded around it.
class CurlGlobal {
public:
    CurlGlobal() : rc_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (rc_ == CURLE_OK) curl_global_cleanup();
    }
    CURLcode rc() const { return rc_; }

private:
    CURLcode rc_;
};

const CurlGlobal& EnsureCurlGlobal() {
    static const CurlGlobal global;
    return global;
}

size_t AppendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string TrimTrailingSlash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

} // namespace

HttpCatalogClient::HttpCatalogClient(Options opt) : opt_(std::move(opt)) {
    opt_.base_url = TrimTrailingSlash(opt_.base_url);
    if (EnsureCurlGlobal().rc() != CURLE_OK) {
        LogError("curl_global_init failed: %s", curl_easy_strerror(EnsureCurlGlobal().rc()));
    }
}

Result HttpCatalogClient::GetText(const std::string& url, std::string& out) const {
    out.clear();
    CurlEasy easy(curl_easy_init());
    if (!easy) {
        return Result::Fail(-1, "curl_easy_init failed");
    }

    char errbuf[CURL_ERROR_SIZE]{};
    curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");

    curl_easy_setopt(easy.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEFUNCTION, &AppendToString);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(easy.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(easy.get(), CURLOPT_ACCEPT_ENCODING, "");
    ApplyTransferOptions(easy.get(), opt_.transfer);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(easy.get());
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
        const std::string why = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        return Result::Fail(-1, "GET " + url + " failed: " + why);
    }
    LogDebug("GET %s -> %zu bytes", url.c_str(), out.size());
    return Result::Ok();
}

std::string HttpCatalogClient::Escape(const std::string& s) const {
    CurlEasy easy(curl_easy_init());
    if (!easy) return s;
    char* escaped = curl_easy_escape(easy.get(), s.c_str(), static_cast<int>(s.size()));
    if (!escaped) return s;
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

Result HttpCatalogClient::ListDevices(std::vector<Device>& out) {
    std::string body;
    auto r = GetText(opt_.base_url + "/devices", body);
    if (!r.is_ok()) return r;

    auto parsed = parser_.ParseDevices(body);
    if (!parsed) {
        return Result::Fail(-1, "cannot decode device list: " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

Result HttpCatalogClient::ListFirmware(const Device& device, FirmwareListing& out) {
    std::string body;
    auto r = GetText(opt_.base_url + "/device/" + Escape(device.identifier) + "?type=ipsw", body);
    if (!r.is_ok()) return r;

    auto parsed = parser_.ParseFirmwareListing(body);
    if (!parsed) {
        return Result::Fail(-1, "cannot decode firmware listing for " + device.identifier + ": " +
                                    parsed.error());
    }
    out = std::move(*parsed);
    out.name = SanitizeDisplayName(out.name);
    return Result::Ok();
}

Result HttpCatalogClient::OpenDownloadStream(const FirmwareEntry& entry,
                                             std::unique_ptr<IByteStream>& out) {
    const std::string url = opt_.base_url + "/ipsw/download/" + Escape(entry.identifier) + "/" +
                            Escape(entry.buildid);
    return HttpByteStream::Open(url, opt_.transfer, out);
}

} // namespace ipswdl
