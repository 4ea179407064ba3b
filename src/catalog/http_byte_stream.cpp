#include "catalog/http_byte_stream.hpp"

#include "io/wait.hpp"
#include "util/logger.hpp"

#include <utility>

namespace ipswdl {

namespace {

constexpr int kPollTimeoutMs = 1000;
constexpr long kReceiveBufferBytes = 256 * 1024;

} // namespace

void ApplyTransferOptions(CURL* easy, const HttpTransferOptions& opt) {
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, opt.connect_timeout_sec);
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_TIME, opt.low_speed_time_sec);
    curl_easy_setopt(easy, CURLOPT_TCP_KEEPALIVE, 1L);
    if (!opt.user_agent.empty()) {
        curl_easy_setopt(easy, CURLOPT_USERAGENT, opt.user_agent.c_str());
    }
}

HttpByteStream::HttpByteStream(std::string url) : url_(std::move(url)) {}

HttpByteStream::~HttpByteStream() {
    if (multi_ && easy_ && attached_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) curl_easy_cleanup(easy_);
    if (multi_) curl_multi_cleanup(multi_);
}

Result HttpByteStream::Open(const std::string& url,
                            const HttpTransferOptions& opt,
                            std::unique_ptr<IByteStream>& out) {
    std::unique_ptr<HttpByteStream> s(new HttpByteStream(url));

    s->multi_ = curl_multi_init();
    s->easy_ = curl_easy_init();
    if (!s->multi_ || !s->easy_) {
        return Result::Fail(-1, "curl initialization failed");
    }

    CURL* easy = s->easy_;
    curl_easy_setopt(easy, CURLOPT_URL, s->url_.c_str());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &HttpByteStream::OnWrite);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, s.get());
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, s->errbuf_);
    curl_easy_setopt(easy, CURLOPT_BUFFERSIZE, kReceiveBufferBytes);
    ApplyTransferOptions(easy, opt);

    const CURLMcode mc = curl_multi_add_handle(s->multi_, easy);
    if (mc != CURLM_OK) {
        return Result::Fail(-1, std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc));
    }
    s->attached_ = true;

    LogDebug("GET %s (stream)", s->url_.c_str());
    while (s->pending_.empty() && !s->done_) {
        bool woken = false;
        auto r = s->Pump(-1, woken);
        if (!r.is_ok()) return r;
    }
    if (s->done_ && s->result_ != CURLE_OK) {
        return Result::Fail(-1, "GET " + s->url_ + " failed: " + s->TransferError());
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length > 0) {
        s->declared_ = static_cast<std::uint64_t>(length);
    }
    LogDebug("stream open: declared length %llu", (unsigned long long)s->declared_);

    out = std::move(s);
    return Result::Ok();
}

size_t HttpByteStream::OnWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<HttpByteStream*>(userdata);
    if (!self->pending_.empty()) {
        // curl delivers the same bytes again once the transfer is resumed.
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    const size_t n = size * nmemb;
    self->pending_.assign(reinterpret_cast<const std::uint8_t*>(ptr),
                          reinterpret_cast<const std::uint8_t*>(ptr) + n);
    return n;
}

Result HttpByteStream::Pump(int wake_fd, bool& woken) {
    woken = false;

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        return Result::Fail(-1, std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
            done_ = true;
            result_ = msg->data.result;
        }
    }
    if (!pending_.empty() || done_) return Result::Ok();

    curl_waitfd extra{};
    unsigned int extra_count = 0;
    if (wake_fd >= 0) {
        extra.fd = wake_fd;
        extra.events = CURL_WAIT_POLLIN;
        extra_count = 1;
    }

    mc = curl_multi_poll(multi_, extra_count ? &extra : nullptr, extra_count, kPollTimeoutMs, nullptr);
    if (mc != CURLM_OK) {
        return Result::Fail(-1, std::string("curl_multi_poll: ") + curl_multi_strerror(mc));
    }
    if (extra_count && (extra.revents & CURL_WAIT_POLLIN)) {
        woken = true;
    }
    return Result::Ok();
}

void HttpByteStream::Resume() {
    if (!paused_) return;
    paused_ = false;
    curl_easy_pause(easy_, CURLPAUSE_CONT);
}

Result HttpByteStream::WaitNext(int wake_fd, StreamEvent& out) {
    out.data.clear();
    if (PollReadable(wake_fd, 0)) {
        out.kind = StreamEvent::Kind::Woken;
        return Result::Ok();
    }

    while (true) {
        if (!pending_.empty()) {
            out.kind = StreamEvent::Kind::Chunk;
            out.data.swap(pending_);
            pending_.clear();
            Resume();
            return Result::Ok();
        }
        if (done_) {
            if (result_ != CURLE_OK) {
                return Result::Fail(-1, "download of " + url_ + " failed: " + TransferError());
            }
            out.kind = StreamEvent::Kind::End;
            return Result::Ok();
        }

        bool woken = false;
        auto r = Pump(wake_fd, woken);
        if (!r.is_ok()) return r;
        if (woken) {
            out.kind = StreamEvent::Kind::Woken;
            return Result::Ok();
        }
    }
}

std::string HttpByteStream::TransferError() const {
    if (errbuf_[0] != '\0') return errbuf_;
    return curl_easy_strerror(result_);
}

} // namespace ipswdl
