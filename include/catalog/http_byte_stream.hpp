#pragma once

#include "catalog/byte_stream.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

namespace ipswdl {

struct HttpTransferOptions {
    long connect_timeout_sec = 15;
    // A transfer slower than 1 KiB/s for this long is aborted.
    long low_speed_time_sec = 60;
    std::string user_agent;
};

void ApplyTransferOptions(CURL* easy, const HttpTransferOptions& opt);

// Firmware body streamed through the curl multi interface. The transfer is
// paused while a received chunk has not been handed out, so at most one
// receive buffer is held in memory.
class HttpByteStream final : public IByteStream {
public:
    // Starts the request and drives it until the first body bytes arrive or
    // the transfer ends, so HTTP errors surface here rather than mid-stream.
    static Result Open(const std::string& url,
                       const HttpTransferOptions& opt,
                       std::unique_ptr<IByteStream>& out);

    ~HttpByteStream() override;
    HttpByteStream(const HttpByteStream&) = delete;
    HttpByteStream& operator=(const HttpByteStream&) = delete;

    std::uint64_t DeclaredLength() const override { return declared_; }
    Result WaitNext(int wake_fd, StreamEvent& out) override;

private:
    explicit HttpByteStream(std::string url);

    static size_t OnWrite(char* ptr, size_t size, size_t nmemb, void* userdata);

    Result Pump(int wake_fd, bool& woken);
    void Resume();
    std::string TransferError() const;

    std::string url_;
    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    bool attached_ = false;

    std::vector<std::uint8_t> pending_;
    bool paused_ = false;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    std::uint64_t declared_ = 0;
    char errbuf_[CURL_ERROR_SIZE]{};
};

} // namespace ipswdl
