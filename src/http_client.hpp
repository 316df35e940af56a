#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cpr { class Session; }

struct HttpResponse {
    long status = 0;
    std::string body;   // empty for streamed downloads
    std::string error;  // transport error text, empty on success

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
    std::string describe() const;
};

// Receives body bytes as they arrive. Returning false aborts the transfer.
using ChunkSink = std::function<bool(const char* data, size_t size)>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Fetches a listing page into memory.
    virtual HttpResponse get_text(const std::string& url) = 0;

    // Streams a file body into `sink`. Bodies of non-2xx responses are
    // never passed to the sink; the status is reported instead.
    virtual HttpResponse download(const std::string& url, const ChunkSink& sink) = 0;
};

// cpr-backed client. Settings are fixed at construction; downloads borrow
// one of `pool_size` sessions so curl connections are reused per worker.
class CprHttpClient : public HttpClient {
public:
    CprHttpClient(std::string userAgent, std::chrono::seconds timeout, size_t poolSize);
    ~CprHttpClient() override;

    CprHttpClient(const CprHttpClient&) = delete;
    CprHttpClient& operator=(const CprHttpClient&) = delete;

    HttpResponse get_text(const std::string& url) override;
    HttpResponse download(const std::string& url, const ChunkSink& sink) override;

private:
    class SessionLease;

    std::unique_ptr<cpr::Session> make_session() const;
    std::unique_ptr<cpr::Session> acquire();
    void release(std::unique_ptr<cpr::Session> session);

    std::string userAgent_;
    std::chrono::seconds timeout_;

    std::vector<std::unique_ptr<cpr::Session>> idle_;
    std::mutex pool_mtx_;
    std::condition_variable pool_cv_;
};
