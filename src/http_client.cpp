#include "http_client.hpp"

#include <cpr/cpr.h>

#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <utility>

std::string HttpResponse::describe() const {
    if (!error.empty()) return error;
    return "HTTP status " + std::to_string(status);
}

// Returns a borrowed session to the pool on scope exit.
class CprHttpClient::SessionLease {
public:
    explicit SessionLease(CprHttpClient& owner) : owner_(owner), session_(owner.acquire()) {}
    ~SessionLease() { owner_.release(std::move(session_)); }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    cpr::Session& operator*() const { return *session_; }

private:
    CprHttpClient& owner_;
    std::unique_ptr<cpr::Session> session_;
};

// -------------------- ctor --------------------
CprHttpClient::CprHttpClient(std::string userAgent, std::chrono::seconds timeout, size_t poolSize)
    : userAgent_(std::move(userAgent)),
      timeout_(timeout) {
    if (poolSize == 0) poolSize = 1;
    idle_.reserve(poolSize);
    for (size_t i = 0; i < poolSize; ++i) idle_.push_back(make_session());
}

CprHttpClient::~CprHttpClient() = default;

// -------------------- session pool --------------------
std::unique_ptr<cpr::Session> CprHttpClient::make_session() const {
    auto session = std::make_unique<cpr::Session>();
    session->SetHeader(cpr::Header{{"User-Agent", userAgent_}});
    session->SetRedirect(cpr::Redirect{true});
    session->SetConnectTimeout(cpr::ConnectTimeout{timeout_});
    // A stalled body (no bytes for `timeout_`) fails the attempt; a large
    // file that keeps flowing is never cut off.
    session->SetLowSpeed(cpr::LowSpeed{1, static_cast<int32_t>(timeout_.count())});
    return session;
}

std::unique_ptr<cpr::Session> CprHttpClient::acquire() {
    std::unique_lock<std::mutex> lk(pool_mtx_);
    pool_cv_.wait(lk, [&]{ return !idle_.empty(); });
    auto session = std::move(idle_.back());
    idle_.pop_back();
    return session;
}

void CprHttpClient::release(std::unique_ptr<cpr::Session> session) {
    {
        std::lock_guard<std::mutex> lk(pool_mtx_);
        idle_.push_back(std::move(session));
    }
    pool_cv_.notify_one();
}

// -------------------- requests --------------------
HttpResponse CprHttpClient::get_text(const std::string& url) {
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"User-Agent", userAgent_}},
                               cpr::Timeout{timeout_},
                               cpr::Redirect{true});
    HttpResponse out;
    out.status = r.status_code;
    if (r.error) {
        out.error = r.error.message.empty() ? "transport error" : r.error.message;
        return out;
    }
    out.body = std::move(r.text);
    return out;
}

HttpResponse CprHttpClient::download(const std::string& url, const ChunkSink& sink) {
    SessionLease lease(*this);
    cpr::Session& session = *lease;
    session.SetUrl(cpr::Url{url});

    // Status of the final response, read from its status line so an error
    // body is refused before any of it reaches the sink.
    long status = 0;
    session.SetHeaderCallback(cpr::HeaderCallback{
        [&](std::string_view header, intptr_t) -> bool {
            if (header.substr(0, 5) == "HTTP/") {
                auto space = header.find(' ');
                if (space != std::string_view::npos) {
                    status = std::strtol(std::string(header.substr(space + 1, 3)).c_str(), nullptr, 10);
                }
            }
            return true;
        }});

    bool aborted = false;
    bool refused = false;
    cpr::Response r = session.Download(cpr::WriteCallback{
        [&](std::string_view data, intptr_t) -> bool {
            if (status != 0 && (status < 200 || status >= 300)) {
                refused = true;
                return false;
            }
            if (!sink(data.data(), data.size())) {
                aborted = true;
                return false;
            }
            return true;
        }});

    HttpResponse out;
    out.status = refused ? status : r.status_code;
    if (aborted) {
        out.error = "transfer aborted by receiver";
    } else if (r.error && !refused) {
        out.error = r.error.message.empty() ? "transport error" : r.error.message;
    }
    return out;
}
