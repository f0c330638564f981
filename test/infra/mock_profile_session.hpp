// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_TEST_MOCK_PROFILE_SESSION_HPP
#define PBAPCLIENT_TEST_MOCK_PROFILE_SESSION_HPP

#include "client/profile_session.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pbapclient {
namespace test {

// Behaviour knobs and call log shared between a test and its session
struct MockSessionState {
    bool connect_result = true;
    bool throw_on_connect = false;
    // Disconnect() blocks until Abort() is called
    bool hang_on_disconnect = false;
    // Entries returned per path; paths not listed fail
    std::map<std::string, size_t> entries;

    std::vector<std::string> calls;
    std::vector<std::string> downloaded;
    bool aborted = false;

    mutable std::mutex mutex;
    std::condition_variable cv;

    size_t Count(const std::string& call) const {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& c : calls) {
            if (c == call) ++n;
        }
        return n;
    }

    std::vector<std::string> Downloaded() const {
        std::lock_guard<std::mutex> lock(mutex);
        return downloaded;
    }

    bool Aborted() const {
        std::lock_guard<std::mutex> lock(mutex);
        return aborted;
    }
};

class MockProfileSession : public client::ProfileSession {
public:
    explicit MockProfileSession(std::shared_ptr<MockSessionState> state) : state_(std::move(state)) {}

    bool Connect(const client::SdpPseRecord&) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->calls.push_back("connect");
        if (state_->throw_on_connect) {
            throw std::runtime_error("channel refused");
        }
        return state_->connect_result && !state_->aborted;
    }

    std::optional<size_t> Download(const std::string& path) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->calls.push_back("download");
        if (state_->aborted) return std::nullopt;
        auto it = state_->entries.find(path);
        if (it == state_->entries.end()) return std::nullopt;
        state_->downloaded.push_back(path);
        return it->second;
    }

    void Disconnect() override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->calls.push_back("disconnect");
        if (state_->hang_on_disconnect) {
            // Bounded so a broken test cannot hang forever
            state_->cv.wait_for(lock, std::chrono::seconds(10), [this] { return state_->aborted; });
        }
    }

    void Abort() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->calls.push_back("abort");
            state_->aborted = true;
        }
        state_->cv.notify_all();
    }

private:
    std::shared_ptr<MockSessionState> state_;
};

// SessionFactory handing every new session the same state
inline client::SessionFactory MakeSessionFactory(std::shared_ptr<MockSessionState> state) {
    return [state](const client::PeerDevice&) -> std::unique_ptr<client::ProfileSession> {
        return std::make_unique<MockProfileSession>(state);
    };
}

} // namespace test
} // namespace pbapclient

#endif // PBAPCLIENT_TEST_MOCK_PROFILE_SESSION_HPP
