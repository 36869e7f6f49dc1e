#pragma once

#include "capabilities.h"
#include "signal_relay.h"

#include <gmock/gmock.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meshchat {

/**
 * Transport double. Handshake and send calls are mocked; registered
 * handlers are kept so tests can replay transport events.
 */
class MockTransport : public TransportAdapter {
public:
    MOCK_METHOD(std::optional<nlohmann::json>, create_offer, (const std::string& peer_id), (override));
    MOCK_METHOD(std::optional<nlohmann::json>, accept_offer, (const nlohmann::json& offer), (override));
    MOCK_METHOD(bool, finalize, (const nlohmann::json& answer), (override));
    MOCK_METHOD(bool, add_candidate, (const std::string& peer_id, const nlohmann::json& candidate), (override));
    MOCK_METHOD(bool, connect_direct, (const std::string& peer_id), (override));
    MOCK_METHOD(void, disconnect, (const std::string& peer_id), (override));
    MOCK_METHOD(bool, send_text, (const std::string& peer_id, const std::string& data), (override));
    MOCK_METHOD(bool, send_binary, (const std::string& peer_id, const std::vector<uint8_t>& data), (override));

    void set_text_handler(TextHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        text_handler_ = std::move(handler);
    }
    void set_binary_handler(BinaryHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        binary_handler_ = std::move(handler);
    }
    void set_peer_connected_handler(PeerHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_handler_ = std::move(handler);
    }
    void set_peer_disconnected_handler(PeerHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected_handler_ = std::move(handler);
    }

    void fire_text(const std::string& peer_id, const std::string& data) {
        TextHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = text_handler_;
        }
        if (handler) handler(peer_id, data);
    }
    void fire_binary(const std::string& peer_id, const std::vector<uint8_t>& data) {
        BinaryHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = binary_handler_;
        }
        if (handler) handler(peer_id, data);
    }
    void fire_connected(const std::string& peer_id) {
        PeerHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = connected_handler_;
        }
        if (handler) handler(peer_id);
    }
    void fire_disconnected(const std::string& peer_id) {
        PeerHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = disconnected_handler_;
        }
        if (handler) handler(peer_id);
    }

private:
    std::mutex mutex_;
    TextHandler text_handler_;
    BinaryHandler binary_handler_;
    PeerHandler connected_handler_;
    PeerHandler disconnected_handler_;
};

class MockRelayChannel : public RelayChannel {
public:
    MOCK_METHOD(std::optional<nlohmann::json>, request, (const nlohmann::json& request), (override));
};

class MockRateLimiter : public RateLimiter {
public:
    MOCK_METHOD(bool, can_send_message, (const std::string& recipient_id), (override));
    MOCK_METHOD(bool, can_send_file, (const std::string& recipient_id), (override));
};

class MockFileValidator : public FileValidator {
public:
    MOCK_METHOD(bool, validate, (const std::vector<FileAttachment>& files, std::string& out_reason), (override));
};

class MockCryptoProvider : public CryptoProvider {
public:
    MOCK_METHOD(std::vector<uint8_t>, encrypt, (const std::string& peer_id, const std::vector<uint8_t>& plaintext),
                (override));
    MOCK_METHOD(std::optional<std::vector<uint8_t>>, decrypt,
                (const std::string& peer_id, const std::vector<uint8_t>& ciphertext), (override));
    MOCK_METHOD(std::string, fingerprint, (const std::string& public_key), (override));
};

// Poll `pred` every 10 ms until it holds or `timeout_ms` passes
template<typename Predicate>
bool wait_for_condition(Predicate pred, int timeout_ms = 5000) {
    auto start = std::chrono::steady_clock::now();
    while (!pred()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed.count() >= timeout_ms) {
            return false;
        }
    }
    return true;
}

} // namespace meshchat
