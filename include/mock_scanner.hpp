#pragma once

#include "advertisement.hpp"
#include "session.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <queue>
#include <random>
#include <string>
#include <utility>
#include <vector>

// In-memory stand-in for a BLE scanner for host tests. Advertisements are
// queued "on air" and delivered to one DecoderSession per address, the way
// the integration layer serializes advertisements per device.
class MockScanner {
public:
    using ResultHandler = std::function<void(const Advertisement&, const DecodeResult&)>;

    explicit MockScanner(DecoderConfig cfg) : cfg_(std::move(cfg)) {}

    void set_result_handler(ResultHandler handler) { result_handler_ = handler; }

    // Per-device key, applied when the device's session is created or
    // immediately if it already exists.
    void provision_key(const std::string& address, const Bindkey& key) {
        keys_[address] = key;
        auto it = sessions_.find(address);
        if (it != sessions_.end()) {
            auto reprocessed = it->second.set_bindkey(key);
            if (reprocessed && result_handler_) {
                result_handler_(*it->second.last_advertisement(), *reprocessed);
            }
        }
    }

    void enqueue_to_air(const Advertisement& adv) { air_queue_.push(adv); }

    void pump_air(float drop_prob = 0.0f, unsigned int seed = 123) {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        while (!air_queue_.empty()) {
            Advertisement adv = air_queue_.front();
            air_queue_.pop();
            if (drop_prob > 0.0f && dist(rng) < drop_prob) {
                dropped_++;
                continue; // simulate a missed scan
            }
            deliver(adv);
        }
    }

    void deliver(const Advertisement& adv) {
        DecodeResult r = session_for(adv.address).update(adv);
        results_.push_back(r);
        if (result_handler_) {
            result_handler_(adv, r);
        }
    }

    DecoderSession& session_for(const std::string& address) {
        auto it = sessions_.find(address);
        if (it == sessions_.end()) {
            DecoderConfig device_cfg = cfg_;
            auto key = keys_.find(address);
            if (key != keys_.end()) {
                device_cfg.bindkey = key->second;
            }
            it = sessions_.emplace(address, DecoderSession(device_cfg)).first;
        }
        return it->second;
    }

    bool has_session(const std::string& address) const { return sessions_.count(address) != 0; }
    std::size_t session_count() const { return sessions_.size(); }
    std::size_t dropped_count() const { return dropped_; }
    const std::vector<DecodeResult>& results() const { return results_; }

private:
    DecoderConfig cfg_;
    std::map<std::string, Bindkey> keys_;
    std::map<std::string, DecoderSession> sessions_;
    std::queue<Advertisement> air_queue_;
    std::vector<DecodeResult> results_;
    std::size_t dropped_ = 0;
    ResultHandler result_handler_;
};
