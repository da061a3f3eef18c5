#pragma once

#include "codec.hpp"
#include "stream_config.hpp"
#include "translator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pseudo_mt::test {

// Counters and recorded contexts shared by a FakeTranslator and its clones.
struct TranslatorLog {
    std::atomic<int> clones{0};
    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    std::mutex mutex;
    std::vector<std::string> instructions;
    std::vector<TranslationContext> contexts;
};

// Deterministic stand-in for the model: "compute the total." becomes
// code_for("compute the total.").
class FakeTranslator final : public Translator {
public:
    explicit FakeTranslator(std::shared_ptr<TranslatorLog> log = std::make_shared<TranslatorLog>())
        : log_(std::move(log)) {}

    std::unique_ptr<Translator> clone() const override {
        if (fail_clone) {
            throw std::runtime_error("model not loaded");
        }
        ++log_->clones;
        auto copy = std::make_unique<FakeTranslator>(log_);
        copy->delay = delay;
        copy->fail_on = fail_on;
        copy->fast_on = fast_on;
        return copy;
    }

    std::string translate(const std::string& instruction, const TranslationContext& context) override {
        ++log_->calls;
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            log_->instructions.push_back(instruction);
            log_->contexts.push_back(context);
        }
        const int now_active = ++log_->active;
        int seen = log_->max_active.load();
        while (now_active > seen && !log_->max_active.compare_exchange_weak(seen, now_active)) {
        }
        if (delay.count() > 0 && std::find(fast_on.begin(), fast_on.end(), instruction) == fast_on.end()) {
            std::this_thread::sleep_for(delay);
        }
        --log_->active;
        if (!fail_on.empty() && instruction.find(fail_on) != std::string::npos) {
            throw std::runtime_error("model returned no code");
        }
        return expected(instruction);
    }

    static std::string expected(const std::string& instruction) {
        std::string text = instruction;
        std::replace(text.begin(), text.end(), '\n', ' ');
        while (!text.empty() && text.back() == ' ') {
            text.pop_back();
        }
        return "code_for(\"" + text + "\")";
    }

    TranslatorLog& log() { return *log_; }

    std::chrono::milliseconds delay{0};
    std::string fail_on;
    // Instructions answered without the delay.
    std::vector<std::string> fast_on;
    bool fail_clone = false;

private:
    std::shared_ptr<TranslatorLog> log_;
};

// Reverses the bytes; enough to prove the cache round-trips through a codec.
class ReversingCodec final : public Codec {
public:
    const char* name() const override { return "reverse"; }

    std::string compress(const std::string& bytes) const override {
        return std::string(bytes.rbegin(), bytes.rend());
    }

    std::string decompress(const std::string& bytes) const override {
        return std::string(bytes.rbegin(), bytes.rend());
    }
};

inline BufferConfig uncompressed_buffer() {
    BufferConfig config;
    config.enable_compression = false;
    return config;
}

// One English paragraph per item, separated by blank lines.
inline std::string paragraphs(std::size_t count) {
    std::string text;
    for (std::size_t i = 0; i < count; ++i) {
        text += "compute item " + std::to_string(i) + " now.\n\n";
    }
    return text;
}

}  // namespace pseudo_mt::test
