#pragma once
#include "keyspot_common.hpp"

#include <utility>

// Owns a decoded candidate and wipes it with sodium_memzero when released.
class SecureText {
public:
    SecureText() = default;

    explicit SecureText(Text text)
        : text_(std::move(text))
    {
    }

    // Non-copyable
    SecureText(const SecureText&) = delete;
    SecureText& operator=(const SecureText&) = delete;

    // Movable
    SecureText(SecureText&& other) noexcept
        : text_(std::move(other.text_))
    {
        other.cleanup();
    }

    SecureText& operator=(SecureText&& other) noexcept {
        if (this != &other) {
            cleanup();
            text_ = std::move(other.text_);
            other.cleanup();
        }
        return *this;
    }

    ~SecureText() {
        cleanup();
    }

    // replace contents, wiping the previous value first
    void assign(Text text) {
        cleanup();
        text_ = std::move(text);
    }

    const Text& str() const { return text_; }
    // in-place edits only; anything that reallocates leaves the old buffer unwiped
    Text& data() { return text_; }
    size_t size() const { return text_.size(); }
    bool empty() const { return text_.empty(); }

private:
    Text text_;

    void cleanup() noexcept {
        if (!text_.empty()) {
            sodium_memzero(&text_[0], text_.size() * sizeof(char32_t));
        }
        text_.clear();
    }
};
