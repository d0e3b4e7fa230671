#include "ambassador/secret_mask.hpp"
#include <algorithm>

namespace ambassador {

namespace {
constexpr size_t kMinRevealLength = 12;
constexpr size_t kRevealChars = 4;
constexpr std::string_view kMask = "****";
} // anonymous namespace

std::string mask_secret(std::string_view secret) {
    if (secret.size() <= kMinRevealLength) {
        return std::string(kMask);
    }
    std::string out;
    out.reserve(kRevealChars * 2 + kMask.size());
    out.append(secret.substr(0, kRevealChars));
    out.append(kMask);
    out.append(secret.substr(secret.size() - kRevealChars));
    return out;
}

std::string redact(std::string_view text, const std::vector<std::string>& secrets) {
    std::string out(text);
    // Longest first, so a secret containing another is masked whole.
    std::vector<const std::string*> ordered;
    ordered.reserve(secrets.size());
    for (const auto& s : secrets) {
        if (!s.empty()) ordered.push_back(&s);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const std::string* a, const std::string* b) { return a->size() > b->size(); });

    for (const std::string* secret : ordered) {
        const std::string masked = mask_secret(*secret);
        size_t pos = 0;
        while ((pos = out.find(*secret, pos)) != std::string::npos) {
            out.replace(pos, secret->size(), masked);
            pos += masked.size();
        }
    }
    return out;
}

SecretRegistry& SecretRegistry::instance() {
    static SecretRegistry registry;
    return registry;
}

void SecretRegistry::add(const std::string& secret) {
    if (secret.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(secrets_.begin(), secrets_.end(), secret) == secrets_.end()) {
        secrets_.push_back(secret);
    }
}

void SecretRegistry::remove(const std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.erase(std::remove(secrets_.begin(), secrets_.end(), secret), secrets_.end());
}

void SecretRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.clear();
}

std::string SecretRegistry::redact(std::string_view text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ambassador::redact(text, secrets_);
}

bool SecretRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return secrets_.empty();
}

} // namespace ambassador
