#pragma once
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ambassador {

/// Render a secret safe for logs: "abcd****wxyz" for long values,
/// "****" for anything of 12 characters or fewer.
[[nodiscard]] std::string mask_secret(std::string_view secret);

/// Replace every occurrence of each secret in text with its masked form.
/// Empty secrets are ignored.
[[nodiscard]] std::string redact(std::string_view text,
                                 const std::vector<std::string>& secrets);

/// Process-wide set of values that must never reach a log sink unmasked.
/// The redacting log sink consults it for every record.
class SecretRegistry {
public:
    static SecretRegistry& instance();

    void add(const std::string& secret);
    void remove(const std::string& secret);
    void clear();

    [[nodiscard]] std::string redact(std::string_view text) const;
    [[nodiscard]] bool empty() const;

private:
    SecretRegistry() = default;

    mutable std::mutex mutex_;
    std::vector<std::string> secrets_;
};

} // namespace ambassador
