#pragma once

#include "domain/Result.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace pda::domain {

// A 20-byte account identifier written as 0x-prefixed hex. Two addresses
// are the same account when their lower-cased forms match.
// Mixed-case input is only case-folded: its EIP-55 checksum is not
// verified, so a mis-cased address parses like any other.
class Address {
public:
    static Result<Address> parse(std::string_view text);

    // As received.
    const std::string& str() const noexcept { return text_; }
    // Lower-case form used for every comparison.
    const std::string& canonical() const noexcept { return canonical_; }

    bool operator==(const Address& other) const noexcept {
        return canonical_ == other.canonical_;
    }
    std::strong_ordering operator<=>(const Address& other) const noexcept {
        return canonical_ <=> other.canonical_;
    }

private:
    Address(std::string text, std::string canonical);

    std::string text_;
    std::string canonical_;
};

// InvalidAddress when either side is not a well-formed identifier.
Result<bool> addresses_equal(std::string_view a, std::string_view b);

} // namespace pda::domain
