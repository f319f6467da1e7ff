#include "domain/value_objects/Address.hpp"

#include <cctype>

namespace pda::domain {

namespace {

constexpr std::size_t kHexDigits = 40;

bool is_hex(char c) noexcept {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

Address::Address(std::string text, std::string canonical)
    : text_(std::move(text))
    , canonical_(std::move(canonical)) {}

Result<Address> Address::parse(std::string_view text) {
    if (text.size() != kHexDigits + 2 || text[0] != '0' || text[1] != 'x') {
        return make_error(ErrorKind::InvalidAddress,
                          "Invalid address: '" + std::string(text) + "'");
    }

    std::string canonical = "0x";
    canonical.reserve(text.size());
    for (char c : text.substr(2)) {
        if (!is_hex(c)) {
            return make_error(ErrorKind::InvalidAddress,
                              "Invalid address: '" + std::string(text) + "'");
        }
        canonical.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return Address(std::string(text), std::move(canonical));
}

Result<bool> addresses_equal(std::string_view a, std::string_view b) {
    auto lhs = Address::parse(a);
    if (!lhs) return lhs.error();
    auto rhs = Address::parse(b);
    if (!rhs) return rhs.error();
    return lhs.value() == rhs.value();
}

} // namespace pda::domain
