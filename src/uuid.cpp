#include "spatialbook/uuid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace spatialbook {

    std::string generate_uuid() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};

        std::array<std::uint8_t, 16>        bytes{};
        for (auto& byte : bytes) {
            byte = static_cast<std::uint8_t>(rng());
        }
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

        constexpr char kHex[] = "0123456789ABCDEF";
        std::string    text;
        text.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                text.push_back('-');
            }
            text.push_back(kHex[bytes[i] >> 4]);
            text.push_back(kHex[bytes[i] & 0x0F]);
        }
        return text;
    }

    bool is_valid_uuid(std::string_view text) {
        if (text.size() != 36) {
            return false;
        }
        for (size_t i = 0; i < text.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') {
                    return false;
                }
                continue;
            }
            if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
                return false;
            }
        }
        return true;
    }

} // namespace spatialbook
