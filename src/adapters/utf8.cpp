#include "utf8.hpp"

namespace lazycp::adapters::text {

bool Utf8Validator::feed(std::span<const char> bytes) {
    if (!valid_) return false;

    for (const char ch : bytes) {
        const auto b = static_cast<std::uint8_t>(ch);

        if (need_ > 0) {
            if (b < lower_ || b > upper_) {
                valid_ = false;
                return false;
            }
            --need_;
            lower_ = 0x80;
            upper_ = 0xBF;
            continue;
        }

        if (b < 0x80) continue;

        if (b >= 0xC2 && b <= 0xDF) {
            need_ = 1;
        } else if (b == 0xE0) {
            need_ = 2; lower_ = 0xA0;
        } else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) {
            need_ = 2;
        } else if (b == 0xED) {
            need_ = 2; upper_ = 0x9F; // суррогаты запрещены
        } else if (b == 0xF0) {
            need_ = 3; lower_ = 0x90;
        } else if (b >= 0xF1 && b <= 0xF3) {
            need_ = 3;
        } else if (b == 0xF4) {
            need_ = 3; upper_ = 0x8F;
        } else {
            valid_ = false;
            return false;
        }
    }
    return true;
}

} // namespace lazycp::adapters::text
