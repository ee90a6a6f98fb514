// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace rhiza {
    namespace {
        // Well-formed UTF-8 per RFC 3629: no overlong forms, no
        // surrogates, nothing above U+10FFFF.
        auto is_utf8(const std::string& str) -> bool {
            const auto* p = reinterpret_cast<const unsigned char*>(str.data());
            const auto* const end = p + str.size();
            while(p < end) {
                const auto c = *p;
                if(c < 0x80) {
                    p++;
                    continue;
                }

                size_t len{};
                unsigned char lo{0x80};
                unsigned char hi{0xbf};
                if(c >= 0xc2 && c <= 0xdf) {
                    len = 2;
                } else if(c >= 0xe0 && c <= 0xef) {
                    len = 3;
                    if(c == 0xe0) {
                        lo = 0xa0;
                    } else if(c == 0xed) {
                        hi = 0x9f;
                    }
                } else if(c >= 0xf0 && c <= 0xf4) {
                    len = 4;
                    if(c == 0xf0) {
                        lo = 0x90;
                    } else if(c == 0xf4) {
                        hi = 0x8f;
                    }
                } else {
                    return false;
                }

                if(static_cast<size_t>(end - p) < len) {
                    return false;
                }
                if(p[1] < lo || p[1] > hi) {
                    return false;
                }
                for(size_t i = 2; i < len; i++) {
                    if(p[i] < 0x80 || p[i] > 0xbf) {
                        return false;
                    }
                }
                p += len;
            }
            return true;
        }
    }

    auto operator<<(serializer& ser, const std::string& str) -> serializer& {
        ser << static_cast<uint64_t>(str.size());
        ser.write(str.data(), str.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& str) -> serializer& {
        uint64_t len{};
        if(!(deser >> len)) {
            return deser;
        }

        auto out = std::string();
        while(out.size() < len) {
            const auto step = static_cast<size_t>(
                std::min<uint64_t>(len - out.size(),
                                   config::maximum_reservation));
            const auto at = out.size();
            out.resize(at + step);
            if(!deser.read(&out[at], step)) {
                return deser;
            }
        }

        if(!is_utf8(out)) {
            deser.fail();
            return deser;
        }

        str = std::move(out);
        return deser;
    }
}
