// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "core/ByteDecoder.hpp"
#include "utils/StringUtils.hpp"

#include <cctype>

namespace Sequencer::Core {

    namespace {

        int base64Value(unsigned char c) {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '+') return 62;
            if (c == '/') return 63;
            return -1;
        }

        // url-safe ábécé visszaírása és '=' padding 4 többszörösére
        std::string toStandardBase64(const std::string& s) {
            std::string t = SequencerUtils::replaceAll(s, "-", "+");
            t = SequencerUtils::replaceAll(t, "_", "/");
            while (t.size() % 4 != 0) {
                t += '=';
            }
            return t;
        }

        bool hasUrlSafeChars(const std::string& s) {
            return s.find_first_of("-_") != std::string::npos;
        }

        // Felbontás '.' mentén, üres szegmensek nélkül
        std::vector<std::string> nonEmptySegments(const std::string& token) {
            std::vector<std::string> segments;
            for (auto& part : SequencerUtils::split(token, '.')) {
                if (!part.empty()) segments.push_back(std::move(part));
            }
            return segments;
        }

    } // namespace

    std::optional<ByteSequence> ByteDecoder::decodeBase64(const std::string& input) {
        std::string clean;
        clean.reserve(input.size());
        for (unsigned char c : input) {
            if (!std::isspace(c)) clean += static_cast<char>(c);
        }

        if (clean.size() % 4 == 0) {
            for (int i = 0; i < 2 && !clean.empty() && clean.back() == '='; ++i) {
                clean.pop_back();
            }
        }
        if (clean.size() % 4 == 1) {
            return std::nullopt;
        }

        ByteSequence out;
        out.reserve(clean.size() * 3 / 4);
        uint32_t buffer = 0;
        int bitsHeld = 0;
        for (unsigned char c : clean) {
            int v = base64Value(c);
            if (v < 0) {
                return std::nullopt;
            }
            buffer = (buffer << 6) | static_cast<uint32_t>(v);
            bitsHeld += 6;
            if (bitsHeld >= 8) {
                bitsHeld -= 8;
                out.push_back(static_cast<uint8_t>((buffer >> bitsHeld) & 0xFF));
            }
        }
        return out;
    }

    std::optional<ByteSequence> ByteDecoder::tryDecodeHex(const std::string& token) {
        std::string clean;
        clean.reserve(token.size());
        for (unsigned char c : token) {
            if (!std::isspace(c)) clean += static_cast<char>(c);
        }

        if (clean.empty() || clean.size() % 2 != 0) return std::nullopt;
        for (unsigned char c : clean) {
            if (!isHexDigit(c)) return std::nullopt;
        }

        ByteSequence bytes;
        bytes.reserve(clean.size() / 2);
        for (size_t i = 0; i < clean.size(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(std::stoi(clean.substr(i, 2), nullptr, 16)));
        }
        return bytes;
    }

    std::optional<DecodedToken> ByteDecoder::tryDecodeBase64Like(const std::string& token) {
        const TokenEncoding kind = hasUrlSafeChars(token) ? TokenEncoding::BASE64URL : TokenEncoding::BASE64;

        std::vector<std::pair<std::string, TokenEncoding>> variants;
        variants.emplace_back(toStandardBase64(token), kind);
        variants.emplace_back(token, TokenEncoding::BASE64);
        if (SequencerUtils::startsWith(token, ".")) {
            variants.emplace_back(toStandardBase64(token.substr(1)), kind);
        }

        for (const auto& [candidate, encoding] : variants) {
            auto bytes = decodeBase64(candidate);
            if (bytes) {
                return DecodedToken{std::move(*bytes), encoding};
            }
        }
        return std::nullopt;
    }

    DecodedToken ByteDecoder::decode(const std::string& token) {
        // 1. Szegmentált (JWT-szerű) tokenek: minden szegmens külön dekódolva
        if (token.find('.') != std::string::npos) {
            auto segments = nonEmptySegments(token);
            if (segments.size() >= 2) {
                DecodedToken joined;
                joined.encoding = TokenEncoding::BASE64;
                bool ok = true;
                for (const auto& segment : segments) {
                    auto part = tryDecodeBase64Like(segment);
                    if (!part) {
                        ok = false;
                        break;
                    }
                    joined.bytes.insert(joined.bytes.end(), part->bytes.begin(), part->bytes.end());
                    if (part->encoding == TokenEncoding::BASE64URL) {
                        joined.encoding = TokenEncoding::BASE64URL;
                    }
                }
                if (ok) return joined;
            }
        }

        // 2. Hex
        if (auto hex = tryDecodeHex(token)) {
            return DecodedToken{std::move(*hex), TokenEncoding::HEX};
        }

        // 3. Base64 / base64url
        if (auto b64 = tryDecodeBase64Like(token)) {
            return std::move(*b64);
        }

        // 4. Nyers byte-ok
        return DecodedToken{ByteSequence(token.begin(), token.end()), TokenEncoding::RAW};
    }

    BitSequence ByteDecoder::decodedBits(const ByteSequence& bytes) {
        BitSequence bits;
        bits.reserve(bytes.size() * 8);
        for (uint8_t byte : bytes) {
            for (int j = 7; j >= 0; --j) {
                bits.push_back(static_cast<uint8_t>((byte >> j) & 1));
            }
        }
        return bits;
    }

    BitSequence ByteDecoder::rawCharacterBits(const std::string& token) {
        BitSequence bits;
        bits.reserve(token.size() * 8);
        for (unsigned char c : token) {
            for (int j = 7; j >= 0; --j) {
                bits.push_back(static_cast<uint8_t>((c >> j) & 1));
            }
        }
        return bits;
    }

    const char* toString(TokenEncoding encoding) {
        switch (encoding) {
            case TokenEncoding::HEX:       return "hex";
            case TokenEncoding::BASE64:    return "base64";
            case TokenEncoding::BASE64URL: return "base64url";
            case TokenEncoding::RAW:       return "raw";
        }
        return "raw";
    }

} // namespace Sequencer::Core
