// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef TOKEN_EXTRACTOR_HPP
#define TOKEN_EXTRACTOR_HPP

#include <string>
#include <variant>

#include "core/TokenCapture.hpp"

namespace Sequencer::Modules {

    struct ExtractionFound {
        std::string value;
        std::string source;
    };

    struct ExtractionNotFound {};

    // Explicit tagged union: nincs "Not found" sentinel ütközés valódi tokennel
    using ExtractionResult = std::variant<ExtractionFound, ExtractionNotFound>;

    struct RawHttpResponse {
        std::string statusLine;
        Core::HeaderList headers;
        std::string body;
    };

    /**
     * @brief Token kinyerése egy HTTP válaszból.
     * Sorrend: Set-Cookie, a paraméter nevét tartalmazó header, JSON kulcs (felső és
     * egy szinttel beágyazott), URL-encoded, HTML input, meta tag, data- attribútum,
     * JavaScript változó. Minden illesztés kis-nagybetű független.
     */
    class TokenExtractor {
    public:
        static ExtractionResult extract(const std::string& body,
                                        const Core::HeaderList& headers,
                                        const std::string& parameterName);

        // Nyers válasz dump: státuszsor, headerek, üres sor, body
        static RawHttpResponse parseRawResponse(const std::string& raw);

        // Engedékeny %XX dekódolás; hibás escape változatlan marad
        static std::string percentDecode(const std::string& value);

        static std::string escapeRegex(const std::string& literal);

        static Core::TokenCapture toCapture(const ExtractionResult& result,
                                            const std::string& requestSent,
                                            const std::string& responseReceived,
                                            const Core::HeaderList& headers);
    };

} // namespace Sequencer::Modules

#endif // TOKEN_EXTRACTOR_HPP
