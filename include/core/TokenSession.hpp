// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef TOKEN_SESSION_HPP
#define TOKEN_SESSION_HPP

#include <cstddef>
#include <mutex>
#include <vector>

#include "core/TokenCapture.hpp"

namespace Sequencer::Core {

/**
 * @brief A begyűjtött capture lista tulajdonosa.
 * Nincs globális állapot: minden collector/elemzés egy session referenciát kap.
 * Az elemző mindig snapshot()-ot kap, a futó gyűjtés közben is.
 */
class TokenSession {
private:
    mutable std::mutex capture_mutex;
    std::vector<TokenCapture> captures;

public:
    TokenSession() = default;
    ~TokenSession() = default;

    void append(const TokenCapture& capture);
    void clear();

    // Másolat; a hívó nyugodtan elemezheti, a gyűjtés tovább írhat
    std::vector<TokenCapture> snapshot() const;
    std::size_t size() const;
};

} // namespace Sequencer::Core

#endif
