// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "core/TokenSession.hpp"

namespace Sequencer::Core {

void TokenSession::append(const TokenCapture& capture) {
    std::lock_guard<std::mutex> lock(capture_mutex);
    captures.push_back(capture);
}

void TokenSession::clear() {
    std::lock_guard<std::mutex> lock(capture_mutex);
    captures.clear();
}

std::vector<TokenCapture> TokenSession::snapshot() const {
    std::lock_guard<std::mutex> lock(capture_mutex);
    return captures;
}

std::size_t TokenSession::size() const {
    std::lock_guard<std::mutex> lock(capture_mutex);
    return captures.size();
}

}
