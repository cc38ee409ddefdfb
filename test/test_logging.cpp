// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <cstdio>
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    // Initialize logging system with specified level
    meshwalk::util::LogManager::Initialize(level, false, "");

    // If level is "trace", also enable TRACE for all components
    // This ensures LOG_NET_TRACE, LOG_WALK_TRACE, etc. all work
    if (level == "trace") {
        for (const auto& component : meshwalk::util::LogManager::Components()) {
            meshwalk::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    meshwalk::util::LogManager::Shutdown();
}
