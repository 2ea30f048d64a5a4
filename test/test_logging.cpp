// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    offsync::util::LogManager::Initialize(level, false, "");

    // If level is "trace", also enable TRACE for all components
    if (level == "trace") {
        offsync::util::LogManager::SetComponentLevel("sync", "trace");
        offsync::util::LogManager::SetComponentLevel("queue", "trace");
        offsync::util::LogManager::SetComponentLevel("net", "trace");
        offsync::util::LogManager::SetComponentLevel("app", "trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    offsync::util::LogManager::Shutdown();
}
