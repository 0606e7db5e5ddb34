#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "infrastructure/PersistenceService.hpp"

using parasitereg::infrastructure::PersistenceService;

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream f(path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // namespace

int main() {
    std::cout << "[Test] Starting PersistenceService Test..." << std::endl;

    std::string testRoot = "test_persistence_root";
    std::filesystem::remove_all(testRoot);

    PersistenceService persistence;

    // Appends land in submission order, creating missing directories.
    const std::string logPath = testRoot + "/registry/events.ndjson";
    for (int i = 0; i < 100; ++i) {
        persistence.appendTextAsync(logPath, std::to_string(i) + "\n");
    }
    assert(persistence.flush());

    std::ifstream log(logPath);
    std::string line;
    int expected = 0;
    while (std::getline(log, line)) {
        assert(line == std::to_string(expected));
        ++expected;
    }
    assert(expected == 100);

    // Replace swaps the whole content.
    const std::string snapshotPath = testRoot + "/snapshot.json";
    persistence.saveTextAsync(snapshotPath, "{\"v\":1}");
    persistence.saveTextAsync(snapshotPath, "{\"v\":2}");
    assert(persistence.flush());
    assert(ReadFile(snapshotPath) == "{\"v\":2}");

    // A write under a regular file fails and is reported once.
    const std::string blocked = snapshotPath + "/child.txt";
    persistence.appendTextAsync(blocked, "x");
    assert(!persistence.flush());
    assert(persistence.flush());

    persistence.stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] PersistenceService Test." << std::endl;
    return 0;
}
