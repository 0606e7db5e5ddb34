/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized file I/O operations.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace parasitereg::infrastructure {

/**
 * @enum WriteMode
 * @brief How a SaveTask reaches the file.
 */
enum class WriteMode {
    Replace,    ///< Atomic temp-file + rename of the whole content.
    Append      ///< Content appended to the end of the file, then flushed.
};

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    WriteMode mode = WriteMode::Replace;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs file writes sequentially.
 *
 * All writes pass through a single serialized queue, so writes to the same
 * file land in submission order.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Asynchronously queues a text content to replace a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues text to be appended to a file.
     */
    void appendTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued task has been written.
     * @return False if any write failed since the previous flush.
     */
    bool flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    void enqueue(SaveTask task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    bool performAtomicWrite(const SaveTask& task);
    bool performAppend(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    std::size_t m_inFlight = 0;
    bool m_failed = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace parasitereg::infrastructure
