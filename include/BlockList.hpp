#ifndef BLOCK_LIST_HPP
#define BLOCK_LIST_HPP

#include <mutex>
#include <set>
#include <string>
#include <vector>

/**
 * BlockList - Set of request-line targets the proxy refuses to serve
 *
 * Responsibilities:
 * - Hold the blocked targets, compared exactly as they appear on the request line
 * - Load an initial list from a configuration file
 * - Allow the operator to add and remove targets while the proxy runs
 *
 * All operations are safe to call from any thread.
 */
class BlockList {
public:
    BlockList() = default;

    /**
     * Load targets from file, adding them to the current list
     *
     * One target per line. Whitespace is trimmed, empty lines and lines
     * starting with '#' are skipped.
     *
     * @param filename Path to block list file
     * @return true on success, false if the file could not be opened
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Add a target
     * @return true if it was added, false if empty or already blocked
     */
    bool add(const std::string& target);

    /**
     * Remove a target
     * @return true if it was removed, false if it was not blocked
     */
    bool remove(const std::string& target);

    bool contains(const std::string& target) const;

    /** Snapshot of all blocked targets, sorted */
    std::vector<std::string> entries() const;

    size_t size() const;

private:
    mutable std::mutex mutex;
    std::set<std::string> targets;
};

#endif // BLOCK_LIST_HPP
