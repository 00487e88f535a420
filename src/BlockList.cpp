#include "BlockList.hpp"
#include <fstream>

#include "StringUtils.hpp"

using namespace utils;

// ====================================================================================================
// Loading
// ====================================================================================================

bool BlockList::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string target = trim(line);

        // Skip empty lines and comments
        if (target.empty() || target[0] == '#') {
            continue;
        }

        add(target);
    }

    return true;
}

// ====================================================================================================
// Mutation / Queries
// ====================================================================================================

bool BlockList::add(const std::string& target) {
    if (target.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    return targets.insert(target).second;
}

bool BlockList::remove(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex);
    return targets.erase(target) != 0;
}

bool BlockList::contains(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex);
    return targets.count(target) != 0;
}

std::vector<std::string> BlockList::entries() const {
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<std::string>(targets.begin(), targets.end());
}

size_t BlockList::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return targets.size();
}
