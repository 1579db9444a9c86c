#ifndef SIGN_CORE_SCRIPT_STORE_H
#define SIGN_CORE_SCRIPT_STORE_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/sign_types.h"

namespace sign_core {

using ScriptPtr = std::shared_ptr<const AlgorithmScript>;

// Lowercase hex SHA-256 of the given bytes.
std::string sha256Hex(const std::string& data);

class ScriptStore {
public:
    // Called with the candidate before it is published. Throws SignError to reject it.
    using Validator = std::function<void(const AlgorithmScript&)>;

    explicit ScriptStore(Validator validator = nullptr, size_t historyLimit = 4);

    /**
     * @brief Validates and publishes a new script version.
     *
     * Loading the source that is already current returns the current script
     * without bumping the version. Throws SignError(SCRIPT_INVALID) when the
     * source is empty or the validator rejects it; the previous script stays
     * current in that case.
     */
    ScriptPtr load(const std::string& source, const std::string& origin = "admin");

    // Reads the file and loads it. Throws SCRIPT_INVALID if the file cannot be read.
    ScriptPtr loadFile(const std::string& path);

    // Republishes the version that preceded the current one.
    ScriptPtr rollback();

    ScriptPtr current() const;

    // Superseded versions, newest first.
    std::vector<ScriptPtr> history() const;

    void setValidator(Validator validator);

private:
    ScriptPtr publish(const std::string& source, const std::string& origin);

    Validator validator_;
    size_t historyLimit_;

    mutable std::mutex mutex_;
    std::mutex loadMutex_; // serializes validation so two updates never interleave
    ScriptPtr current_;
    std::deque<ScriptPtr> history_;
    uint64_t nextVersion_ = 1;
};

} // namespace sign_core

#endif // SIGN_CORE_SCRIPT_STORE_H
