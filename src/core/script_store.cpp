#include "core/script_store.h"
#include "core/logger.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace sign_core {

std::string sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!md ||
        EVP_DigestInit_ex(md.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(md.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(md.get(), digest, &digest_len) != 1) {
        throw SignError(ErrorKind::INTERNAL, "SHA-256 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

ScriptStore::ScriptStore(Validator validator, size_t historyLimit)
    : validator_(std::move(validator)), historyLimit_(historyLimit) {}

void ScriptStore::setValidator(Validator validator) {
    std::lock_guard<std::mutex> lock(loadMutex_);
    validator_ = std::move(validator);
}

ScriptPtr ScriptStore::load(const std::string& source, const std::string& origin) {
    std::lock_guard<std::mutex> load_lock(loadMutex_);

    bool blank = std::all_of(source.begin(), source.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        LOG_WARN("ScriptStore", "Rejected empty script from " + origin);
        throw SignError(ErrorKind::SCRIPT_INVALID, "script source is empty");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && current_->source == source) {
            return current_;
        }
    }
    return publish(source, origin);
}

ScriptPtr ScriptStore::loadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SignError(ErrorKind::SCRIPT_INVALID, "cannot read script file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load(buffer.str(), path);
}

ScriptPtr ScriptStore::rollback() {
    std::lock_guard<std::mutex> load_lock(loadMutex_);

    ScriptPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (history_.empty()) {
            throw SignError(ErrorKind::SCRIPT_INVALID, "no previous script version to roll back to");
        }
        previous = history_.front();
    }

    ScriptPtr restored = publish(previous->source, "rollback");

    // publish() pushed the superseded script to the front; drop the restored copy behind it.
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(history_.begin(), history_.end(), previous);
    if (it != history_.end()) {
        history_.erase(it);
    }
    return restored;
}

// Caller holds loadMutex_.
ScriptPtr ScriptStore::publish(const std::string& source, const std::string& origin) {
    auto candidate = std::make_shared<AlgorithmScript>();
    candidate->source = source;
    candidate->hash = sha256Hex(source);
    candidate->origin = origin;
    candidate->loadedAt = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        candidate->version = nextVersion_;
    }

    if (validator_) {
        try {
            validator_(*candidate);
        } catch (const SignError& e) {
            LOG_WARN("ScriptStore", "Rejected script " + candidate->hash.substr(0, 12) +
                     " from " + origin + ": " + e.what());
            throw SignError(ErrorKind::SCRIPT_INVALID, e.what());
        } catch (const std::exception& e) {
            LOG_WARN("ScriptStore", "Rejected script from " + origin + ": " + e.what());
            throw SignError(ErrorKind::SCRIPT_INVALID, e.what());
        }
    }

    ScriptPtr published = candidate;
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        history_.push_front(current_);
        while (history_.size() > historyLimit_) {
            history_.pop_back();
        }
    }
    current_ = published;
    ++nextVersion_;

    LOG_INFO("ScriptStore", "Published script v" + std::to_string(published->version) +
             " hash=" + published->hash.substr(0, 12) + " origin=" + origin +
             " (" + std::to_string(source.size()) + " bytes)");
    return published;
}

ScriptPtr ScriptStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<ScriptPtr> ScriptStore::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ScriptPtr>(history_.begin(), history_.end());
}

} // namespace sign_core
