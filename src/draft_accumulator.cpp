#include "draft_accumulator.h"
#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace job_diary {

class DraftAccumulator::Impl {
public:
    Impl(const std::string& path, std::chrono::hours max_age, WallNowFn now)
        : path_(path), max_age_(max_age), now_(std::move(now)) {
        if (!now_) {
            now_ = [] { return WallClock::now(); };
        }
    }

    void append(const std::string& text) {
        std::string fragment = utils::trim_copy(text);
        if (fragment.empty()) return;
        fragments_.push_back(fragment);
        LOG_DRAFT("Appended fragment #" + std::to_string(fragments_.size()));
        auto result = checkpoint();
        if (!result) {
            Logger::warn("[Draft] Checkpoint failed: " + result.error().message);
        }
    }

    std::string current_text() const {
        return utils::join(fragments_, " ");
    }

    void clear() {
        fragments_.clear();
        epoch_++;
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            Logger::warn("[Draft] Could not remove checkpoint " + path_ + ": " + ec.message());
        }
        LOG_DRAFT("Draft cleared");
    }

    void consume(size_t n) {
        if (n >= fragments_.size()) {
            clear();
            return;
        }
        fragments_.erase(fragments_.begin(), fragments_.begin() + static_cast<std::ptrdiff_t>(n));
        auto result = checkpoint();
        if (!result) {
            Logger::warn("[Draft] Checkpoint failed: " + result.error().message);
        }
    }

    Result<void> checkpoint() const {
        if (path_.empty()) return Result<void>();
        if (!ensure_parent_dir(path_)) {
            return make_io_error("cannot create directory for " + path_);
        }

        json j;
        j["fragments"] = fragments_;
        j["text"] = current_text();
        j["timestamp_ms"] = std::chrono::duration_cast<Duration>(
            now_().time_since_epoch()).count();

        std::string tmp_path = path_ + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                return make_io_error("cannot open " + tmp_path);
            }
            out << j.dump();
            if (!out.good()) {
                return make_io_error("write failed for " + tmp_path);
            }
        }

        std::error_code ec;
        fs::rename(tmp_path, path_, ec);
        if (ec) {
            return make_io_error("rename to " + path_ + " failed: " + ec.message());
        }
        return Result<void>();
    }

    std::optional<std::string> restore() {
        if (path_.empty()) return std::nullopt;
        std::ifstream in(path_);
        if (!in.is_open()) return std::nullopt;

        json j;
        try {
            in >> j;
        } catch (const json::exception& e) {
            Logger::warn("[Draft] Ignoring unreadable checkpoint: " + std::string(e.what()));
            return std::nullopt;
        }
        if (!j.is_object() || !j.contains("timestamp_ms") || !j["timestamp_ms"].is_number()) {
            Logger::warn("[Draft] Ignoring checkpoint without timestamp");
            return std::nullopt;
        }

        WallClock::time_point saved_at{Duration(j["timestamp_ms"].get<int64_t>())};
        const auto now = now_();
        if (saved_at > now) {
            Logger::warn("[Draft] Ignoring checkpoint stamped in the future");
            return std::nullopt;
        }
        if (now - saved_at > max_age_) {
            LOG_DRAFT("Checkpoint is stale, not restoring");
            return std::nullopt;
        }

        std::vector<std::string> restored;
        if (j.contains("fragments") && j["fragments"].is_array()) {
            for (const auto& f : j["fragments"]) {
                if (f.is_string()) restored.push_back(f.get<std::string>());
            }
        } else if (j.contains("text") && j["text"].is_string()) {
            std::string text = j["text"].get<std::string>();
            if (!utils::is_empty_or_whitespace(text)) restored.push_back(utils::trim_copy(text));
        }
        if (restored.empty()) return std::nullopt;

        fragments_ = std::move(restored);
        epoch_++;
        return current_text();
    }

    std::vector<std::string> fragments_;
    uint64_t epoch_ = 0;
    std::string path_;
    std::chrono::hours max_age_;
    WallNowFn now_;
};

DraftAccumulator::DraftAccumulator(const std::string& checkpoint_path,
                                   std::chrono::hours max_age,
                                   WallNowFn now)
    : pimpl_(std::make_unique<Impl>(checkpoint_path, max_age, std::move(now))) {}

DraftAccumulator::DraftAccumulator(const DraftConfig& config, WallNowFn now)
    : DraftAccumulator(expand_path(config.checkpoint_path),
                       std::chrono::hours(config.max_age_hours), std::move(now)) {}

DraftAccumulator::~DraftAccumulator() = default;

void DraftAccumulator::append(const std::string& text) {
    pimpl_->append(text);
}

std::string DraftAccumulator::current_text() const {
    return pimpl_->current_text();
}

const std::vector<std::string>& DraftAccumulator::fragments() const {
    return pimpl_->fragments_;
}

size_t DraftAccumulator::fragment_count() const {
    return pimpl_->fragments_.size();
}

bool DraftAccumulator::empty() const {
    return pimpl_->fragments_.empty();
}

void DraftAccumulator::clear() {
    pimpl_->clear();
}

void DraftAccumulator::consume(size_t n) {
    pimpl_->consume(n);
}

Result<void> DraftAccumulator::checkpoint() const {
    return pimpl_->checkpoint();
}

std::optional<std::string> DraftAccumulator::restore() {
    return pimpl_->restore();
}

uint64_t DraftAccumulator::epoch() const {
    return pimpl_->epoch_;
}

const std::string& DraftAccumulator::checkpoint_path() const {
    return pimpl_->path_;
}

} // namespace job_diary
