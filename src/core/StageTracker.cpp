/**
 * @file StageTracker.cpp
 * @brief Implementation of per-scope stage tracking
 */

#include "StageTracker.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace popaccess {

const char* to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::LOAD:      return "Load";
        case PipelineStage::RASTERIZE: return "Rasterize";
        case PipelineStage::DISTANCE:  return "Distance";
        case PipelineStage::CLASSIFY:  return "Classify";
        case PipelineStage::AGGREGATE: return "Aggregate";
        case PipelineStage::EMIT:      return "Emit";
    }
    return "Unknown";
}

StageTracker::StageTracker(std::string scope_name)
    : scope_name_(std::move(scope_name)), logger_("StageTracker") {
}

void StageTracker::startStage(PipelineStage stage) {
    if (!stages_.empty()) {
        const StageRecord& last = stages_.back();
        if (!last.completed) {
            throw std::logic_error(scope_name_ + ": cannot start " + to_string(stage) +
                                   " while " + to_string(last.stage) + " is running");
        }
        if (static_cast<int>(stage) <= static_cast<int>(last.stage)) {
            throw std::logic_error(scope_name_ + ": stage " + to_string(stage) +
                                   " cannot follow " + to_string(last.stage));
        }
    }
    stages_.emplace_back(stage);
    logger_.scoped(LogLevel::DEBUG, scope_name_, std::string("Stage start: ") + to_string(stage));
}

void StageTracker::completeStage(PipelineStage stage, bool successful, const std::string& error) {
    if (stages_.empty() || stages_.back().stage != stage || stages_.back().completed) {
        throw std::logic_error(scope_name_ + ": stage " + to_string(stage) + " is not running");
    }
    StageRecord& record = stages_.back();
    record.complete(successful, error);

    std::string message = std::string("Stage complete: ") + to_string(stage) +
                          " (" + formatDuration(record.duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.scoped(LogLevel::DEBUG, scope_name_, message);
}

void StageTracker::failOpenStage(const std::string& error) {
    if (!stages_.empty() && !stages_.back().completed) {
        stages_.back().complete(false, error);
    }
}

void StageTracker::addStageData(PipelineStage stage, const std::string& key, const std::string& value) {
    StageRecord* record = findStage(stage);
    if (record) {
        record->stage_data[key] = value;
    }
}

void StageTracker::trackOutputFile(const std::string& filename, const std::string& format) {
    OutputFileInfo info;
    info.filename = filename;
    info.format = format;

    std::error_code ec;
    if (std::filesystem::exists(filename, ec)) {
        info.file_size_bytes = static_cast<size_t>(std::filesystem::file_size(filename, ec));
        info.written = !ec;
    }
    output_files_.push_back(info);
    logger_.scoped(LogLevel::DEBUG, scope_name_, "Wrote " + filename + " (" + format + ")");
}

size_t StageTracker::getCompletedStageCount() const {
    return static_cast<size_t>(std::count_if(stages_.begin(), stages_.end(),
        [](const StageRecord& record) { return record.completed; }));
}

std::chrono::milliseconds StageTracker::totalDuration() const {
    std::chrono::milliseconds total(0);
    for (const auto& record : stages_) {
        total += record.duration();
    }
    return total;
}

std::string StageTracker::getPipelineStatus() const {
    std::ostringstream oss;
    oss << "Pipeline: " << getCompletedStageCount() << "/" << stages_.size() << " stages completed";
    if (!stages_.empty() && !stages_.back().completed) {
        oss << " (current: " << to_string(stages_.back().stage) << ")";
    }
    return oss.str();
}

std::string StageTracker::getTimingReport() const {
    std::ostringstream oss;
    oss << "Total " << formatDuration(totalDuration());
    for (const auto& record : stages_) {
        oss << ", " << to_string(record.stage) << " " << formatDuration(record.duration());
        if (record.completed && !record.successful) {
            oss << " FAILED";
        }
    }
    return oss.str();
}

void StageTracker::logSummary() const {
    logger_.scoped(LogLevel::DETAILED, scope_name_, getTimingReport());
    for (const auto& record : stages_) {
        for (const auto& [key, value] : record.stage_data) {
            logger_.scoped(LogLevel::DEBUG, scope_name_,
                           std::string(to_string(record.stage)) + ": " + key + " = " + value);
        }
    }
}

StageRecord* StageTracker::findStage(PipelineStage stage) {
    for (auto& record : stages_) {
        if (record.stage == stage) return &record;
    }
    return nullptr;
}

std::string StageTracker::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (static_cast<double>(ms) / 1000.0) << "s";
    return oss.str();
}

} // namespace popaccess
